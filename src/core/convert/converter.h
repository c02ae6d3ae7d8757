#pragma once

#include <QObject>
#include <QString>

// 转换工作者：在工作线程中完成 PDF -> docx 的整个流程，避免阻塞界面。
// 线程由界面负责创建与回收；本对象 moveToThread 后由 QThread::started 触发 run()。
// 每次 run() 恰好发出 finished 或 warning 之一。
class Converter : public QObject
{
    Q_OBJECT
public:
    explicit Converter(const QString &path, QObject *parent = nullptr);

    const QString &path() const { return path_; }

    // 同步执行一次转换：逐页抽取文本 -> 清洗 -> 段落 + 分页符 -> 写入 docxPathFor(pdfPath)。
    static bool convert(const QString &pdfPath, QString *errorMessage = nullptr);

public slots:
    void run();

signals:
    void finished();
    void warning(const QString &message);

private:
    QString path_;
};
