#ifndef WIDGET_H
#define WIDGET_H

#include <QMainWindow>
#include <QPointer>
#include <QString>

#include "app/app_settings.h"

class QCloseEvent;
class QLabel;
class QPushButton;
class QThread;

// 主窗口：选择 PDF、触发转换、展示状态。
// 转换在独立 QThread 中进行，期间锁定两个按钮，同一时刻最多一个转换在跑。
class Widget : public QMainWindow
{
    Q_OBJECT
public:
    explicit Widget(const QString &configPath, QWidget *parent = nullptr);
    ~Widget() override;

    // 文件对话框之后的处理逻辑：校验后缀、更新状态区与按钮
    void applySelection(const QString &path);

    const QString &selectedPath() const { return path_; }
    bool conversionRunning() const { return converting_; }
    QThread *workerThread() const { return thread_.data(); }

public slots:
    void select();  // 弹出文件选择框
    void convert(); // 在工作线程中转换当前选中的 PDF

signals:
    // 转换结束（成功或失败）后发出，界面已恢复可操作
    void conversionSettled(bool ok);

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void onConvertFinished();
    void onConvertWarning(const QString &message);

private:
    void addMenu();
    void addWidgets();
    void showWarning();
    void persistSettings();
    void waitForWorker();

    QString configPath_;
    AppSettings settings_;
    QString path_; // 当前待转换的 PDF

    QLabel *statusLabel_ = nullptr;
    QPushButton *chooseButton_ = nullptr;
    QPushButton *convertButton_ = nullptr;

    QPointer<QThread> thread_; // 正常结束时 deleteLater，窗口关闭时由 waitForWorker 回收
    bool converting_ = false;
};

#endif // WIDGET_H
