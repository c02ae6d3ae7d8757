#pragma once

#include <QRect>
#include <QString>

// 持久化配置（PDF2DOC_TEMP/pdf2doc_config.ini）。
// 缺失或非法的键回退到 xconfig.h 中的默认值。
struct AppSettings
{
    QRect windowGeometry; // 主窗口位置与大小
    QString lastDir;      // 上次选择 PDF 的目录

    static AppSettings defaults();
    static AppSettings load(const QString &iniPath);
    // 写入并同步；返回 false 表示 QSettings 报告了写入错误
    bool save(const QString &iniPath) const;
};
