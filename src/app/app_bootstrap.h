#pragma once

#include <QString>

#include "app_context.h"

// 应用启动装配器：集中处理环境变量与配置目录准备。
class AppBootstrap
{
public:
    // 早期环境变量设置（必须在 QApplication 创建前执行）。
    static void applyEarlyEnv();

    // 构建 AppContext（程序路径与配置目录）。
    static AppContext buildContext();

    // 确保 PDF2DOC_TEMP 目录存在，失败时返回 false。
    static bool ensureTempDir(const AppContext &ctx);
};
