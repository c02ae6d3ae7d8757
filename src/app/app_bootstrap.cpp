#include "app_bootstrap.h"

#include <QByteArray>
#include <QCoreApplication>
#include <QDir>
#include <QtGlobal>

#include "utils/flowtracer.h"
#include "xconfig.h"

void AppBootstrap::applyEarlyEnv()
{
    // 兼容老旧 CPU：禁用 Qt PCRE2 JIT，避免 SIGILL（文本清洗依赖 QRegularExpression）。
    qputenv("QT_DISABLE_REGEXP_JIT", QByteArray("1"));
}

AppContext AppBootstrap::buildContext()
{
    AppContext ctx;
    ctx.appDir = QCoreApplication::applicationDirPath(); // 就在当前目录创建 PDF2DOC_TEMP 文件夹
    ctx.appPath = QCoreApplication::applicationFilePath();
    ctx.tempDir = QDir(ctx.appDir).filePath(QStringLiteral(PDF2DOC_TEMP_DIR_RELATIVE));
    ctx.configPath = QDir(ctx.tempDir).filePath(QStringLiteral(PDF2DOC_CONFIG_FILE_NAME));
    return ctx;
}

bool AppBootstrap::ensureTempDir(const AppContext &ctx)
{
    if (QDir().mkpath(ctx.tempDir)) return true;
    FlowTracer::warn(FlowChannel::Lifecycle, QStringLiteral("cannot create config dir %1").arg(ctx.tempDir));
    return false;
}
