#include "cmakeconfig.h"

#include <QApplication>
#include <QCoreApplication>

#include "app/app_bootstrap.h"
#include "utils/flowtracer.h"
#include "widget/widget.h"
#include "xconfig.h"

int main(int argc, char *argv[])
{
    AppBootstrap::applyEarlyEnv(); // 必须在 QApplication 之前

    QApplication a(argc, argv); // 事件实例
    QCoreApplication::setApplicationName(QStringLiteral(PDF2DOC_APP_NAME));
    QCoreApplication::setApplicationVersion(QStringLiteral(PDF2DOC_VERSION));
    FlowTracer::log(FlowChannel::Lifecycle, QStringLiteral("pdf2doc %1 starting").arg(QStringLiteral(PDF2DOC_VERSION)));

    const AppContext ctx = AppBootstrap::buildContext();
    // 配置目录不可写时传空路径：窗口照常可用，只是不记住位置与上次目录
    const QString configPath = AppBootstrap::ensureTempDir(ctx) ? ctx.configPath : QString();

    //------------------实例化主要节点------------------
    Widget w(configPath); // 窗口实例
    w.show();
    FlowTracer::log(FlowChannel::Lifecycle, QStringLiteral("window shown, config at %1").arg(configPath));

    return a.exec();
}
