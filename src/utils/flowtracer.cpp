#include "flowtracer.h"

#include <QDebug>

namespace
{
QString channelLabel(FlowChannel channel)
{
    switch (channel)
    {
    case FlowChannel::Lifecycle: return QStringLiteral("lifecycle");
    case FlowChannel::UI: return QStringLiteral("ui");
    case FlowChannel::Convert: return QStringLiteral("convert");
    }
    return QStringLiteral("unknown");
}

QString formatLine(FlowChannel channel, const QString &message)
{
    return QStringLiteral("[flow][%1] %2").arg(channelLabel(channel), message);
}
} // namespace

void FlowTracer::log(FlowChannel channel, const QString &message)
{
    qInfo().noquote() << formatLine(channel, message);
}

void FlowTracer::warn(FlowChannel channel, const QString &message)
{
    qWarning().noquote() << formatLine(channel, message);
}
