#ifndef FLOWTRACER_H
#define FLOWTRACER_H

#include <QString>

enum class FlowChannel
{
    Lifecycle,
    UI,
    Convert
};

class FlowTracer
{
  public:
    // Print a unified flow log line: "[flow][<channel>] message".
    static void log(FlowChannel channel, const QString &message);

    // Same as log() but routed through qWarning so failures stand out.
    static void warn(FlowChannel channel, const QString &message);
};

#endif // FLOWTRACER_H
