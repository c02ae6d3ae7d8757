#include "app_settings.h"

#include <QSettings>

#include "utils/flowtracer.h"
#include "xconfig.h"

AppSettings AppSettings::defaults()
{
    AppSettings s;
    s.windowGeometry = QRect(DEFAULT_WINDOW_X, DEFAULT_WINDOW_Y, DEFAULT_WINDOW_WIDTH, DEFAULT_WINDOW_HEIGHT);
    return s;
}

AppSettings AppSettings::load(const QString &iniPath)
{
    AppSettings s = defaults();
    if (iniPath.isEmpty()) return s;

    QSettings settings(iniPath, QSettings::IniFormat);
    settings.setIniCodec("utf-8");
    const int x = settings.value(SETTINGS_KEY_WINDOW_X, DEFAULT_WINDOW_X).toInt();
    const int y = settings.value(SETTINGS_KEY_WINDOW_Y, DEFAULT_WINDOW_Y).toInt();
    int width = settings.value(SETTINGS_KEY_WINDOW_WIDTH, DEFAULT_WINDOW_WIDTH).toInt();
    int height = settings.value(SETTINGS_KEY_WINDOW_HEIGHT, DEFAULT_WINDOW_HEIGHT).toInt();
    if (width <= 0) width = DEFAULT_WINDOW_WIDTH;
    if (height <= 0) height = DEFAULT_WINDOW_HEIGHT;
    s.windowGeometry = QRect(x, y, width, height);
    s.lastDir = settings.value(SETTINGS_KEY_LAST_DIR, QString()).toString();
    return s;
}

bool AppSettings::save(const QString &iniPath) const
{
    if (iniPath.isEmpty()) return false;

    QSettings settings(iniPath, QSettings::IniFormat);
    settings.setIniCodec("utf-8");
    settings.setValue(SETTINGS_KEY_WINDOW_X, windowGeometry.x());
    settings.setValue(SETTINGS_KEY_WINDOW_Y, windowGeometry.y());
    settings.setValue(SETTINGS_KEY_WINDOW_WIDTH, windowGeometry.width());
    settings.setValue(SETTINGS_KEY_WINDOW_HEIGHT, windowGeometry.height());
    settings.setValue(SETTINGS_KEY_LAST_DIR, lastDir);
    settings.sync();
    if (settings.status() != QSettings::NoError)
    {
        FlowTracer::warn(FlowChannel::Lifecycle, QStringLiteral("failed to write settings to %1").arg(iniPath));
        return false;
    }
    return true;
}
