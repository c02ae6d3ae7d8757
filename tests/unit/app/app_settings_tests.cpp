#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <QSettings>
#include <QTemporaryDir>

#include "app/app_settings.h"
#include "xconfig.h"

TEST_CASE("missing config file yields defaults")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    const AppSettings s = AppSettings::load(dir.filePath(QStringLiteral("absent.ini")));
    CHECK(s.windowGeometry == QRect(DEFAULT_WINDOW_X, DEFAULT_WINDOW_Y, DEFAULT_WINDOW_WIDTH, DEFAULT_WINDOW_HEIGHT));
    CHECK(s.lastDir.isEmpty());
}

TEST_CASE("settings round-trip through the ini file")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString ini = dir.filePath(QStringLiteral("pdf2doc_config.ini"));

    AppSettings s = AppSettings::defaults();
    s.windowGeometry = QRect(40, 60, 640, 180);
    s.lastDir = QStringLiteral("/data/文档");
    REQUIRE(s.save(ini));

    const AppSettings loaded = AppSettings::load(ini);
    CHECK(loaded.windowGeometry == QRect(40, 60, 640, 180));
    CHECK(loaded.lastDir == QStringLiteral("/data/文档"));
}

TEST_CASE("non-positive window sizes fall back to defaults")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString ini = dir.filePath(QStringLiteral("broken.ini"));
    {
        QSettings raw(ini, QSettings::IniFormat);
        raw.setValue(SETTINGS_KEY_WINDOW_X, 15);
        raw.setValue(SETTINGS_KEY_WINDOW_WIDTH, 0);
        raw.setValue(SETTINGS_KEY_WINDOW_HEIGHT, QStringLiteral("tall"));
        raw.sync();
    }

    const AppSettings loaded = AppSettings::load(ini);
    CHECK(loaded.windowGeometry.x() == 15);
    CHECK(loaded.windowGeometry.width() == DEFAULT_WINDOW_WIDTH);
    CHECK(loaded.windowGeometry.height() == DEFAULT_WINDOW_HEIGHT);
}

TEST_CASE("saving without a path reports failure")
{
    CHECK_FALSE(AppSettings::defaults().save(QString()));
}
