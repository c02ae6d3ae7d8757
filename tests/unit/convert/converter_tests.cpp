#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "common/TestUtils.h"
#include "core/convert/converter.h"
#include "utils/pathutil.h"

using pdf2doc::test::buildPdf;
using pdf2doc::test::readZipEntry;
using pdf2doc::test::writeFile;

namespace
{
struct SignalCounts
{
    int finished = 0;
    int warning = 0;
    QString lastWarning;
};

void watch(Converter &converter, SignalCounts &counts)
{
    QObject::connect(&converter, &Converter::finished, [&counts]() { ++counts.finished; });
    QObject::connect(&converter, &Converter::warning, [&counts](const QString &message) {
        ++counts.warning;
        counts.lastWarning = message;
    });
}
} // namespace

TEST_CASE("convert writes sanitized pages with page breaks next to the source")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString pdf = dir.filePath(QStringLiteral("report.pdf"));
    REQUIRE(writeFile(pdf, buildPdf({QStringLiteral("Caf&#233; menu"), QStringLiteral("Second &#x41;page")})));

    QString error;
    REQUIRE(Converter::convert(pdf, &error));
    CHECK(error.isEmpty());

    const QString docx = dir.filePath(QStringLiteral("report.docx"));
    REQUIRE(QFile::exists(docx));
    CHECK(docxPathFor(pdf) == docx);

    const QByteArray xml = readZipEntry(docx, "word/document.xml");
    const int first = xml.indexOf(QString::fromUtf8("Café").toUtf8());
    const int second = xml.indexOf("Second");
    REQUIRE(first >= 0);
    REQUIRE(second >= 0);
    CHECK(first < second);
    CHECK(xml.contains("Apage"));
    CHECK_FALSE(xml.contains("&amp;#"));
    CHECK(xml.count("<w:br w:type=\"page\"/>") == 2);
}

TEST_CASE("convert titles the document after the pdf when it has no title")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString untitled = dir.filePath(QStringLiteral("minutes.2024.pdf"));
    REQUIRE(writeFile(untitled, buildPdf({QStringLiteral("body")})));
    REQUIRE(Converter::convert(untitled));
    CHECK(readZipEntry(dir.filePath(QStringLiteral("minutes.2024.docx")), "docProps/core.xml")
              .contains("<dc:title>minutes.2024</dc:title>"));

    const QString titled = dir.filePath(QStringLiteral("titled.pdf"));
    REQUIRE(writeFile(titled, buildPdf({QStringLiteral("body")}, QStringLiteral("Board Minutes"))));
    REQUIRE(Converter::convert(titled));
    CHECK(readZipEntry(dir.filePath(QStringLiteral("titled.docx")), "docProps/core.xml")
              .contains("<dc:title>Board Minutes</dc:title>"));
}

TEST_CASE("convert fails for missing pdf without creating output")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString pdf = dir.filePath(QStringLiteral("ghost.pdf"));

    QString error;
    CHECK_FALSE(Converter::convert(pdf, &error));
    CHECK(error.contains(QStringLiteral("P2D-PDF-001")));
    CHECK_FALSE(QFile::exists(dir.filePath(QStringLiteral("ghost.docx"))));
}

TEST_CASE("convert reports write failures with the docx error tag")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString pdf = dir.filePath(QStringLiteral("blocked.pdf"));
    REQUIRE(writeFile(pdf, buildPdf({QStringLiteral("text")})));
    // a directory squatting on the output name cannot be replaced by a file
    REQUIRE(QDir(dir.path()).mkdir(QStringLiteral("blocked.docx")));

    QString error;
    CHECK_FALSE(Converter::convert(pdf, &error));
    CHECK(error.contains(QStringLiteral("P2D-DOC-001")));
}

TEST_CASE("run emits finished exactly once on success")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString pdf = dir.filePath(QStringLiteral("ok.pdf"));
    REQUIRE(writeFile(pdf, buildPdf({QStringLiteral("fine")})));

    Converter converter(pdf);
    CHECK(converter.path() == pdf);
    SignalCounts counts;
    watch(converter, counts);
    converter.run();
    CHECK(counts.finished == 1);
    CHECK(counts.warning == 0);
}

TEST_CASE("run emits warning exactly once on failure")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    Converter converter(dir.filePath(QStringLiteral("missing.pdf")));
    SignalCounts counts;
    watch(converter, counts);
    converter.run();
    CHECK(counts.finished == 0);
    CHECK(counts.warning == 1);
    CHECK(counts.lastWarning.contains(QStringLiteral("missing.pdf")));
}
