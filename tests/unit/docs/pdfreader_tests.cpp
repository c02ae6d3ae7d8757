#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <QTemporaryDir>

#include "common/TestUtils.h"
#include "utils/pdfreader.h"

using pdf2doc::test::buildPdf;
using pdf2doc::test::writeFile;

TEST_CASE("readDocument returns one fragment per page in order")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("three.pdf"));
    REQUIRE(writeFile(path, buildPdf({QStringLiteral("Alpha page"), QStringLiteral("Beta page"),
                                      QStringLiteral("Gamma page")},
                                     QStringLiteral("Fixture Title"))));

    PdfDocumentText text;
    QString error;
    Pdf2DocErrorCode code = Pdf2DocErrorCode::UiInvalidState;
    REQUIRE(PdfReader::readDocument(path, &text, &error, &code));
    CHECK(error.isEmpty());
    CHECK(code == Pdf2DocErrorCode::None);
    REQUIRE(text.pages.size() == 3);
    CHECK(text.pages.at(0).contains(QStringLiteral("Alpha")));
    CHECK(text.pages.at(1).contains(QStringLiteral("Beta")));
    CHECK(text.pages.at(2).contains(QStringLiteral("Gamma")));
    CHECK(text.title == QStringLiteral("Fixture Title"));
    CHECK(PdfReader::pageCount(path) == 3);
}

TEST_CASE("readDocument keeps numeric references as raw text")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("refs.pdf"));
    REQUIRE(writeFile(path, buildPdf({QStringLiteral("Caf&#233;")})));

    PdfDocumentText text;
    REQUIRE(PdfReader::readDocument(path, &text));
    REQUIRE(text.pages.size() == 1);
    CHECK(text.pages.first().contains(QStringLiteral("&#233;")));
    CHECK(text.title.isEmpty());
}

TEST_CASE("readDocument reports missing files")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    PdfDocumentText text;
    QString error;
    Pdf2DocErrorCode code = Pdf2DocErrorCode::None;
    CHECK_FALSE(PdfReader::readDocument(dir.filePath(QStringLiteral("ghost.pdf")), &text, &error, &code));
    CHECK(code == Pdf2DocErrorCode::PdfLoadFailed);
    CHECK(error.startsWith(QStringLiteral("[P2D-PDF-001]")));
    CHECK(text.pages.isEmpty());
    CHECK(PdfReader::pageCount(dir.filePath(QStringLiteral("ghost.pdf"))) == -1);
}

TEST_CASE("readDocument rejects files that are not PDFs")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("fake.pdf"));
    REQUIRE(writeFile(path, QByteArrayLiteral("this is plain text, not a pdf")));

    QString error;
    Pdf2DocErrorCode code = Pdf2DocErrorCode::None;
    CHECK_FALSE(PdfReader::readDocument(path, nullptr, &error, &code));
    CHECK(code == Pdf2DocErrorCode::PdfLoadFailed);
    CHECK(error.contains(QStringLiteral("fake.pdf")));
}
