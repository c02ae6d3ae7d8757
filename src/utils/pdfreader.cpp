// pdfreader.cpp - implementation

#include "pdfreader.h"

#include "utils/flowtracer.h"

#include <QFileInfo>
#include <QObject>
#include <QRectF>

#include <poppler-qt5.h>

#include <memory>

namespace
{
std::unique_ptr<Poppler::Document> loadDocument(const QString &path)
{
    return std::unique_ptr<Poppler::Document>(Poppler::Document::load(path));
}

void setError(QString *errorMessage, Pdf2DocErrorCode *errorCode, Pdf2DocErrorCode code, const QString &message)
{
    if (errorMessage) *errorMessage = formatPdf2DocError(code, message);
    if (errorCode) *errorCode = code;
}
} // namespace

namespace PdfReader
{
bool readDocument(const QString &path, PdfDocumentText *out, QString *errorMessage, Pdf2DocErrorCode *errorCode)
{
    const QFileInfo info(path);
    if (!info.exists() || !info.isFile())
    {
        setError(errorMessage, errorCode, Pdf2DocErrorCode::PdfLoadFailed, QObject::tr("PDF not found: %1").arg(path));
        return false;
    }

    std::unique_ptr<Poppler::Document> document = loadDocument(path);
    if (!document)
    {
        setError(errorMessage, errorCode, Pdf2DocErrorCode::PdfLoadFailed,
                 QObject::tr("Failed to parse PDF: %1").arg(path));
        return false;
    }
    if (document->isLocked())
    {
        setError(errorMessage, errorCode, Pdf2DocErrorCode::PdfLocked,
                 QObject::tr("PDF is encrypted: %1").arg(path));
        return false;
    }

    PdfDocumentText result;
    result.title = document->info(QStringLiteral("Title"));
    const int count = document->numPages();
    result.pages.reserve(count);
    for (int i = 0; i < count; ++i)
    {
        std::unique_ptr<Poppler::Page> page(document->page(i));
        if (!page)
        {
            FlowTracer::warn(FlowChannel::Convert, QStringLiteral("page %1 of %2 could not be opened").arg(i + 1).arg(path));
            result.pages << QString();
            continue;
        }
        // a null rect asks poppler for the whole page
        result.pages << page->text(QRectF());
    }

    if (out) *out = result;
    if (errorCode) *errorCode = Pdf2DocErrorCode::None;
    return true;
}

int pageCount(const QString &path)
{
    std::unique_ptr<Poppler::Document> document = loadDocument(path);
    if (!document || document->isLocked()) return -1;
    return document->numPages();
}
} // namespace PdfReader
