// pdfreader.h - Read the text of a PDF page by page (Poppler Qt5 binding)

#pragma once

#include <QString>
#include <QStringList>

#include "utils/pdf2doc_error.h"

struct PdfDocumentText
{
    QStringList pages; // one raw text fragment per page, in page order
    QString title;     // Title entry of the info dictionary; may be empty
};

namespace PdfReader
{
// Load the PDF and collect the text of every page.
// Returns false and fills errorMessage/errorCode when the file cannot be opened or is locked.
// A single unreadable page yields an empty fragment instead of failing the whole document.
bool readDocument(const QString &path, PdfDocumentText *out, QString *errorMessage = nullptr,
                  Pdf2DocErrorCode *errorCode = nullptr);

// Number of pages, or -1 when the document cannot be loaded.
int pageCount(const QString &path);
} // namespace PdfReader
