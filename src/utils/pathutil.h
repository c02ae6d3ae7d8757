// pathutil.h - file path helpers for picking sources and naming outputs
#ifndef PDF2DOC_PATHUTIL_H
#define PDF2DOC_PATHUTIL_H

#include <QString>

// Destination for a converted file: the final extension of the file name is replaced by ".docx".
// - "/a/b/report.v2.pdf" -> "/a/b/report.v2.docx"
// - A file name without extension gets ".docx" appended.
// - Dots inside directory names are never touched.
// Empty input returns empty.
QString docxPathFor(const QString &pdfPath);

// True when the path names a PDF (suffix ".pdf", case-sensitive like the picker checks).
bool isPdfPath(const QString &path);

// Last '/'-separated segment; this is what the status label shows after a pick.
QString displayFileName(const QString &path);

#endif // PDF2DOC_PATHUTIL_H
