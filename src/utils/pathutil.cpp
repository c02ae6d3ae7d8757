// pathutil.cpp - see header
#include "pathutil.h"

#include "xconfig.h"

#include <QChar>

namespace
{
int lastSeparator(const QString &path)
{
    return qMax(path.lastIndexOf(QChar('/')), path.lastIndexOf(QChar('\\')));
}
} // namespace

QString docxPathFor(const QString &pdfPath)
{
    if (pdfPath.isEmpty()) return pdfPath;

    const int sep = lastSeparator(pdfPath);
    const int dot = pdfPath.lastIndexOf(QChar('.'));
    // a dot at the start of the file name (".pdf") is a hidden file, not an extension
    if (dot > sep + 1) return pdfPath.left(dot) + QStringLiteral(DOCX_SUFFIX);
    return pdfPath + QStringLiteral(DOCX_SUFFIX);
}

bool isPdfPath(const QString &path)
{
    return path.endsWith(QStringLiteral(PDF_SUFFIX));
}

QString displayFileName(const QString &path)
{
    return path.mid(path.lastIndexOf(QChar('/')) + 1);
}
