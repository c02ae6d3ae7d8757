#include "converter.h"

#include <QElapsedTimer>
#include <QFileInfo>

#include "utils/docxwriter.h"
#include "utils/flowtracer.h"
#include "utils/pathutil.h"
#include "utils/pdf2doc_error.h"
#include "utils/pdfreader.h"
#include "utils/textsanitize.h"
#include "xconfig.h"

Converter::Converter(const QString &path, QObject *parent)
    : QObject(parent), path_(path)
{
}

void Converter::run()
{
    QElapsedTimer timer;
    timer.start();
    FlowTracer::log(FlowChannel::Convert, QStringLiteral("start %1").arg(path_));

    QString error;
    if (!convert(path_, &error))
    {
        FlowTracer::warn(FlowChannel::Convert, QStringLiteral("failed: %1").arg(error));
        emit warning(error);
        return;
    }
    FlowTracer::log(FlowChannel::Convert, QStringLiteral("done %1 (%2 ms)").arg(docxPathFor(path_)).arg(timer.elapsed()));
    emit finished();
}

bool Converter::convert(const QString &pdfPath, QString *errorMessage)
{
    PdfDocumentText source;
    if (!PdfReader::readDocument(pdfPath, &source, errorMessage)) return false;

    DocxWriter writer;
    writer.setTitle(source.title.isEmpty() ? QFileInfo(pdfPath).completeBaseName() : source.title);
    writer.setCreator(QStringLiteral(PDF2DOC_APP_NAME));
    for (const QString &fragment : source.pages)
    {
        writer.addParagraph(TextSanitize::sanitizeFragment(fragment));
        writer.addPageBreak();
    }

    const QString target = docxPathFor(pdfPath);
    QString writeError;
    if (!writer.save(target, &writeError))
    {
        if (errorMessage) *errorMessage = formatPdf2DocError(Pdf2DocErrorCode::DocxWriteFailed, writeError);
        return false;
    }
    FlowTracer::log(FlowChannel::Convert,
                    QStringLiteral("%1 pages written to %2").arg(source.pages.size()).arg(target));
    return true;
}
