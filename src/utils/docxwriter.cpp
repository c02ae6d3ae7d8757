// docxwriter.cpp - implementation

#include "docxwriter.h"

#include <QDateTime>
#include <QObject>
#include <QSaveFile>
#include <QXmlStreamWriter>
#include <cstring>

#include <miniz.h>

namespace
{
const QString kWordNs = QStringLiteral("http://schemas.openxmlformats.org/wordprocessingml/2006/main");
const QString kCorePropsNs = QStringLiteral("http://schemas.openxmlformats.org/package/2006/metadata/core-properties");
const QString kDcNs = QStringLiteral("http://purl.org/dc/elements/1.1/");
const QString kDcTermsNs = QStringLiteral("http://purl.org/dc/terms/");
const QString kXsiNs = QStringLiteral("http://www.w3.org/2001/XMLSchema-instance");

const QByteArray kContentTypesXml = QByteArrayLiteral(
    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
    "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
    "<Default Extension=\"rels\" ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>"
    "<Default Extension=\"xml\" ContentType=\"application/xml\"/>"
    "<Override PartName=\"/word/document.xml\" "
    "ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml\"/>"
    "<Override PartName=\"/docProps/core.xml\" "
    "ContentType=\"application/vnd.openxmlformats-package.core-properties+xml\"/>"
    "</Types>");

const QByteArray kPackageRelsXml = QByteArrayLiteral(
    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
    "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
    "<Relationship Id=\"rId1\" "
    "Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument\" "
    "Target=\"word/document.xml\"/>"
    "<Relationship Id=\"rId2\" "
    "Type=\"http://schemas.openxmlformats.org/package/2006/relationships/metadata/core-properties\" "
    "Target=\"docProps/core.xml\"/>"
    "</Relationships>");

// Drop what XML 1.0 cannot carry: C0 controls other than tab/LF/CR, lone surrogates, U+FFFE/U+FFFF.
QString xmlSafe(const QString &text)
{
    QString out;
    out.reserve(text.size());
    for (int i = 0; i < text.size(); ++i)
    {
        const QChar c = text.at(i);
        if (c.isHighSurrogate())
        {
            if (i + 1 < text.size() && text.at(i + 1).isLowSurrogate())
            {
                out += c;
                out += text.at(++i);
            }
            continue;
        }
        if (c.isLowSurrogate()) continue;
        const ushort u = c.unicode();
        if (u < 0x20 && u != '\t' && u != '\n' && u != '\r') continue;
        if (u == 0xFFFE || u == 0xFFFF) continue;
        out += c;
    }
    return out;
}

void writeRunContent(QXmlStreamWriter &xml, const QString &text)
{
    QString pending;
    auto flushText = [&]() {
        if (pending.isEmpty()) return;
        xml.writeStartElement(kWordNs, QStringLiteral("t"));
        xml.writeAttribute(QStringLiteral("xml:space"), QStringLiteral("preserve"));
        xml.writeCharacters(pending);
        xml.writeEndElement();
        pending.clear();
    };

    for (int i = 0; i < text.size(); ++i)
    {
        const QChar c = text.at(i);
        if (c == QChar('\t'))
        {
            flushText();
            xml.writeEmptyElement(kWordNs, QStringLiteral("tab"));
        }
        else if (c == QChar('\n') || c == QChar('\r'))
        {
            if (c == QChar('\r') && i + 1 < text.size() && text.at(i + 1) == QChar('\n')) ++i;
            flushText();
            xml.writeEmptyElement(kWordNs, QStringLiteral("br"));
        }
        else
        {
            pending += c;
        }
    }
    flushText();
}

void writeSectionProperties(QXmlStreamWriter &xml)
{
    // US Letter, one inch margins (twentieths of a point)
    xml.writeStartElement(kWordNs, QStringLiteral("sectPr"));
    xml.writeEmptyElement(kWordNs, QStringLiteral("pgSz"));
    xml.writeAttribute(kWordNs, QStringLiteral("w"), QStringLiteral("12240"));
    xml.writeAttribute(kWordNs, QStringLiteral("h"), QStringLiteral("15840"));
    xml.writeEmptyElement(kWordNs, QStringLiteral("pgMar"));
    xml.writeAttribute(kWordNs, QStringLiteral("top"), QStringLiteral("1440"));
    xml.writeAttribute(kWordNs, QStringLiteral("right"), QStringLiteral("1440"));
    xml.writeAttribute(kWordNs, QStringLiteral("bottom"), QStringLiteral("1440"));
    xml.writeAttribute(kWordNs, QStringLiteral("left"), QStringLiteral("1440"));
    xml.writeAttribute(kWordNs, QStringLiteral("header"), QStringLiteral("720"));
    xml.writeAttribute(kWordNs, QStringLiteral("footer"), QStringLiteral("720"));
    xml.writeAttribute(kWordNs, QStringLiteral("gutter"), QStringLiteral("0"));
    xml.writeEndElement();
}

class ZipWriterGuard
{
  public:
    explicit ZipWriterGuard(mz_zip_archive &archive)
        : archive_(archive)
    {
    }
    ZipWriterGuard(const ZipWriterGuard &) = delete;
    ZipWriterGuard &operator=(const ZipWriterGuard &) = delete;
    ~ZipWriterGuard() { mz_zip_writer_end(&archive_); }

  private:
    mz_zip_archive &archive_;
};

bool addPart(mz_zip_archive &archive, const char *name, const QByteArray &data, QString *errorMessage)
{
    if (mz_zip_writer_add_mem(&archive, name, data.constData(), static_cast<size_t>(data.size()),
                              MZ_DEFAULT_COMPRESSION))
        return true;
    if (errorMessage)
    {
        *errorMessage = QObject::tr("Failed to add %1 to archive: %2")
                            .arg(QString::fromLatin1(name),
                                 QString::fromLatin1(mz_zip_get_error_string(mz_zip_get_last_error(&archive))));
    }
    return false;
}
} // namespace

void DocxWriter::addParagraph(const QString &text)
{
    Block block;
    block.text = text;
    blocks_.append(block);
}

void DocxWriter::addPageBreak()
{
    Block block;
    block.pageBreak = true;
    blocks_.append(block);
}

QByteArray DocxWriter::documentXml() const
{
    QByteArray bytes;
    QXmlStreamWriter xml(&bytes);
    xml.writeStartDocument(QStringLiteral("1.0"), true);
    xml.writeNamespace(kWordNs, QStringLiteral("w"));
    xml.writeStartElement(kWordNs, QStringLiteral("document"));
    xml.writeStartElement(kWordNs, QStringLiteral("body"));

    for (const Block &block : blocks_)
    {
        if (block.pageBreak)
        {
            xml.writeStartElement(kWordNs, QStringLiteral("p"));
            xml.writeStartElement(kWordNs, QStringLiteral("r"));
            xml.writeEmptyElement(kWordNs, QStringLiteral("br"));
            xml.writeAttribute(kWordNs, QStringLiteral("type"), QStringLiteral("page"));
            xml.writeEndElement(); // r
            xml.writeEndElement(); // p
            continue;
        }

        const QString text = xmlSafe(block.text);
        if (text.isEmpty())
        {
            xml.writeEmptyElement(kWordNs, QStringLiteral("p"));
            continue;
        }
        xml.writeStartElement(kWordNs, QStringLiteral("p"));
        xml.writeStartElement(kWordNs, QStringLiteral("r"));
        writeRunContent(xml, text);
        xml.writeEndElement(); // r
        xml.writeEndElement(); // p
    }

    writeSectionProperties(xml);
    xml.writeEndElement(); // body
    xml.writeEndElement(); // document
    xml.writeEndDocument();
    return bytes;
}

QByteArray DocxWriter::corePropertiesXml() const
{
    QByteArray bytes;
    QXmlStreamWriter xml(&bytes);
    xml.writeStartDocument(QStringLiteral("1.0"), true);
    xml.writeNamespace(kCorePropsNs, QStringLiteral("cp"));
    xml.writeNamespace(kDcNs, QStringLiteral("dc"));
    xml.writeNamespace(kDcTermsNs, QStringLiteral("dcterms"));
    xml.writeNamespace(kXsiNs, QStringLiteral("xsi"));
    xml.writeStartElement(kCorePropsNs, QStringLiteral("coreProperties"));
    if (!title_.isEmpty()) xml.writeTextElement(kDcNs, QStringLiteral("title"), xmlSafe(title_));
    if (!creator_.isEmpty()) xml.writeTextElement(kDcNs, QStringLiteral("creator"), xmlSafe(creator_));
    xml.writeStartElement(kDcTermsNs, QStringLiteral("created"));
    xml.writeAttribute(kXsiNs, QStringLiteral("type"), QStringLiteral("dcterms:W3CDTF"));
    xml.writeCharacters(QDateTime::currentDateTimeUtc().toString(Qt::ISODate));
    xml.writeEndElement();
    xml.writeEndElement();
    xml.writeEndDocument();
    return bytes;
}

bool DocxWriter::save(const QString &path, QString *errorMessage) const
{
    mz_zip_archive archive;
    memset(&archive, 0, sizeof(archive));
    if (!mz_zip_writer_init_heap(&archive, 0, 0))
    {
        if (errorMessage) *errorMessage = QObject::tr("Failed to initialise zip writer");
        return false;
    }
    ZipWriterGuard guard(archive);

    if (!addPart(archive, "[Content_Types].xml", kContentTypesXml, errorMessage)) return false;
    if (!addPart(archive, "_rels/.rels", kPackageRelsXml, errorMessage)) return false;
    if (!addPart(archive, "word/document.xml", documentXml(), errorMessage)) return false;
    if (!addPart(archive, "docProps/core.xml", corePropertiesXml(), errorMessage)) return false;

    void *buffer = nullptr;
    size_t size = 0;
    if (!mz_zip_writer_finalize_heap_archive(&archive, &buffer, &size))
    {
        if (errorMessage) *errorMessage = QObject::tr("Failed to finalize archive for %1").arg(path);
        return false;
    }
    const QByteArray payload(static_cast<const char *>(buffer), static_cast<int>(size));
    mz_free(buffer);

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly))
    {
        if (errorMessage) *errorMessage = QObject::tr("Cannot open %1 for writing: %2").arg(path, file.errorString());
        return false;
    }
    if (file.write(payload) != payload.size())
    {
        if (errorMessage) *errorMessage = QObject::tr("Failed to write %1: %2").arg(path, file.errorString());
        file.cancelWriting();
        return false;
    }
    if (!file.commit())
    {
        if (errorMessage) *errorMessage = QObject::tr("Failed to commit %1: %2").arg(path, file.errorString());
        return false;
    }
    return true;
}
