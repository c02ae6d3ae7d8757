// docxwriter.h - Assemble a minimal WordprocessingML (.docx) package
// Parts written: [Content_Types].xml, _rels/.rels, word/document.xml, docProps/core.xml

#pragma once

#include <QByteArray>
#include <QString>
#include <QVector>

class DocxWriter
{
  public:
    DocxWriter() = default;

    // Append one paragraph. Tab becomes <w:tab/>, LF / CR / CRLF become <w:br/>.
    void addParagraph(const QString &text);

    // Append a paragraph holding a single page break.
    void addPageBreak();

    void setTitle(const QString &title) { title_ = title; }
    void setCreator(const QString &creator) { creator_ = creator; }

    int paragraphCount() const { return blocks_.size(); }
    bool isEmpty() const { return blocks_.isEmpty(); }

    // Serialized parts, exposed so the package layout can be checked without unzipping.
    QByteArray documentXml() const;
    QByteArray corePropertiesXml() const;

    // Zip all parts and write them to path. The destination is replaced only after
    // the archive was fully built; on failure it is left untouched.
    bool save(const QString &path, QString *errorMessage = nullptr) const;

  private:
    struct Block
    {
        bool pageBreak = false;
        QString text;
    };

    QVector<Block> blocks_;
    QString title_;
    QString creator_;
};
