#include "textsanitize.h"

#include <QRegularExpression>

namespace
{
// a single QChar must be able to hold the resolved code point
constexpr qulonglong kCodePointLimit = 0x10000;

const QRegularExpression &decimalReferencePattern()
{
    static const QRegularExpression re(QStringLiteral("&#([0-9]+);?"));
    return re;
}

const QRegularExpression &hexReferencePattern()
{
    static const QRegularExpression re(QStringLiteral("&#[xX]([0-9a-fA-F]+);?"));
    return re;
}

bool isStrippedControl(ushort u)
{
    return u <= 0x08 || u == 0x0B || (u >= 0x0E && u <= 0x1F) || u == 0x7F;
}

// QRegularExpression refuses subjects that are not valid UTF-16 and then reports no match.
// Lone surrogates become U+FFFD here; the length is unchanged so offsets map back 1:1.
QString matchableCopy(const QString &text)
{
    QString copy = text;
    for (int i = 0; i < copy.size(); ++i)
    {
        const QChar c = copy.at(i);
        if (c.isHighSurrogate() && i + 1 < copy.size() && copy.at(i + 1).isLowSurrogate())
        {
            ++i;
            continue;
        }
        if (c.isSurrogate()) copy[i] = QChar(QChar::ReplacementCharacter);
    }
    return copy;
}

QString replaceReferences(const QString &text, const QRegularExpression &pattern, int base)
{
    if (text.isEmpty()) return text;

    QString out;
    out.reserve(text.size());
    int last = 0;
    // match on the copy, splice from the original text
    const QString subject = matchableCopy(text);
    QRegularExpressionMatchIterator it = pattern.globalMatch(subject);
    while (it.hasNext())
    {
        const QRegularExpressionMatch match = it.next();
        out += text.mid(last, match.capturedStart() - last);

        // toULongLong fails on overflow, which also means "too large"
        bool ok = false;
        const qulonglong value = match.captured(1).toULongLong(&ok, base);
        if (ok && value < kCodePointLimit)
            out += QChar(static_cast<ushort>(value));
        else
            out += match.captured(0);
        last = match.capturedEnd();
    }
    if (last == 0) return text;
    out += text.mid(last);
    return out;
}
} // namespace

namespace TextSanitize
{
QString resolveDecimalReferences(const QString &text)
{
    return replaceReferences(text, decimalReferencePattern(), 10);
}

QString resolveHexReferences(const QString &text)
{
    return replaceReferences(text, hexReferencePattern(), 16);
}

QString stripControlCharacters(const QString &text)
{
    QString out;
    out.reserve(text.size());
    for (const QChar c : text)
    {
        if (!isStrippedControl(c.unicode())) out += c;
    }
    return out;
}

QString sanitizeFragment(const QString &raw)
{
    QString text = resolveDecimalReferences(raw);
    text = resolveHexReferences(text);
    return stripControlCharacters(text);
}
} // namespace TextSanitize
