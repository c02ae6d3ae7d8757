// textsanitize.h - Clean extracted PDF text before it becomes document text
#ifndef TEXTSANITIZE_H
#define TEXTSANITIZE_H

#include <QString>

namespace TextSanitize
{
// Replace "&#<digits>;" (semicolon optional) with the character it names.
// References at or above U+10000 are kept as literal text.
QString resolveDecimalReferences(const QString &text);

// Same as above for "&#x<hex>;" / "&#X<hex>;".
QString resolveHexReferences(const QString &text);

// Delete U+0000-U+0008, U+000B, U+000E-U+001F and U+007F. Tab, LF, FF and CR stay.
QString stripControlCharacters(const QString &text);

// Full pipeline: decimal references, then hex references, then control stripping.
// Stateless; safe to call from any thread.
QString sanitizeFragment(const QString &raw);
} // namespace TextSanitize

#endif // TEXTSANITIZE_H
