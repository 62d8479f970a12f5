/*
 * stylekeys.h — Element-kind identifiers used for style lookup
 *
 * Each token kind maps to a specific key ("heading-2", "bold") and, for
 * kinds that come in variants, a family key ("heading", "emphasis") that
 * a style table may use to cover all variants at once.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARKPRINT_STYLEKEYS_H
#define MARKPRINT_STYLEKEYS_H

#include <QList>
#include <QString>
#include <QStringList>

struct StyleKey {
    QString specific;
    QString family;     // empty when the kind has no variants

    bool matches(const QString &segment) const
    {
        return segment == specific || (!family.isEmpty() && segment == family);
    }

    bool operator==(const StyleKey &other) const
    {
        return specific == other.specific && family == other.family;
    }
};

namespace StyleKeys {

StyleKey document();
StyleKey paragraph();
StyleKey heading(int level);
StyleKey emphasis(int level);
StyleKey codeBlock();
StyleKey codeSpan();
StyleKey link();
StyleKey image();
StyleKey list(bool ordered);
StyleKey listItem();
StyleKey listMarker();
StyleKey blockQuote();
StyleKey rule();
StyleKey text();

// Every key a style table may name, specific and family
const QStringList &knownKeys();

// True when each '.'-separated segment is a known key
bool isValidKey(const QString &key);

} // namespace StyleKeys

#endif // MARKPRINT_STYLEKEYS_H
