/*
 * stylematch.h — Style table: element-kind key → partial style record
 *
 * Plain keys ("bold", "heading") name one kind or family. Composite keys
 * ("list-item.emphasis") join keys with '.'; the last segment names the
 * styled token, earlier segments name ancestors in order, not necessarily
 * adjacent.
 *
 * The table is filled once and only read while documents are converted,
 * so one instance may be shared between conversions.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARKPRINT_STYLEMATCH_H
#define MARKPRINT_STYLEMATCH_H

#include "elementstyle.h"
#include "stylekeys.h"

#include <QHash>
#include <QList>
#include <QString>
#include <QStringList>

class StyleMatch
{
public:
    StyleMatch() = default;

    void setStyle(const QString &key, const ElementStyle &style);
    const ElementStyle *style(const QString &key) const;
    bool contains(const QString &key) const { return m_styles.contains(key); }
    bool isEmpty() const { return m_styles.isEmpty(); }
    int count() const { return m_styles.size(); }

    QStringList compositeKeys() const;

    // The most specific composite entry matching `key` within `ancestry`
    // (root first). Returns nullptr when no composite entry matches.
    const ElementStyle *bestComposite(const StyleKey &key,
                                      const QList<StyleKey> &ancestry,
                                      QString *matchedKey = nullptr) const;

private:
    QHash<QString, ElementStyle> m_styles;
};

#endif // MARKPRINT_STYLEMATCH_H
