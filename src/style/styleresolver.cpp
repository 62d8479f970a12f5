/*
 * styleresolver.cpp — Layered style resolution
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "styleresolver.h"
#include "stylematch.h"

namespace {

const QString kMonoFamily = QStringLiteral("JetBrains Mono");

} // anonymous namespace

StyleResolver::StyleResolver(const StyleMatch &table)
    : m_table(table)
{
}

ResolvedStyle StyleResolver::resolve(const StyleKey &key, const QList<StyleKey> &ancestry,
                                     const ElementStyle &overrides) const
{
    ResolvedStyle current;
    const ResolvedStyle *parent = nullptr;
    QList<StyleKey> chain;

    for (const StyleKey &ancestor : ancestry) {
        current = resolveChild(parent, ancestor, chain);
        parent = &current;
        chain.append(ancestor);
    }
    return resolveChild(parent, key, chain, overrides);
}

ResolvedStyle StyleResolver::resolveChild(const ResolvedStyle *parent, const StyleKey &key,
                                          const QList<StyleKey> &ancestry,
                                          const ElementStyle &overrides) const
{
    ResolvedStyle style;
    if (parent)
        style.inheritCharacterFrom(*parent);

    ElementStyle merged = builtinStyle(key);
    if (!key.family.isEmpty()) {
        if (const ElementStyle *entry = m_table.style(key.family))
            merged.overlay(*entry);
    }
    if (const ElementStyle *entry = m_table.style(key.specific))
        merged.overlay(*entry);
    if (const ElementStyle *entry = m_table.bestComposite(key, ancestry))
        merged.overlay(*entry);
    merged.overlay(overrides);

    merged.applyTo(style);
    return style;
}

ElementStyle StyleResolver::builtinStyle(const StyleKey &key)
{
    ElementStyle s;
    const QString &k = key.specific;

    if (k == QLatin1String("document")) {
        s.setFontFamily(QStringLiteral("Noto Serif"));
        s.setFontSize(11.0);
        s.setFontWeight(QFont::Normal);
        s.setForeground(QColor(0x1a, 0x1a, 0x1a));
    } else if (k == QLatin1String("paragraph")) {
        s.setSpaceAfter(6);
    } else if (key.family == QLatin1String("heading")) {
        static const qreal sizes[] = {24, 20, 16, 14, 12, 11};
        const int level = k.mid(k.lastIndexOf(QLatin1Char('-')) + 1).toInt();
        const int idx = qBound(1, level, 6) - 1;
        s.setFontSize(sizes[idx]);
        s.setFontWeight(QFont::Bold);
        s.setSpaceBefore(idx < 2 ? 18 : 12);
        s.setSpaceAfter(8);
    } else if (k == QLatin1String("italic")) {
        s.setFontItalic(true);
    } else if (k == QLatin1String("bold")) {
        s.setFontWeight(QFont::Bold);
    } else if (k == QLatin1String("bold-italic")) {
        s.setFontWeight(QFont::Bold);
        s.setFontItalic(true);
    } else if (k == QLatin1String("code-block")) {
        s.setFontFamily(kMonoFamily);
        s.setFontSize(10);
        s.setBackground(QColor(0xf6, 0xf8, 0xfa));
        s.setSpaceBefore(4);
        s.setSpaceAfter(8);
    } else if (k == QLatin1String("code-span")) {
        s.setFontFamily(kMonoFamily);
        s.setBackground(QColor(0xf0, 0xf0, 0xf0));
    } else if (k == QLatin1String("link")) {
        s.setForeground(QColor(0x03, 0x66, 0xd6));
        s.setFontUnderline(true);
    } else if (k == QLatin1String("image")) {
        s.setFontItalic(true);
        s.setForeground(QColor(0x6a, 0x73, 0x7d));
    } else if (key.family == QLatin1String("list")) {
        s.setSpaceAfter(6);
        s.setIndent(18);
    } else if (k == QLatin1String("list-item")) {
        s.setSpaceAfter(2);
    } else if (k == QLatin1String("block-quote")) {
        s.setForeground(QColor(0x55, 0x55, 0x55));
        s.setIndent(18);
        s.setSpaceAfter(6);
    } else if (k == QLatin1String("rule")) {
        s.setForeground(QColor(0xc0, 0xc0, 0xc0));
        s.setSpaceBefore(6);
        s.setSpaceAfter(6);
    }
    // "text" and "list-marker" only inherit
    return s;
}
