/*
 * styledmodel.h — Styled element types (header-only, std::variant)
 *
 * The output of DocumentBuilder: a flat, ordered sequence of drawing
 * instructions with every style already resolved. A renderer needs nothing
 * else to lay the document out.
 *
 * NOTE: Qt GUI headers (QColor) must be included BEFORE opening the
 * Styled namespace to avoid ADL issues with Qt6 macros.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARKPRINT_STYLEDMODEL_H
#define MARKPRINT_STYLEDMODEL_H

#include <QColor>
#include <QList>
#include <QString>

#include <variant>

#include "elementstyle.h"

namespace Styled {

// Vertical flow marker around a block; `space` is the block's spaceBefore
// on the opening break and its spaceAfter on the closing one.
struct BlockBreak {
    bool opening = true;
    QString blockKey;           // specific style key of the block
    qreal space = 0;
    ResolvedStyle style;
};

struct TextRun {
    QString text;
    ResolvedStyle style;
};

// The URL and all of its label text travel together
struct Link {
    QString url;
    QList<TextRun> runs;
};

struct CodeBlock {
    QString language;           // hint only; empty when none was given
    QString code;
    ResolvedStyle style;
};

struct ListItemBegin {
    int depth = 1;              // 1 = top-level list
    bool ordered = false;
    int number = 0;             // 1-based for ordered lists, 0 otherwise
    QString label;              // "1." or "•"
    ResolvedStyle markerStyle;
    ResolvedStyle itemStyle;
};

struct ListItemEnd {
    int depth = 1;
};

struct Image {
    QString source;
    QString alt;
    ResolvedStyle style;
};

struct Rule {
    ResolvedStyle style;
};

using Element = std::variant<
    BlockBreak,
    TextRun,
    Link,
    CodeBlock,
    ListItemBegin,
    ListItemEnd,
    Image,
    Rule
>;

using Document = QList<Element>;

} // namespace Styled

#endif // MARKPRINT_STYLEDMODEL_H
