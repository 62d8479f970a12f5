/*
 * tokenmodel.h — Token tree types (header-only, std::variant)
 *
 * The structural representation of a Markdown document between
 * TokenBuilder and DocumentBuilder. Built once per conversion and not
 * modified afterwards. Every node owns its children.
 *
 * NOTE: Qt GUI headers (QColor via elementstyle.h) must be included BEFORE
 * opening the Token namespace to avoid ADL issues with Qt6 macros.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARKPRINT_TOKENMODEL_H
#define MARKPRINT_TOKENMODEL_H

#include <QList>
#include <QString>

#include <optional>
#include <variant>

#include "elementstyle.h"

namespace Token {

// --- Leaf nodes ---

struct CodeBlock {
    std::optional<QString> language;
    QString content;            // verbatim, newline-preserving
    ElementStyle overrides;
};

struct CodeSpan {
    QString content;
    ElementStyle overrides;
};

struct Image {
    QString alt;
    QString source;
    ElementStyle overrides;
};

struct Rule {
    ElementStyle overrides;
};

struct Text {
    QString content;
    ElementStyle overrides;
};

// Characters of a construct that did not form (unmatched markers, stray brackets)
struct Literal {
    QString content;
    ElementStyle overrides;
};

struct SoftBreak {};

// Forward-declare container nodes for recursive types
struct Heading;
struct Paragraph;
struct Emphasis;
struct Link;
struct List;
struct BlockQuote;
using Node = std::variant<
    struct Heading,
    struct Paragraph,
    struct Emphasis,
    CodeBlock,
    CodeSpan,
    struct Link,
    Image,
    struct List,
    struct BlockQuote,
    Rule,
    Text,
    Literal,
    SoftBreak
>;

// --- Container nodes ---

struct Heading {
    int level = 1;              // 1-6
    QList<Node> children;
    ElementStyle overrides;
};

struct Paragraph {
    QList<Node> children;
    ElementStyle overrides;
};

struct Emphasis {
    int level = 1;              // 1 = italic, 2 = bold, 3+ = bold-italic
    QList<Node> children;
    ElementStyle overrides;
};

struct Link {
    QList<Node> label;
    QString url;
    ElementStyle overrides;
};

struct ListItem {
    QList<Node> children;       // inline tokens, then any nested lists
    ElementStyle overrides;
};

struct List {
    bool ordered = false;
    QList<ListItem> items;
    ElementStyle overrides;
};

struct BlockQuote {
    QList<Node> children;       // paragraphs
    ElementStyle overrides;
};

// --- Document ---

struct Document {
    QList<Node> blocks;
    ElementStyle overrides;
};

// Concatenated text of a subtree as the reader would see it
QString plainText(const QList<Node> &nodes);

} // namespace Token

#endif // MARKPRINT_TOKENMODEL_H
