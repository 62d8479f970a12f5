/*
 * lexicalunit.h — Classified spans of Markdown source emitted by Scanner
 *
 * Units are transient: TokenBuilder consumes them and they are discarded.
 * Every unit keeps the exact source substring it covers so that malformed
 * constructs can degrade back to the characters the author typed.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARKPRINT_LEXICALUNIT_H
#define MARKPRINT_LEXICALUNIT_H

#include <QChar>
#include <QList>
#include <QString>

struct LexicalUnit {
    enum Kind {
        Text,            // plain run, escapes already resolved
        HeadingMarker,   // "#".."######" at line start
        EmphasisMarker,  // run of '*' or '_'
        CodeFence,       // ``` line (opening carries the info string)
        CodeSpanMarker,  // backtick run delimiting an inline code span
        ListMarker,      // "-", "*", "+" or digits followed by '.' or ')'
        LinkBracket,     // "[", "![" or "]"
        LinkTarget,      // "(url)" directly after "]"
        RawText,         // verbatim content of code spans and code blocks
        QuoteMarker,     // ">" at line start
        ThematicBreak,   // "---", "***", "___"
        LineEnd,         // end of a non-blank line
        BlankLine
    };

    Kind kind = Text;
    QString text;        // source substring (or resolved text for Text)
    int offset = 0;      // UTF-16 index into the scanned string

    // Marker details
    QChar marker;        // emphasis/list/fence character, '[' or ']' for brackets
    int count = 0;       // run length, heading level or fence length
    int indent = 0;      // leading columns before a list or quote marker
    bool ordered = false;
    bool image = false;  // "![" bracket
    bool canOpen = false;
    bool canClose = false;
    QString info;        // fence language tag or link target URL
};

#endif // MARKPRINT_LEXICALUNIT_H
