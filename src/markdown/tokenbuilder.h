/*
 * tokenbuilder.h — LexicalUnit sequence → Token::Document
 *
 * Block structure is assembled line by line (paragraphs, headings, fenced
 * code, lists, block quotes, rules). Inline content of each block is paired
 * by DelimiterResolver and then turned into nested nodes with an explicit
 * frame stack, so deeply nested input never recurses.
 *
 * Malformed Markdown never fails: it degrades to Literal nodes. A failure
 * means the unit stream broke a contract the Scanner guarantees.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARKPRINT_TOKENBUILDER_H
#define MARKPRINT_TOKENBUILDER_H

#include <QList>
#include <QString>

#include "lexicalunit.h"
#include "tokenmodel.h"

class TokenBuilder
{
public:
    TokenBuilder() = default;

    Token::Document build(const QList<LexicalUnit> &units);

    bool hasError() const { return !m_errorString.isEmpty(); }
    QString errorString() const { return m_errorString; }

private:
    struct OpenList {
        Token::List list;
        int indent = 0;
        QList<LexicalUnit> pending;   // inline units of the current item
    };

    // Line helpers
    int takeLineContent(int from, QList<LexicalUnit> &content, int *indent = nullptr);
    static void appendLine(QList<LexicalUnit> &target, const QList<LexicalUnit> &content);

    // Block handlers; each returns the index of the next unread unit
    int readCodeBlock(int index);
    int readHeading(int index);
    int readQuoteLine(int index);
    int readListLine(int index);
    int readPlainLine(int index);

    void closeParagraph();
    void closeQuote();
    void flushQuoteParagraph();
    void closeLists();
    void closeAll();
    void startItem(OpenList &open, const QList<LexicalUnit> &content);
    void flushItem(OpenList &open);
    void popList();

    bool buildInlines(const QList<LexicalUnit> &units, QList<Token::Node> &out);
    void fail(const QString &message, int index);

    const QList<LexicalUnit> *m_units = nullptr;
    Token::Document m_document;
    QString m_errorString;

    QList<LexicalUnit> m_paragraph;

    bool m_quoteOpen = false;
    QList<Token::Node> m_quoteChildren;
    QList<LexicalUnit> m_quoteParagraph;

    QList<OpenList> m_lists;
};

#endif // MARKPRINT_TOKENBUILDER_H
