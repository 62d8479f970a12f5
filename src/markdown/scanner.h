/*
 * scanner.h — Markdown source → flat LexicalUnit sequence
 *
 * Line-level constructs (headings, list and quote markers, fences, thematic
 * breaks, blank lines) are recognised at the start of each line; the rest of
 * the line is split into inline units (text runs, emphasis runs, code spans,
 * link brackets and targets). Lines inside a fenced block are emitted as
 * RawText and never split further.
 *
 * Unknown syntax is never an error: it simply stays in Text units. The only
 * failure is malformed input (an unpaired UTF-16 surrogate).
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARKPRINT_SCANNER_H
#define MARKPRINT_SCANNER_H

#include <QHash>
#include <QList>
#include <QString>

#include "lexicalunit.h"

class Scanner
{
public:
    Scanner() = default;

    QList<LexicalUnit> scan(const QString &text);

    bool hasError() const { return !m_errorString.isEmpty(); }
    QString errorString() const { return m_errorString; }

    static bool isEscapable(QChar c);

private:
    bool validate(const QString &text);

    // Returns the position scanning stopped at; greater than lineEnd when an
    // HTML comment swallowed the newline.
    int scanLine(int lineStart, int lineEnd);
    int scanContinuation(int pos, int lineEnd);
    int scanInline(int from, int to);
    void scanFencedLine(int lineStart, int contentEnd, int lineEnd);

    bool tryHeading(int pos, int lineEnd, int &contentStart);
    bool tryThematicBreak(int pos, int lineEnd);
    bool tryListMarker(int pos, int lineEnd, int indent, int &contentStart);
    bool tryFenceOpen(int pos, int lineEnd);
    int headingContentEnd(int contentStart, int lineEnd) const;

    int scanCodeSpan(int pos, int to);
    int scanLinkTarget(int pos, int to);
    int commentClose(int from);
    void indexBacktickRuns();
    void matchParens();

    void appendText(QChar c, int offset);
    void flushText();
    void emitUnit(LexicalUnit unit);
    void emitLineEnd(int offset, int indent);

    QString m_source;
    QList<LexicalUnit> m_units;
    QString m_errorString;

    QString m_pendingText;
    int m_pendingOffset = -1;

    bool m_inFence = false;
    int m_fenceLength = 0;
    int m_lineIndent = 0;

    // Search results reused across positions; reset per scan or inline range
    int m_commentSearchFrom = -1;
    int m_commentClose = -1;
    int m_inlineFrom = 0;
    int m_inlineTo = 0;
    bool m_backtickRunsReady = false;
    QHash<int, QList<int>> m_backtickRuns;
    bool m_parenMatchReady = false;
    QList<int> m_parenMatch;
};

#endif // MARKPRINT_SCANNER_H
