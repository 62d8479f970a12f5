/*
 * scanner.cpp — Markdown source → flat LexicalUnit sequence
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "scanner.h"

#include <algorithm>

#include <QDebug>

namespace {

bool isSpace(QChar c)
{
    return c == QLatin1Char(' ') || c == QLatin1Char('\t');
}

// Positions outside the scanned range count as whitespace
bool isFlankSpace(QChar c)
{
    return c.isNull() || c.isSpace();
}

int runLength(const QString &s, int pos, int end, QChar c)
{
    int n = 0;
    while (pos + n < end && s[pos + n] == c)
        ++n;
    return n;
}

int skipSpaces(const QString &s, int pos, int end)
{
    while (pos < end && isSpace(s[pos]))
        ++pos;
    return pos;
}

} // anonymous namespace

bool Scanner::isEscapable(QChar c)
{
    static const QString escapable = QStringLiteral("\\`*_{}[]()#+-.!>~|<");
    return escapable.contains(c);
}

QList<LexicalUnit> Scanner::scan(const QString &text)
{
    m_source = text;
    m_units.clear();
    m_errorString.clear();
    m_pendingText.clear();
    m_pendingOffset = -1;
    m_inFence = false;
    m_fenceLength = 0;
    m_lineIndent = 0;
    m_commentSearchFrom = -1;
    m_commentClose = -1;

    if (!validate(text))
        return {};

    const int size = m_source.size();
    int pos = 0;
    bool continuation = false;
    while (pos < size) {
        int lineEnd = m_source.indexOf(QLatin1Char('\n'), pos);
        if (lineEnd < 0)
            lineEnd = size;

        int next = continuation ? scanContinuation(pos, lineEnd) : scanLine(pos, lineEnd);
        if (next > lineEnd) {
            // An HTML comment ran past the newline; resume mid-line
            pos = next;
            continuation = true;
        } else {
            pos = lineEnd + 1;
            continuation = false;
        }
    }
    if (continuation)
        emitLineEnd(size, m_lineIndent);

    return m_units;
}

bool Scanner::validate(const QString &text)
{
    for (int i = 0; i < text.size(); ++i) {
        const QChar c = text[i];
        if (c.isHighSurrogate()) {
            if (i + 1 < text.size() && text[i + 1].isLowSurrogate()) {
                ++i;
                continue;
            }
            m_errorString = QStringLiteral("unpaired high surrogate at offset %1").arg(i);
        } else if (c.isLowSurrogate()) {
            m_errorString = QStringLiteral("unpaired low surrogate at offset %1").arg(i);
        }
        if (!m_errorString.isEmpty()) {
            qWarning() << "Scanner: malformed input:" << m_errorString;
            return false;
        }
    }
    return true;
}

// --- Line level ---

int Scanner::scanLine(int lineStart, int lineEnd)
{
    // The CR of a CRLF pair is not content
    int contentEnd = lineEnd;
    if (contentEnd > lineStart && m_source[contentEnd - 1] == QLatin1Char('\r'))
        --contentEnd;

    if (m_inFence) {
        scanFencedLine(lineStart, contentEnd, lineEnd);
        return lineEnd;
    }

    // Leading indentation; a tab advances to the next multiple of four
    int pos = lineStart;
    int indent = 0;
    while (pos < contentEnd && isSpace(m_source[pos])) {
        indent = m_source[pos] == QLatin1Char('\t') ? (indent / 4 + 1) * 4 : indent + 1;
        ++pos;
    }
    m_lineIndent = indent;

    if (pos == contentEnd) {
        LexicalUnit unit;
        unit.kind = LexicalUnit::BlankLine;
        unit.text = m_source.mid(lineStart, contentEnd - lineStart);
        unit.offset = lineStart;
        emitUnit(unit);
        return lineEnd;
    }

    if (tryFenceOpen(pos, contentEnd))
        return lineEnd;
    if (tryThematicBreak(pos, contentEnd))
        return lineEnd;

    int contentStart = pos;
    int contentStop = contentEnd;
    if (tryHeading(pos, contentEnd, contentStart)) {
        contentStop = headingContentEnd(contentStart, contentEnd);
    } else if (m_source[pos] == QLatin1Char('>')) {
        LexicalUnit unit;
        unit.kind = LexicalUnit::QuoteMarker;
        unit.text = QStringLiteral(">");
        unit.offset = pos;
        unit.marker = QLatin1Char('>');
        unit.indent = indent;
        emitUnit(unit);
        contentStart = pos + 1;
        if (contentStart < contentEnd && isSpace(m_source[contentStart]))
            ++contentStart;
    } else {
        tryListMarker(pos, contentEnd, indent, contentStart);
    }

    int stop = scanInline(contentStart, contentStop);
    if (stop > lineEnd)
        return stop;
    emitLineEnd(lineEnd, indent);
    return lineEnd;
}

int Scanner::scanContinuation(int pos, int lineEnd)
{
    int contentEnd = lineEnd;
    if (contentEnd > pos && m_source[contentEnd - 1] == QLatin1Char('\r'))
        --contentEnd;

    int stop = scanInline(pos, contentEnd);
    if (stop > lineEnd)
        return stop;
    emitLineEnd(lineEnd, m_lineIndent);
    return lineEnd;
}

void Scanner::scanFencedLine(int lineStart, int contentEnd, int lineEnd)
{
    // Closing fence: up to three spaces, a backtick run at least as long as
    // the opening one, nothing but whitespace after it
    int p = lineStart;
    while (p < contentEnd && m_source[p] == QLatin1Char(' ') && p - lineStart < 3)
        ++p;
    const int n = runLength(m_source, p, contentEnd, QLatin1Char('`'));
    if (n >= m_fenceLength
        && m_source.mid(p + n, contentEnd - p - n).trimmed().isEmpty()) {
        LexicalUnit unit;
        unit.kind = LexicalUnit::CodeFence;
        unit.text = m_source.mid(lineStart, contentEnd - lineStart);
        unit.offset = lineStart;
        unit.marker = QLatin1Char('`');
        unit.count = n;
        emitUnit(unit);
        m_inFence = false;
        m_fenceLength = 0;
        return;
    }

    // Verbatim, including the line terminator
    const bool hasNewline = lineEnd < m_source.size();
    LexicalUnit unit;
    unit.kind = LexicalUnit::RawText;
    unit.text = m_source.mid(lineStart, lineEnd - lineStart + (hasNewline ? 1 : 0));
    unit.offset = lineStart;
    emitUnit(unit);
}

bool Scanner::tryFenceOpen(int pos, int lineEnd)
{
    const int n = runLength(m_source, pos, lineEnd, QLatin1Char('`'));
    if (n < 3)
        return false;

    const QString info = m_source.mid(pos + n, lineEnd - pos - n);
    if (info.contains(QLatin1Char('`')))
        return false; // "```x```" is an inline code span

    LexicalUnit unit;
    unit.kind = LexicalUnit::CodeFence;
    unit.text = m_source.mid(pos, lineEnd - pos);
    unit.offset = pos;
    unit.marker = QLatin1Char('`');
    unit.count = n;
    const QString trimmed = info.trimmed();
    if (!trimmed.isEmpty())
        unit.info = trimmed.section(QLatin1Char(' '), 0, 0, QString::SectionSkipEmpty);
    unit.canOpen = true;
    emitUnit(unit);

    m_inFence = true;
    m_fenceLength = n;
    return true;
}

bool Scanner::tryThematicBreak(int pos, int lineEnd)
{
    const QChar c = m_source[pos];
    if (c != QLatin1Char('-') && c != QLatin1Char('*') && c != QLatin1Char('_'))
        return false;

    int count = 0;
    for (int i = pos; i < lineEnd; ++i) {
        if (m_source[i] == c)
            ++count;
        else if (!isSpace(m_source[i]))
            return false;
    }
    if (count < 3)
        return false;

    LexicalUnit unit;
    unit.kind = LexicalUnit::ThematicBreak;
    unit.text = m_source.mid(pos, lineEnd - pos);
    unit.offset = pos;
    unit.marker = c;
    unit.count = count;
    emitUnit(unit);
    return true;
}

bool Scanner::tryHeading(int pos, int lineEnd, int &contentStart)
{
    const int n = runLength(m_source, pos, lineEnd, QLatin1Char('#'));
    if (n < 1 || n > 6)
        return false;
    const int after = pos + n;
    if (after < lineEnd && !isSpace(m_source[after]))
        return false;

    LexicalUnit unit;
    unit.kind = LexicalUnit::HeadingMarker;
    unit.text = m_source.mid(pos, n);
    unit.offset = pos;
    unit.marker = QLatin1Char('#');
    unit.count = n;
    emitUnit(unit);

    contentStart = skipSpaces(m_source, after, lineEnd);
    return true;
}

// Strips trailing whitespace and an optional closing "###" sequence
int Scanner::headingContentEnd(int contentStart, int lineEnd) const
{
    int end = lineEnd;
    while (end > contentStart && isSpace(m_source[end - 1]))
        --end;

    int hashes = end;
    while (hashes > contentStart && m_source[hashes - 1] == QLatin1Char('#'))
        --hashes;
    if (hashes == end)
        return end;
    if (hashes == contentStart)
        return contentStart;
    if (!isSpace(m_source[hashes - 1]))
        return end;

    end = hashes;
    while (end > contentStart && isSpace(m_source[end - 1]))
        --end;
    return end;
}

bool Scanner::tryListMarker(int pos, int lineEnd, int indent, int &contentStart)
{
    const QChar c = m_source[pos];
    int markerEnd = -1;
    bool ordered = false;
    int number = 0;

    if (c == QLatin1Char('-') || c == QLatin1Char('*') || c == QLatin1Char('+')) {
        markerEnd = pos + 1;
    } else if (c.isDigit()) {
        int j = pos;
        while (j < lineEnd && m_source[j].isDigit() && j - pos < 9)
            ++j;
        if (j < lineEnd && (m_source[j] == QLatin1Char('.') || m_source[j] == QLatin1Char(')'))) {
            number = m_source.mid(pos, j - pos).toInt();
            ordered = true;
            markerEnd = j + 1;
        }
    }
    if (markerEnd < 0)
        return false;
    if (markerEnd < lineEnd && !isSpace(m_source[markerEnd]))
        return false;

    LexicalUnit unit;
    unit.kind = LexicalUnit::ListMarker;
    unit.text = m_source.mid(pos, markerEnd - pos);
    unit.offset = pos;
    unit.marker = m_source[markerEnd - 1];
    unit.ordered = ordered;
    unit.count = number;
    unit.indent = indent;
    emitUnit(unit);

    contentStart = skipSpaces(m_source, markerEnd, lineEnd);
    return true;
}

// --- Inline level ---

int Scanner::scanInline(int from, int to)
{
    m_inlineFrom = from;
    m_inlineTo = to;
    m_backtickRunsReady = false;
    m_parenMatchReady = false;

    int i = from;
    while (i < to) {
        const QChar c = m_source[i];

        if (c == QLatin1Char('\\') && i + 1 < to && isEscapable(m_source[i + 1])) {
            appendText(m_source[i + 1], i);
            i += 2;
            continue;
        }

        if (c == QLatin1Char('`')) {
            i = scanCodeSpan(i, to);
            continue;
        }

        if (c == QLatin1Char('*') || c == QLatin1Char('_')) {
            const int n = runLength(m_source, i, to, c);
            const QChar prev = i > from ? m_source[i - 1] : QChar();
            const QChar next = i + n < to ? m_source[i + n] : QChar();

            LexicalUnit unit;
            unit.kind = LexicalUnit::EmphasisMarker;
            unit.text = m_source.mid(i, n);
            unit.offset = i;
            unit.marker = c;
            unit.count = n;
            unit.canOpen = !isFlankSpace(next);
            unit.canClose = !isFlankSpace(prev);
            if (c == QLatin1Char('_')) {
                // snake_case stays literal
                if (!prev.isNull() && prev.isLetterOrNumber())
                    unit.canOpen = false;
                if (!next.isNull() && next.isLetterOrNumber())
                    unit.canClose = false;
            }
            emitUnit(unit);
            i += n;
            continue;
        }

        if (c == QLatin1Char('[')
            || (c == QLatin1Char('!') && i + 1 < to && m_source[i + 1] == QLatin1Char('['))) {
            const bool image = c == QLatin1Char('!');
            LexicalUnit unit;
            unit.kind = LexicalUnit::LinkBracket;
            unit.text = image ? QStringLiteral("![") : QStringLiteral("[");
            unit.offset = i;
            unit.marker = QLatin1Char('[');
            unit.image = image;
            emitUnit(unit);
            i += unit.text.size();
            continue;
        }

        if (c == QLatin1Char(']')) {
            LexicalUnit unit;
            unit.kind = LexicalUnit::LinkBracket;
            unit.text = QStringLiteral("]");
            unit.offset = i;
            unit.marker = QLatin1Char(']');
            emitUnit(unit);
            i = scanLinkTarget(i + 1, to);
            continue;
        }

        if (c == QLatin1Char('<') && m_source.mid(i, 4) == QLatin1String("<!--")) {
            const int close = commentClose(i + 4);
            if (close >= 0) {
                flushText();
                const int resume = close + 3;
                if (resume > to)
                    return resume;
                i = resume;
                continue;
            }
        }

        appendText(c, i);
        ++i;
    }

    flushText();
    return to;
}

int Scanner::scanCodeSpan(int pos, int to)
{
    const int n = runLength(m_source, pos, to, QLatin1Char('`'));

    if (!m_backtickRunsReady)
        indexBacktickRuns();
    int close = -1;
    const auto runs = m_backtickRuns.constFind(n);
    if (runs != m_backtickRuns.constEnd()) {
        const auto it = std::lower_bound(runs->cbegin(), runs->cend(), pos + n);
        if (it != runs->cend())
            close = *it;
    }

    if (close < 0) {
        // No matching run on this line: the backticks are literal
        for (int j = 0; j < n; ++j)
            appendText(QLatin1Char('`'), pos + j);
        return pos + n;
    }

    LexicalUnit open;
    open.kind = LexicalUnit::CodeSpanMarker;
    open.text = m_source.mid(pos, n);
    open.offset = pos;
    open.marker = QLatin1Char('`');
    open.count = n;
    open.canOpen = true;
    emitUnit(open);

    QString content = m_source.mid(pos + n, close - pos - n);
    if (content.size() >= 2 && content.startsWith(QLatin1Char(' '))
        && content.endsWith(QLatin1Char(' ')) && !content.trimmed().isEmpty())
        content = content.mid(1, content.size() - 2);

    LexicalUnit raw;
    raw.kind = LexicalUnit::RawText;
    raw.text = content;
    raw.offset = pos + n;
    emitUnit(raw);

    LexicalUnit closing = open;
    closing.offset = close;
    closing.canOpen = false;
    closing.canClose = true;
    emitUnit(closing);

    return close + n;
}

// "(url)" or "(<url> "title")" directly after ']'; returns where scanning resumes
int Scanner::scanLinkTarget(int pos, int to)
{
    if (pos >= to || m_source[pos] != QLatin1Char('('))
        return pos;

    if (!m_parenMatchReady)
        matchParens();
    const int k = m_parenMatch.at(pos - m_inlineFrom);
    if (k < 0)
        return pos; // no closing paren: '(' stays text

    const QString inner = m_source.mid(pos + 1, k - pos - 1).trimmed();
    QString url;
    if (inner.startsWith(QLatin1Char('<')) && inner.indexOf(QLatin1Char('>')) > 0)
        url = inner.mid(1, inner.indexOf(QLatin1Char('>')) - 1);
    else
        url = inner.section(QLatin1Char(' '), 0, 0, QString::SectionSkipEmpty);

    LexicalUnit unit;
    unit.kind = LexicalUnit::LinkTarget;
    unit.text = m_source.mid(pos, k + 1 - pos);
    unit.offset = pos;
    unit.info = url;
    emitUnit(unit);
    return k + 1;
}

// The closing "-->" at or after from, or -1. A failed search also answers
// every later one, and a found close answers every start up to it.
int Scanner::commentClose(int from)
{
    if (m_commentSearchFrom >= 0 && from >= m_commentSearchFrom
        && (m_commentClose < 0 || from <= m_commentClose))
        return m_commentClose;

    m_commentSearchFrom = from;
    m_commentClose = m_source.indexOf(QLatin1String("-->"), from);
    return m_commentClose;
}

// Start of every maximal backtick run in the inline range, grouped by length
void Scanner::indexBacktickRuns()
{
    m_backtickRuns.clear();
    int k = m_inlineFrom;
    while (k < m_inlineTo) {
        if (m_source[k] == QLatin1Char('`')) {
            const int m = runLength(m_source, k, m_inlineTo, QLatin1Char('`'));
            m_backtickRuns[m].append(k);
            k += m;
        } else {
            ++k;
        }
    }
    m_backtickRunsReady = true;
}

// For each '(' in the inline range, the ')' that balances it or -1.
// Backslash escapes any following character inside a link target.
void Scanner::matchParens()
{
    m_parenMatch.fill(-1, m_inlineTo - m_inlineFrom);
    QList<int> open;
    int k = m_inlineFrom;
    while (k < m_inlineTo) {
        const QChar ch = m_source[k];
        if (ch == QLatin1Char('\\') && k + 1 < m_inlineTo) {
            k += 2;
            continue;
        }
        if (ch == QLatin1Char('(')) {
            open.append(k);
        } else if (ch == QLatin1Char(')') && !open.isEmpty()) {
            m_parenMatch[open.takeLast() - m_inlineFrom] = k;
        }
        ++k;
    }
    m_parenMatchReady = true;
}

// --- Emission ---

void Scanner::appendText(QChar c, int offset)
{
    if (m_pendingText.isEmpty())
        m_pendingOffset = offset;
    m_pendingText.append(c);
}

void Scanner::flushText()
{
    if (m_pendingText.isEmpty())
        return;
    LexicalUnit unit;
    unit.kind = LexicalUnit::Text;
    unit.text = m_pendingText;
    unit.offset = m_pendingOffset;
    m_units.append(unit);
    m_pendingText.clear();
    m_pendingOffset = -1;
}

void Scanner::emitUnit(LexicalUnit unit)
{
    flushText();
    m_units.append(std::move(unit));
}

void Scanner::emitLineEnd(int offset, int indent)
{
    LexicalUnit unit;
    unit.kind = LexicalUnit::LineEnd;
    unit.text = offset < m_source.size() ? QStringLiteral("\n") : QString();
    unit.offset = offset;
    unit.indent = indent;
    emitUnit(unit);
}
