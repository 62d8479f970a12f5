/*
 * tokenbuilder.cpp — Block assembly and inline tree construction
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "tokenbuilder.h"
#include "delimiterresolver.h"

#include <QDebug>

namespace {

bool isInlineKind(LexicalUnit::Kind kind)
{
    switch (kind) {
    case LexicalUnit::Text:
    case LexicalUnit::EmphasisMarker:
    case LexicalUnit::CodeSpanMarker:
    case LexicalUnit::RawText:
    case LexicalUnit::LinkBracket:
    case LexicalUnit::LinkTarget:
        return true;
    default:
        return false;
    }
}

// Separator between two source lines of one block; becomes a SoftBreak
LexicalUnit lineSeparator()
{
    LexicalUnit unit;
    unit.kind = LexicalUnit::LineEnd;
    unit.text = QStringLiteral("\n");
    return unit;
}

void appendText(QList<Token::Node> &nodes, const QString &text)
{
    if (!nodes.isEmpty()) {
        if (auto *last = std::get_if<Token::Text>(&nodes.last())) {
            last->content += text;
            return;
        }
    }
    nodes.append(Token::Text{text, {}});
}

struct InlineFrame {
    enum Kind { Root, Emphasis, Link };
    Kind kind = Root;
    int level = 0;          // emphasis level in effect inside this frame
    bool image = false;
    QList<Token::Node> children;
};

} // anonymous namespace

Token::Document TokenBuilder::build(const QList<LexicalUnit> &units)
{
    m_units = &units;
    m_document = Token::Document();
    m_errorString.clear();
    m_paragraph.clear();
    m_quoteOpen = false;
    m_quoteChildren.clear();
    m_quoteParagraph.clear();
    m_lists.clear();

    int i = 0;
    while (i < units.size() && !hasError()) {
        const LexicalUnit &unit = units.at(i);
        switch (unit.kind) {
        case LexicalUnit::BlankLine:
            closeAll();
            ++i;
            break;
        case LexicalUnit::ThematicBreak:
            closeAll();
            m_document.blocks.append(Token::Rule{});
            ++i;
            break;
        case LexicalUnit::CodeFence:
            closeAll();
            i = readCodeBlock(i);
            break;
        case LexicalUnit::HeadingMarker:
            closeAll();
            i = readHeading(i);
            break;
        case LexicalUnit::QuoteMarker:
            i = readQuoteLine(i);
            break;
        case LexicalUnit::ListMarker:
            i = readListLine(i);
            break;
        case LexicalUnit::RawText:
            fail(QStringLiteral("raw text outside a code construct"), unit.offset);
            break;
        default:
            i = readPlainLine(i);
            break;
        }
    }

    if (!hasError())
        closeAll();

    m_units = nullptr;
    if (hasError())
        return Token::Document();
    return std::move(m_document);
}

void TokenBuilder::fail(const QString &message, int offset)
{
    if (hasError())
        return;
    m_errorString = QStringLiteral("%1 (source offset %2)").arg(message).arg(offset);
    qWarning() << "TokenBuilder:" << m_errorString;
}

// --- Lines ---

int TokenBuilder::takeLineContent(int from, QList<LexicalUnit> &content, int *indent)
{
    const QList<LexicalUnit> &units = *m_units;
    content.clear();

    int i = from;
    while (i < units.size()) {
        const LexicalUnit &unit = units.at(i);
        if (unit.kind == LexicalUnit::LineEnd) {
            if (indent)
                *indent = unit.indent;
            return i + 1;
        }
        if (!isInlineKind(unit.kind)) {
            fail(QStringLiteral("block unit inside inline content"), unit.offset);
            return units.size();
        }
        content.append(unit);
        ++i;
    }

    fail(QStringLiteral("unit stream ended inside a line"),
         units.isEmpty() ? 0 : units.last().offset);
    return units.size();
}

void TokenBuilder::appendLine(QList<LexicalUnit> &target, const QList<LexicalUnit> &content)
{
    if (content.isEmpty())
        return;
    if (!target.isEmpty())
        target.append(lineSeparator());
    target.append(content);
}

// --- Block handlers ---

int TokenBuilder::readCodeBlock(int index)
{
    const QList<LexicalUnit> &units = *m_units;
    const LexicalUnit &opener = units.at(index);
    if (!opener.canOpen) {
        fail(QStringLiteral("closing fence without an opening fence"), opener.offset);
        return units.size();
    }

    Token::CodeBlock block;
    if (!opener.info.isEmpty())
        block.language = opener.info;

    int i = index + 1;
    while (i < units.size()) {
        const LexicalUnit &unit = units.at(i);
        if (unit.kind == LexicalUnit::RawText) {
            block.content += unit.text;
            ++i;
        } else if (unit.kind == LexicalUnit::CodeFence && !unit.canOpen) {
            ++i;
            break;
        } else {
            fail(QStringLiteral("unexpected unit inside a code block"), unit.offset);
            return units.size();
        }
    }
    // Reaching the end of input closes the block implicitly

    m_document.blocks.append(std::move(block));
    return i;
}

int TokenBuilder::readHeading(int index)
{
    QList<LexicalUnit> content;
    const int next = takeLineContent(index + 1, content);
    if (hasError())
        return next;

    Token::Heading heading;
    heading.level = qBound(1, m_units->at(index).count, 6);
    if (!buildInlines(content, heading.children))
        return next;
    m_document.blocks.append(std::move(heading));
    return next;
}

int TokenBuilder::readQuoteLine(int index)
{
    closeParagraph();
    closeLists();

    QList<LexicalUnit> content;
    const int next = takeLineContent(index + 1, content);
    if (hasError())
        return next;

    m_quoteOpen = true;
    if (content.isEmpty())
        flushQuoteParagraph(); // a bare ">" separates paragraphs
    else
        appendLine(m_quoteParagraph, content);
    return next;
}

int TokenBuilder::readListLine(int index)
{
    closeParagraph();
    closeQuote();

    const LexicalUnit &marker = m_units->at(index);
    QList<LexicalUnit> content;
    const int next = takeLineContent(index + 1, content);
    if (hasError())
        return next;

    while (!m_lists.isEmpty() && m_lists.last().indent > marker.indent)
        popList();
    if (!m_lists.isEmpty() && m_lists.last().indent == marker.indent
        && m_lists.last().list.ordered != marker.ordered)
        popList();

    const bool sameLevel = !m_lists.isEmpty() && m_lists.last().indent == marker.indent;
    if (sameLevel || m_lists.size() >= DelimiterResolver::MaxNestingDepth) {
        startItem(m_lists.last(), content);
        return next;
    }

    if (!m_lists.isEmpty())
        flushItem(m_lists.last());

    OpenList open;
    open.indent = marker.indent;
    open.list.ordered = marker.ordered;
    m_lists.append(std::move(open));
    startItem(m_lists.last(), content);
    return next;
}

int TokenBuilder::readPlainLine(int index)
{
    QList<LexicalUnit> content;
    int indent = 0;
    const int next = takeLineContent(index, content, &indent);
    if (hasError() || content.isEmpty())
        return next; // a line reduced to nothing (e.g. only a comment)

    if (!m_lists.isEmpty()) {
        if (indent > 0) {
            appendLine(m_lists.last().pending, content);
            return next;
        }
        closeLists();
    }
    closeQuote();
    appendLine(m_paragraph, content);
    return next;
}

// --- Closing open blocks ---

void TokenBuilder::closeParagraph()
{
    if (m_paragraph.isEmpty())
        return;
    Token::Paragraph paragraph;
    if (buildInlines(m_paragraph, paragraph.children))
        m_document.blocks.append(std::move(paragraph));
    m_paragraph.clear();
}

void TokenBuilder::flushQuoteParagraph()
{
    if (m_quoteParagraph.isEmpty())
        return;
    Token::Paragraph paragraph;
    if (buildInlines(m_quoteParagraph, paragraph.children))
        m_quoteChildren.append(std::move(paragraph));
    m_quoteParagraph.clear();
}

void TokenBuilder::closeQuote()
{
    if (!m_quoteOpen)
        return;
    flushQuoteParagraph();
    Token::BlockQuote quote;
    quote.children = std::move(m_quoteChildren);
    m_quoteChildren.clear();
    m_document.blocks.append(std::move(quote));
    m_quoteOpen = false;
}

void TokenBuilder::closeLists()
{
    while (!m_lists.isEmpty())
        popList();
}

void TokenBuilder::closeAll()
{
    closeParagraph();
    closeQuote();
    closeLists();
}

void TokenBuilder::startItem(OpenList &open, const QList<LexicalUnit> &content)
{
    flushItem(open);
    open.list.items.append(Token::ListItem());
    open.pending = content;
}

void TokenBuilder::flushItem(OpenList &open)
{
    if (open.pending.isEmpty() || open.list.items.isEmpty())
        return;
    QList<Token::Node> nodes;
    if (buildInlines(open.pending, nodes))
        open.list.items.last().children.append(nodes);
    open.pending.clear();
}

void TokenBuilder::popList()
{
    OpenList open = m_lists.takeLast();
    flushItem(open);

    Token::Node node(std::move(open.list));
    if (m_lists.isEmpty()) {
        m_document.blocks.append(std::move(node));
        return;
    }
    OpenList &parent = m_lists.last();
    flushItem(parent);
    if (parent.list.items.isEmpty()) {
        fail(QStringLiteral("nested list without an enclosing item"), 0);
        return;
    }
    parent.list.items.last().children.append(std::move(node));
}

// --- Inline content ---

bool TokenBuilder::buildInlines(const QList<LexicalUnit> &units, QList<Token::Node> &out)
{
    DelimiterResolver resolver;
    const QList<DelimiterPlan> plan = resolver.resolve(units);

    QList<InlineFrame> frames;
    frames.append(InlineFrame());

    for (int i = 0; i < units.size(); ++i) {
        const LexicalUnit &unit = units.at(i);
        const DelimiterPlan &step = plan.at(i);

        switch (unit.kind) {
        case LexicalUnit::Text:
            appendText(frames.last().children, unit.text);
            break;

        case LexicalUnit::LineEnd:
            frames.last().children.append(Token::SoftBreak{});
            break;

        case LexicalUnit::CodeSpanMarker:
            if (i + 2 >= units.size() || units.at(i + 1).kind != LexicalUnit::RawText
                || units.at(i + 2).kind != LexicalUnit::CodeSpanMarker) {
                fail(QStringLiteral("code span without closing marker"), unit.offset);
                return false;
            }
            frames.last().children.append(Token::CodeSpan{units.at(i + 1).text, {}});
            i += 2;
            break;

        case LexicalUnit::EmphasisMarker: {
            for (int k = 0; k < step.closeCount; ++k) {
                if (frames.last().kind != InlineFrame::Emphasis) {
                    fail(QStringLiteral("emphasis close without an open emphasis frame"), unit.offset);
                    return false;
                }
                InlineFrame frame = frames.takeLast();
                frames.last().children.append(
                    Token::Emphasis{frame.level, std::move(frame.children), {}});
            }
            if (step.literalLength > 0)
                frames.last().children.append(
                    Token::Literal{QString(step.literalLength, unit.marker), {}});
            if (step.openLength > 0) {
                InlineFrame frame;
                frame.kind = InlineFrame::Emphasis;
                frame.level = frames.last().level + step.openLength;
                frames.append(std::move(frame));
            }
            break;
        }

        case LexicalUnit::LinkBracket:
            if (step.role == DelimiterPlan::LinkOpen) {
                InlineFrame frame;
                frame.kind = InlineFrame::Link;
                frame.level = frames.last().level;
                frame.image = unit.image;
                frames.append(std::move(frame));
            } else if (step.role == DelimiterPlan::LinkClose) {
                if (frames.last().kind != InlineFrame::Link || i + 1 >= units.size()
                    || plan.at(i + 1).role != DelimiterPlan::LinkTarget) {
                    fail(QStringLiteral("link close without an open link frame"), unit.offset);
                    return false;
                }
                const QString url = units.at(i + 1).info;
                InlineFrame frame = frames.takeLast();
                if (frame.image)
                    frames.last().children.append(
                        Token::Image{Token::plainText(frame.children), url, {}});
                else
                    frames.last().children.append(
                        Token::Link{std::move(frame.children), url, {}});
                ++i;
            } else {
                frames.last().children.append(Token::Literal{unit.text, {}});
            }
            break;

        case LexicalUnit::LinkTarget:
            frames.last().children.append(Token::Literal{unit.text, {}});
            break;

        case LexicalUnit::RawText:
            fail(QStringLiteral("raw text outside a code construct"), unit.offset);
            return false;

        default:
            fail(QStringLiteral("unexpected unit in inline content"), unit.offset);
            return false;
        }
    }

    if (frames.size() != 1) {
        fail(QStringLiteral("inline frames left open at end of block"),
             units.isEmpty() ? 0 : units.last().offset);
        return false;
    }

    out.append(std::move(frames.first().children));
    return true;
}
