/*
 * documentbuilder.cpp — Iterative token-tree walk with style resolution
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "documentbuilder.h"
#include "stylematch.h"

#include <type_traits>

DocumentBuilder::DocumentBuilder(const StyleMatch &table)
    : m_resolver(table)
{
}

Styled::Document DocumentBuilder::build(const Token::Document &root)
{
    m_frames.clear();
    m_ancestry.clear();
    m_output.clear();

    Frame &rootFrame = pushFrame(Frame::Root, StyleKeys::document(), root.overrides);
    rootFrame.children = &root.blocks;

    while (!m_frames.isEmpty()) {
        Frame &top = m_frames.last();

        if (top.kind == Frame::List) {
            if (top.index >= top.list->items.size()) {
                exitFrame();
                continue;
            }
            const int position = ++top.index;
            enterItem(top.list->items.at(position - 1), position);
            continue;
        }

        if (top.index >= top.children->size()) {
            exitFrame();
            continue;
        }
        visit(top.children->at(top.index++));
    }

    return std::move(m_output);
}

ResolvedStyle DocumentBuilder::resolve(const StyleKey &key, const ElementStyle &overrides) const
{
    const ResolvedStyle *parent = m_frames.isEmpty() ? nullptr : &m_frames.last().style;
    return m_resolver.resolveChild(parent, key, m_ancestry, overrides);
}

DocumentBuilder::Frame &DocumentBuilder::pushFrame(Frame::Kind kind, const StyleKey &key,
                                                   const ElementStyle &overrides)
{
    Frame frame;
    frame.kind = kind;
    frame.key = key;
    frame.style = resolve(key, overrides);
    m_frames.append(std::move(frame));
    m_ancestry.append(key);
    return m_frames.last();
}

void DocumentBuilder::visit(const Token::Node &node)
{
    std::visit([this](const auto &n) {
        using T = std::decay_t<decltype(n)>;

        if constexpr (std::is_same_v<T, Token::Heading>) {
            Frame &f = pushFrame(Frame::Block, StyleKeys::heading(n.level), n.overrides);
            f.children = &n.children;
            emitBlockBreak(true, f);
        } else if constexpr (std::is_same_v<T, Token::Paragraph>) {
            Frame &f = pushFrame(Frame::Block, StyleKeys::paragraph(), n.overrides);
            f.children = &n.children;
            emitBlockBreak(true, f);
        } else if constexpr (std::is_same_v<T, Token::BlockQuote>) {
            Frame &f = pushFrame(Frame::Block, StyleKeys::blockQuote(), n.overrides);
            f.children = &n.children;
            emitBlockBreak(true, f);
        } else if constexpr (std::is_same_v<T, Token::List>) {
            Frame &f = pushFrame(Frame::List, StyleKeys::list(n.ordered), n.overrides);
            f.list = &n;
            emitBlockBreak(true, f);
        } else if constexpr (std::is_same_v<T, Token::Emphasis>) {
            Frame &f = pushFrame(Frame::Inline, StyleKeys::emphasis(n.level), n.overrides);
            f.children = &n.children;
        } else if constexpr (std::is_same_v<T, Token::Link>) {
            Frame &f = pushFrame(Frame::LinkLabel, StyleKeys::link(), n.overrides);
            f.children = &n.label;
            f.url = n.url;
        } else if constexpr (std::is_same_v<T, Token::CodeBlock>) {
            Frame block;
            block.key = StyleKeys::codeBlock();
            block.style = resolve(block.key, n.overrides);
            emitBlockBreak(true, block);
            m_output.append(Styled::CodeBlock{n.language.value_or(QString()), n.content, block.style});
            emitBlockBreak(false, block);
        } else if constexpr (std::is_same_v<T, Token::Rule>) {
            Frame block;
            block.key = StyleKeys::rule();
            block.style = resolve(block.key, n.overrides);
            emitBlockBreak(true, block);
            m_output.append(Styled::Rule{block.style});
            emitBlockBreak(false, block);
        } else if constexpr (std::is_same_v<T, Token::CodeSpan>) {
            emitRun(n.content, resolve(StyleKeys::codeSpan(), n.overrides));
        } else if constexpr (std::is_same_v<T, Token::Image>) {
            const ResolvedStyle style = resolve(StyleKeys::image(), n.overrides);
            if (linkFrameIndex() >= 0) // a link label carries text only
                emitRun(n.alt.isEmpty() ? n.source : n.alt, style);
            else
                m_output.append(Styled::Image{n.source, n.alt, style});
        } else if constexpr (std::is_same_v<T, Token::Text> || std::is_same_v<T, Token::Literal>) {
            emitRun(n.content, resolve(StyleKeys::text(), n.overrides));
        } else if constexpr (std::is_same_v<T, Token::SoftBreak>) {
            emitRun(QStringLiteral(" "), resolve(StyleKeys::text(), ElementStyle()));
        }
    }, node);
}

void DocumentBuilder::enterItem(const Token::ListItem &item, int position)
{
    const bool ordered = m_frames.last().list->ordered;

    Frame &f = pushFrame(Frame::Item, StyleKeys::listItem(), item.overrides);
    f.children = &item.children;

    Styled::ListItemBegin begin;
    begin.depth = listDepth();
    begin.ordered = ordered;
    begin.number = ordered ? position : 0;
    begin.label = ordered ? QStringLiteral("%1.").arg(position) : QStringLiteral("•");
    begin.markerStyle = resolve(StyleKeys::listMarker(), ElementStyle());
    begin.itemStyle = m_frames.last().style;
    m_output.append(begin);
}

void DocumentBuilder::exitFrame()
{
    Frame frame = m_frames.takeLast();
    m_ancestry.removeLast();

    switch (frame.kind) {
    case Frame::Block:
    case Frame::List:
        emitBlockBreak(false, frame);
        break;
    case Frame::Item:
        m_output.append(Styled::ListItemEnd{listDepth()});
        break;
    case Frame::LinkLabel:
        if (labelText(frame.runs).isEmpty()) // "[](url)" shows its destination
            frame.runs = {Styled::TextRun{frame.url, frame.style}};
        m_output.append(Styled::Link{frame.url, std::move(frame.runs)});
        break;
    case Frame::Inline:
    case Frame::Root:
        break;
    }
}

QString DocumentBuilder::labelText(const QList<Styled::TextRun> &runs)
{
    QString text;
    for (const Styled::TextRun &run : runs)
        text += run.text;
    return text;
}

void DocumentBuilder::emitBlockBreak(bool opening, const Frame &frame)
{
    Styled::BlockBreak block;
    block.opening = opening;
    block.blockKey = frame.key.specific;
    block.space = opening ? frame.style.spaceBefore : frame.style.spaceAfter;
    block.style = frame.style;
    m_output.append(block);
}

void DocumentBuilder::emitRun(const QString &text, const ResolvedStyle &style)
{
    const int link = linkFrameIndex();
    if (link >= 0)
        m_frames[link].runs.append(Styled::TextRun{text, style});
    else
        m_output.append(Styled::TextRun{text, style});
}

int DocumentBuilder::linkFrameIndex() const
{
    for (int i = m_frames.size() - 1; i >= 0; --i) {
        if (m_frames.at(i).kind == Frame::LinkLabel)
            return i;
    }
    return -1;
}

int DocumentBuilder::listDepth() const
{
    int depth = 0;
    for (const Frame &frame : m_frames) {
        if (frame.kind == Frame::List)
            ++depth;
    }
    return depth;
}
