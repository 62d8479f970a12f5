/*
 * documentbuilder.h — Token::Document → Styled::Document
 *
 * Walks the token tree in document order with an explicit frame stack,
 * resolving each node's style against its ancestry as it goes, and emits
 * the flat element sequence a renderer consumes.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARKPRINT_DOCUMENTBUILDER_H
#define MARKPRINT_DOCUMENTBUILDER_H

#include <QList>
#include <QString>

#include "styledmodel.h"
#include "stylekeys.h"
#include "styleresolver.h"
#include "tokenmodel.h"

class StyleMatch;

class DocumentBuilder
{
public:
    explicit DocumentBuilder(const StyleMatch &table);

    Styled::Document build(const Token::Document &root);

private:
    struct Frame {
        enum Kind { Root, Block, Inline, LinkLabel, List, Item };
        Kind kind = Root;
        StyleKey key;
        ResolvedStyle style;
        const QList<Token::Node> *children = nullptr;
        const Token::List *list = nullptr;
        int index = 0;

        // LinkLabel frames collect their runs here
        QString url;
        QList<Styled::TextRun> runs;
    };

    void visit(const Token::Node &node);
    void enterItem(const Token::ListItem &item, int position);
    void exitFrame();

    ResolvedStyle resolve(const StyleKey &key, const ElementStyle &overrides) const;
    Frame &pushFrame(Frame::Kind kind, const StyleKey &key, const ElementStyle &overrides);
    void emitBlockBreak(bool opening, const Frame &frame);
    static QString labelText(const QList<Styled::TextRun> &runs);
    void emitRun(const QString &text, const ResolvedStyle &style);
    int linkFrameIndex() const;
    int listDepth() const;

    StyleResolver m_resolver;
    QList<Frame> m_frames;
    QList<StyleKey> m_ancestry;   // keys of m_frames, root first
    Styled::Document m_output;
};

#endif // MARKPRINT_DOCUMENTBUILDER_H
