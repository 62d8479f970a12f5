/*
 * pdfrenderer.h — Styled element sequence → QTextDocument → PDF
 *
 * Text runs become formatted fragments, links become anchors, list items
 * become indented blocks that start with their marker label, and code
 * blocks are highlighted using their language hint. Pagination and font
 * embedding are left to QTextDocument and QPdfWriter.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARKPRINT_PDFRENDERER_H
#define MARKPRINT_PDFRENDERER_H

#include <QList>
#include <QString>
#include <QTextCharFormat>
#include <QTextCursor>

#include "pagelayout.h"
#include "styledmodel.h"

class QTextDocument;

class PdfRenderer
{
public:
    explicit PdfRenderer(const PageLayout &layout = PageLayout());

    bool render(const Styled::Document &elements, const QString &outputPath);

    // Fills `document` without writing anything
    void buildDocument(const Styled::Document &elements, QTextDocument *document);

    QString errorString() const { return m_errorString; }

    static QTextCharFormat charFormat(const ResolvedStyle &style);

private:
    void ensureBlock();
    void openBlock(const Styled::BlockBreak &brk);
    void closeBlock(const Styled::BlockBreak &brk);
    void insertRun(const Styled::TextRun &run, const QString &href = QString());
    void insertListItem(const Styled::ListItemBegin &item);
    void insertCodeBlock(const Styled::CodeBlock &block);
    void insertImage(const Styled::Image &image);
    void insertRule(const Styled::Rule &rule);
    qreal currentIndent() const;

    PageLayout m_layout;
    QString m_errorString;

    QTextDocument *m_document = nullptr;
    QTextCursor m_cursor;
    bool m_isFirstBlock = true;
    QList<qreal> m_indentStack;   // lists and block quotes
};

#endif // MARKPRINT_PDFRENDERER_H
