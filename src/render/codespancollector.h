/*
 * codespancollector.h — KSyntaxHighlighting adapter for code blocks
 *
 * Runs KSyntaxHighlighting over the text of a code block and collects the
 * highlighted ranges as character formats, offsets relative to the start of
 * the block. The language tag is only a hint: an unknown language yields no
 * spans and the block is printed unhighlighted.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARKPRINT_CODESPANCOLLECTOR_H
#define MARKPRINT_CODESPANCOLLECTOR_H

#include <QList>
#include <QString>
#include <QTextCharFormat>

#include <KSyntaxHighlighting/AbstractHighlighter>
#include <KSyntaxHighlighting/Repository>

class CodeSpanCollector : public KSyntaxHighlighting::AbstractHighlighter
{
public:
    struct Span {
        int start = 0;
        int length = 0;
        QTextCharFormat format;
    };

    CodeSpanCollector();

    QList<Span> highlight(const QString &code, const QString &language);

protected:
    void applyFormat(int offset, int length,
                     const KSyntaxHighlighting::Format &format) override;

private:
    KSyntaxHighlighting::Repository *m_repo = nullptr;
    QList<Span> m_spans;
    int m_lineOffset = 0;
};

#endif // MARKPRINT_CODESPANCOLLECTOR_H
