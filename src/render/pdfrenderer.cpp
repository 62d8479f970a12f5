/*
 * pdfrenderer.cpp — QTextCursor-based layout of styled elements
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pdfrenderer.h"
#include "codespancollector.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QFontDatabase>
#include <QImage>
#include <QPdfWriter>
#include <QTextBlockFormat>
#include <QTextDocument>
#include <QTextImageFormat>
#include <QTextLength>
#include <QUrl>

#include <type_traits>

static QFont::StyleHint guessStyleHint(const QString &family)
{
    // Check name patterns for monospace fonts
    static const char *monoPatterns[] = {
        "Mono", "Code", "Courier", "Console", "Consolas",
        "Hack", "Inconsolata", "Menlo", "Monaco", "Terminal"
    };
    for (const char *p : monoPatterns) {
        if (family.contains(QLatin1String(p), Qt::CaseInsensitive))
            return QFont::Monospace;
    }
    if (QFontDatabase::isFixedPitch(family))
        return QFont::Monospace;
    if (family.contains(QLatin1String("Serif"), Qt::CaseInsensitive))
        return QFont::Serif;
    return QFont::SansSerif;
}

static bool isIndentingBlock(const QString &key)
{
    return key == QLatin1String("ordered-list") || key == QLatin1String("bullet-list")
        || key == QLatin1String("block-quote");
}

PdfRenderer::PdfRenderer(const PageLayout &layout)
    : m_layout(layout)
{
}

QTextCharFormat PdfRenderer::charFormat(const ResolvedStyle &style)
{
    QTextCharFormat cf;
    QFont font(style.fontFamily);
    font.setStyleHint(guessStyleHint(style.fontFamily));
    font.setPointSizeF(style.fontSize);
    font.setWeight(style.fontWeight);
    font.setItalic(style.italic);
    cf.setFont(font);
    cf.setFontUnderline(style.underline);
    cf.setFontStrikeOut(style.strikeOut);
    cf.setForeground(style.foreground);
    if (style.background.isValid())
        cf.setBackground(style.background);
    return cf;
}

bool PdfRenderer::render(const Styled::Document &elements, const QString &outputPath)
{
    m_errorString.clear();

    QFile probe(outputPath);
    if (!probe.open(QIODevice::WriteOnly)) {
        m_errorString = QStringLiteral("cannot write %1: %2").arg(outputPath, probe.errorString());
        qWarning() << "PdfRenderer:" << m_errorString;
        return false;
    }
    probe.close();

    QTextDocument document;
    buildDocument(elements, &document);

    {
        QPdfWriter writer(outputPath);
        writer.setPageLayout(m_layout.toQPageLayout());
        writer.setCreator(QStringLiteral("MarkPrint"));
        document.print(&writer);
    }

    if (QFileInfo(outputPath).size() == 0) {
        m_errorString = QStringLiteral("no PDF output was written to %1").arg(outputPath);
        qWarning() << "PdfRenderer:" << m_errorString;
        return false;
    }
    return true;
}

void PdfRenderer::buildDocument(const Styled::Document &elements, QTextDocument *document)
{
    m_document = document;
    m_document->clear();
    m_cursor = QTextCursor(m_document);
    m_isFirstBlock = true;
    m_indentStack.clear();

    for (const Styled::Element &element : elements) {
        std::visit([this](const auto &e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, Styled::BlockBreak>) {
                if (e.opening)
                    openBlock(e);
                else
                    closeBlock(e);
            } else if constexpr (std::is_same_v<T, Styled::TextRun>) {
                insertRun(e);
            } else if constexpr (std::is_same_v<T, Styled::Link>) {
                for (const Styled::TextRun &run : e.runs)
                    insertRun(run, e.url);
            } else if constexpr (std::is_same_v<T, Styled::CodeBlock>) {
                insertCodeBlock(e);
            } else if constexpr (std::is_same_v<T, Styled::ListItemBegin>) {
                insertListItem(e);
            } else if constexpr (std::is_same_v<T, Styled::Image>) {
                insertImage(e);
            } else if constexpr (std::is_same_v<T, Styled::Rule>) {
                insertRule(e);
            }
            // ListItemEnd: the next block starts a new line anyway
        }, element);
    }

    m_cursor = QTextCursor();
    m_document = nullptr;
}

void PdfRenderer::ensureBlock()
{
    if (m_isFirstBlock) {
        m_isFirstBlock = false;
    } else {
        m_cursor.insertBlock();
    }
}

qreal PdfRenderer::currentIndent() const
{
    qreal indent = 0;
    for (qreal step : m_indentStack)
        indent += step;
    return indent;
}

void PdfRenderer::openBlock(const Styled::BlockBreak &brk)
{
    if (isIndentingBlock(brk.blockKey)) {
        m_indentStack.append(brk.style.indent);
        return;
    }

    ensureBlock();
    QTextBlockFormat bf;
    bf.setTopMargin(brk.space);
    bf.setAlignment(brk.style.alignment);
    bf.setLeftMargin(currentIndent());
    if (brk.blockKey.startsWith(QLatin1String("heading-")))
        bf.setHeadingLevel(brk.blockKey.mid(8).toInt());
    if (brk.style.background.isValid())
        bf.setBackground(brk.style.background);

    const QTextCharFormat cf = charFormat(brk.style);
    m_cursor.setBlockFormat(bf);
    m_cursor.setBlockCharFormat(cf);
    m_cursor.setCharFormat(cf);
}

void PdfRenderer::closeBlock(const Styled::BlockBreak &brk)
{
    if (isIndentingBlock(brk.blockKey) && !m_indentStack.isEmpty())
        m_indentStack.removeLast();

    QTextBlockFormat bf = m_cursor.blockFormat();
    bf.setBottomMargin(qMax(bf.bottomMargin(), brk.space));
    m_cursor.setBlockFormat(bf);
}

void PdfRenderer::insertRun(const Styled::TextRun &run, const QString &href)
{
    QTextCharFormat cf = charFormat(run.style);
    if (!href.isEmpty()) {
        cf.setAnchor(true);
        cf.setAnchorHref(href);
        cf.setToolTip(href);
    }
    m_cursor.insertText(run.text, cf);
}

void PdfRenderer::insertListItem(const Styled::ListItemBegin &item)
{
    ensureBlock();
    QTextBlockFormat bf;
    bf.setLeftMargin(currentIndent());
    bf.setBottomMargin(item.itemStyle.spaceAfter);
    bf.setAlignment(item.itemStyle.alignment);
    m_cursor.setBlockFormat(bf);
    m_cursor.setBlockCharFormat(charFormat(item.itemStyle));

    m_cursor.insertText(item.label + QLatin1Char(' '), charFormat(item.markerStyle));
}

void PdfRenderer::insertCodeBlock(const Styled::CodeBlock &block)
{
    QString code = block.code;
    if (code.endsWith(QLatin1Char('\n')))
        code.chop(1);

    QTextCharFormat base = charFormat(block.style);
    base.clearBackground(); // painted by the block format

    QTextBlockFormat following = m_cursor.blockFormat();
    following.setTopMargin(0);

    const int start = m_cursor.position();
    const QStringList lines = code.split(QLatin1Char('\n'));
    for (int i = 0; i < lines.size(); ++i) {
        if (i > 0)
            m_cursor.insertBlock(following, base);
        m_cursor.insertText(lines.at(i), base);
    }

    CodeSpanCollector collector;
    const auto spans = collector.highlight(code, block.language);
    for (const auto &span : spans) {
        QTextCursor c(m_document);
        c.setPosition(start + span.start);
        c.setPosition(start + span.start + span.length, QTextCursor::KeepAnchor);
        c.mergeCharFormat(span.format);
    }
}

void PdfRenderer::insertImage(const Styled::Image &image)
{
    const QImage img(image.source);
    if (img.isNull()) {
        // Remote or unreadable sources print their alt text
        insertRun(Styled::TextRun{image.alt.isEmpty() ? image.source : image.alt, image.style});
        return;
    }

    m_document->addResource(QTextDocument::ImageResource, QUrl(image.source), img);
    QTextImageFormat fmt;
    fmt.setName(image.source);

    const qreal available = m_layout.contentSizePoints().width() - currentIndent();
    if (img.width() > available && available > 0) {
        fmt.setWidth(available);
        fmt.setHeight(img.height() * available / img.width());
    }
    m_cursor.insertImage(fmt);
}

void PdfRenderer::insertRule(const Styled::Rule &rule)
{
    QTextBlockFormat bf = m_cursor.blockFormat();
    bf.setProperty(QTextFormat::BlockTrailingHorizontalRulerWidth,
                   QTextLength(QTextLength::PercentageLength, 100));
    bf.setForeground(rule.style.foreground);
    m_cursor.setBlockFormat(bf);
}
