#include "codespancollector.h"

#include <KSyntaxHighlighting/Definition>
#include <KSyntaxHighlighting/Format>
#include <KSyntaxHighlighting/State>
#include <KSyntaxHighlighting/Theme>

CodeSpanCollector::CodeSpanCollector()
{
    // Loading the syntax definitions is expensive; share one repository
    static KSyntaxHighlighting::Repository repo;
    m_repo = &repo;
    setTheme(repo.defaultTheme(KSyntaxHighlighting::Repository::LightTheme));
}

QList<CodeSpanCollector::Span> CodeSpanCollector::highlight(const QString &code,
                                                            const QString &language)
{
    m_spans.clear();
    m_lineOffset = 0;
    if (language.isEmpty())
        return {};

    auto def = m_repo->definitionForName(language);
    if (!def.isValid())
        def = m_repo->definitionForFileName(QStringLiteral("file.") + language);
    if (!def.isValid())
        return {};

    setDefinition(def);

    KSyntaxHighlighting::State state;
    const auto lines = code.split(QLatin1Char('\n'));
    for (const auto &line : lines) {
        state = highlightLine(line, state);
        m_lineOffset += line.size() + 1;
    }

    return m_spans;
}

void CodeSpanCollector::applyFormat(int offset, int length,
                                    const KSyntaxHighlighting::Format &format)
{
    if (length == 0 || format.isDefaultTextStyle(theme()))
        return;

    Span span;
    span.start = m_lineOffset + offset;
    span.length = length;
    if (format.hasTextColor(theme()))
        span.format.setForeground(format.textColor(theme()));
    if (format.hasBackgroundColor(theme()))
        span.format.setBackground(format.backgroundColor(theme()));
    if (format.isBold(theme()))
        span.format.setFontWeight(QFont::Bold);
    if (format.isItalic(theme()))
        span.format.setFontItalic(true);
    m_spans.append(span);
}
