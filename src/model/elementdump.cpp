#include "elementdump.h"

#include <type_traits>

namespace ElementDump {

static QString weightToString(QFont::Weight w)
{
    if (w == QFont::Bold)
        return QStringLiteral("bold");
    if (w == QFont::Normal)
        return QStringLiteral("normal");
    return QString::number(static_cast<int>(w));
}

static QString alignmentToString(Qt::Alignment a)
{
    if (a == Qt::AlignCenter || a == Qt::AlignHCenter)
        return QStringLiteral("center");
    if (a == Qt::AlignRight)
        return QStringLiteral("right");
    if (a == Qt::AlignJustify)
        return QStringLiteral("justify");
    return QStringLiteral("left");
}

static QJsonObject runToJson(const Styled::TextRun &run)
{
    QJsonObject obj;
    obj[QLatin1String("type")] = QStringLiteral("text");
    obj[QLatin1String("text")] = run.text;
    obj[QLatin1String("style")] = styleToJson(run.style);
    return obj;
}

QJsonObject styleToJson(const ResolvedStyle &style)
{
    QJsonObject obj;
    obj[QLatin1String("fontFamily")] = style.fontFamily;
    obj[QLatin1String("fontSize")] = style.fontSize;
    obj[QLatin1String("fontWeight")] = weightToString(style.fontWeight);
    if (style.italic)
        obj[QLatin1String("fontItalic")] = true;
    if (style.underline)
        obj[QLatin1String("underline")] = true;
    if (style.strikeOut)
        obj[QLatin1String("strikeOut")] = true;
    obj[QLatin1String("foreground")] = style.foreground.name();
    if (style.background.isValid())
        obj[QLatin1String("background")] = style.background.name();
    if (style.spaceBefore != 0)
        obj[QLatin1String("spaceBefore")] = style.spaceBefore;
    if (style.spaceAfter != 0)
        obj[QLatin1String("spaceAfter")] = style.spaceAfter;
    if (style.alignment != Qt::AlignLeft)
        obj[QLatin1String("alignment")] = alignmentToString(style.alignment);
    if (style.indent != 0)
        obj[QLatin1String("indent")] = style.indent;
    return obj;
}

QJsonArray toJson(const Styled::Document &document)
{
    QJsonArray arr;
    for (const Styled::Element &element : document) {
        QJsonObject obj = std::visit([](const auto &e) -> QJsonObject {
            using T = std::decay_t<decltype(e)>;
            QJsonObject o;
            if constexpr (std::is_same_v<T, Styled::BlockBreak>) {
                o[QLatin1String("type")] = QStringLiteral("block-break");
                o[QLatin1String("opening")] = e.opening;
                o[QLatin1String("block")] = e.blockKey;
                o[QLatin1String("space")] = e.space;
            } else if constexpr (std::is_same_v<T, Styled::TextRun>) {
                o = runToJson(e);
            } else if constexpr (std::is_same_v<T, Styled::Link>) {
                o[QLatin1String("type")] = QStringLiteral("link");
                o[QLatin1String("url")] = e.url;
                QJsonArray runs;
                for (const Styled::TextRun &run : e.runs)
                    runs.append(runToJson(run));
                o[QLatin1String("runs")] = runs;
            } else if constexpr (std::is_same_v<T, Styled::CodeBlock>) {
                o[QLatin1String("type")] = QStringLiteral("code-block");
                if (!e.language.isEmpty())
                    o[QLatin1String("language")] = e.language;
                o[QLatin1String("code")] = e.code;
                o[QLatin1String("style")] = styleToJson(e.style);
            } else if constexpr (std::is_same_v<T, Styled::ListItemBegin>) {
                o[QLatin1String("type")] = QStringLiteral("list-item-begin");
                o[QLatin1String("depth")] = e.depth;
                o[QLatin1String("ordered")] = e.ordered;
                if (e.ordered)
                    o[QLatin1String("number")] = e.number;
                o[QLatin1String("label")] = e.label;
            } else if constexpr (std::is_same_v<T, Styled::ListItemEnd>) {
                o[QLatin1String("type")] = QStringLiteral("list-item-end");
                o[QLatin1String("depth")] = e.depth;
            } else if constexpr (std::is_same_v<T, Styled::Image>) {
                o[QLatin1String("type")] = QStringLiteral("image");
                o[QLatin1String("source")] = e.source;
                o[QLatin1String("alt")] = e.alt;
            } else if constexpr (std::is_same_v<T, Styled::Rule>) {
                o[QLatin1String("type")] = QStringLiteral("rule");
                o[QLatin1String("style")] = styleToJson(e.style);
            }
            return o;
        }, element);
        arr.append(obj);
    }
    return arr;
}

} // namespace ElementDump
