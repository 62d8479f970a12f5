#include "stylekeys.h"

#include <algorithm>

namespace StyleKeys {

StyleKey document()   { return {QStringLiteral("document"), {}}; }
StyleKey paragraph()  { return {QStringLiteral("paragraph"), {}}; }
StyleKey codeBlock()  { return {QStringLiteral("code-block"), {}}; }
StyleKey codeSpan()   { return {QStringLiteral("code-span"), {}}; }
StyleKey link()       { return {QStringLiteral("link"), {}}; }
StyleKey image()      { return {QStringLiteral("image"), {}}; }
StyleKey listItem()   { return {QStringLiteral("list-item"), {}}; }
StyleKey listMarker() { return {QStringLiteral("list-marker"), {}}; }
StyleKey blockQuote() { return {QStringLiteral("block-quote"), {}}; }
StyleKey rule()       { return {QStringLiteral("rule"), {}}; }
StyleKey text()       { return {QStringLiteral("text"), {}}; }

StyleKey heading(int level)
{
    level = std::clamp(level, 1, 6);
    return {QStringLiteral("heading-%1").arg(level), QStringLiteral("heading")};
}

StyleKey emphasis(int level)
{
    const QString family = QStringLiteral("emphasis");
    if (level <= 1)
        return {QStringLiteral("italic"), family};
    if (level == 2)
        return {QStringLiteral("bold"), family};
    return {QStringLiteral("bold-italic"), family};
}

StyleKey list(bool ordered)
{
    return {ordered ? QStringLiteral("ordered-list") : QStringLiteral("bullet-list"),
            QStringLiteral("list")};
}

const QStringList &knownKeys()
{
    static const QStringList keys = {
        QStringLiteral("document"),
        QStringLiteral("paragraph"),
        QStringLiteral("heading"),
        QStringLiteral("heading-1"),
        QStringLiteral("heading-2"),
        QStringLiteral("heading-3"),
        QStringLiteral("heading-4"),
        QStringLiteral("heading-5"),
        QStringLiteral("heading-6"),
        QStringLiteral("emphasis"),
        QStringLiteral("italic"),
        QStringLiteral("bold"),
        QStringLiteral("bold-italic"),
        QStringLiteral("code-block"),
        QStringLiteral("code-span"),
        QStringLiteral("link"),
        QStringLiteral("image"),
        QStringLiteral("list"),
        QStringLiteral("ordered-list"),
        QStringLiteral("bullet-list"),
        QStringLiteral("list-item"),
        QStringLiteral("list-marker"),
        QStringLiteral("block-quote"),
        QStringLiteral("rule"),
        QStringLiteral("text"),
    };
    return keys;
}

bool isValidKey(const QString &key)
{
    if (key.isEmpty())
        return false;
    const QStringList segments = key.split(QLatin1Char('.'));
    return std::all_of(segments.cbegin(), segments.cend(), [](const QString &segment) {
        return knownKeys().contains(segment);
    });
}

} // namespace StyleKeys
