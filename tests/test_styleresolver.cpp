#include "testhelpers.h"

#include "stylekeys.h"
#include "stylematch.h"
#include "styleresolver.h"

namespace {

ElementStyle foreground(const QColor &color)
{
    ElementStyle s;
    s.setForeground(color);
    return s;
}

ElementStyle fontSize(qreal pts)
{
    ElementStyle s;
    s.setFontSize(pts);
    return s;
}

const QColor red(255, 0, 0);
const QColor green(0, 255, 0);
const QColor blue(0, 0, 255);
const QColor yellow(255, 255, 0);

// document > bullet-list > list-item
QList<StyleKey> itemAncestry()
{
    return {StyleKeys::document(), StyleKeys::list(false), StyleKeys::listItem()};
}

} // namespace

TEST_CASE("Style keys", "[styleresolver]")
{
    CHECK(StyleKeys::heading(2).specific == QStringLiteral("heading-2"));
    CHECK(StyleKeys::heading(9).specific == QStringLiteral("heading-6"));
    CHECK(StyleKeys::emphasis(1).specific == QStringLiteral("italic"));
    CHECK(StyleKeys::emphasis(2).specific == QStringLiteral("bold"));
    CHECK(StyleKeys::emphasis(5).specific == QStringLiteral("bold-italic"));
    CHECK(StyleKeys::list(true).family == QStringLiteral("list"));

    CHECK(StyleKeys::isValidKey(QStringLiteral("list-item.emphasis")));
    CHECK(StyleKeys::isValidKey(QStringLiteral("heading")));
    CHECK_FALSE(StyleKeys::isValidKey(QStringLiteral("table")));
    CHECK_FALSE(StyleKeys::isValidKey(QStringLiteral("list-item.")));
    CHECK_FALSE(StyleKeys::isValidKey(QString()));
}

TEST_CASE("Built-in defaults apply without a table", "[styleresolver]")
{
    const StyleMatch table;
    const StyleResolver resolver(table);

    const ResolvedStyle heading = resolver.resolve(StyleKeys::heading(1), {StyleKeys::document()});
    CHECK(heading.fontSize == 24);
    CHECK(heading.fontWeight == QFont::Bold);
    CHECK(heading.fontFamily == QStringLiteral("Noto Serif"));

    const ResolvedStyle code = resolver.resolve(StyleKeys::codeBlock(), {StyleKeys::document()});
    CHECK(code.fontFamily == QStringLiteral("JetBrains Mono"));
    CHECK(code.background.isValid());
}

TEST_CASE("Specific entries beat family entries", "[styleresolver]")
{
    StyleMatch table;
    table.setStyle(QStringLiteral("heading"), fontSize(10));
    table.setStyle(QStringLiteral("heading-2"), fontSize(20));
    table.setStyle(QStringLiteral("emphasis"), foreground(red));
    const StyleResolver resolver(table);

    const QList<StyleKey> root{StyleKeys::document()};
    CHECK(resolver.resolve(StyleKeys::heading(2), root).fontSize == 20);
    CHECK(resolver.resolve(StyleKeys::heading(4), root).fontSize == 10);
    CHECK(resolver.resolve(StyleKeys::emphasis(3), root).foreground == red);
}

TEST_CASE("Composite entries beat plain entries", "[styleresolver]")
{
    StyleMatch table;
    table.setStyle(QStringLiteral("bold"), foreground(blue));
    table.setStyle(QStringLiteral("list-item.bold"), foreground(green));
    const StyleResolver resolver(table);

    CHECK(resolver.resolve(StyleKeys::emphasis(2), itemAncestry()).foreground == green);

    SECTION("only when the ancestry matches") {
        const QList<StyleKey> paragraph{StyleKeys::document(), StyleKeys::paragraph()};
        CHECK(resolver.resolve(StyleKeys::emphasis(2), paragraph).foreground == blue);
    }
    SECTION("ancestors need not be adjacent") {
        QList<StyleKey> deeper = itemAncestry();
        deeper.append(StyleKeys::emphasis(1));
        CHECK(resolver.resolve(StyleKeys::emphasis(2), deeper).foreground == green);
    }
}

TEST_CASE("Composite keys may use family segments", "[styleresolver]")
{
    StyleMatch table;
    table.setStyle(QStringLiteral("list.emphasis"), foreground(red));
    const StyleResolver resolver(table);

    CHECK(resolver.resolve(StyleKeys::emphasis(1), itemAncestry()).foreground == red);
}

TEST_CASE("The most specific composite wins", "[styleresolver]")
{
    StyleMatch table;
    table.setStyle(QStringLiteral("list-item.bold"), foreground(red));
    table.setStyle(QStringLiteral("bullet-list.list-item.bold"), foreground(green));
    table.setStyle(QStringLiteral("list.bold"), foreground(blue));
    const StyleResolver resolver(table);

    CHECK(resolver.resolve(StyleKeys::emphasis(2), itemAncestry()).foreground == green);

    QString matched;
    table.bestComposite(StyleKeys::emphasis(2), itemAncestry(), &matched);
    CHECK(matched == QStringLiteral("bullet-list.list-item.bold"));

    SECTION("specific segments beat family segments at equal length") {
        StyleMatch t;
        t.setStyle(QStringLiteral("list.bold"), foreground(blue));
        t.setStyle(QStringLiteral("bullet-list.bold"), foreground(yellow));
        CHECK(StyleResolver(t).resolve(StyleKeys::emphasis(2), itemAncestry()).foreground == yellow);
    }
}

TEST_CASE("Inline overrides have the final word", "[styleresolver]")
{
    StyleMatch table;
    table.setStyle(QStringLiteral("list-item.bold"), foreground(green));
    const StyleResolver resolver(table);

    CHECK(resolver.resolve(StyleKeys::emphasis(2), itemAncestry(), foreground(yellow)).foreground
          == yellow);
}

TEST_CASE("Character properties inherit, block properties do not", "[styleresolver]")
{
    StyleMatch table;
    table.setStyle(QStringLiteral("bold"), fontSize(9));
    const StyleResolver resolver(table);

    const QList<StyleKey> inHeading{StyleKeys::document(), StyleKeys::heading(1)};

    // Nested sizes replace, they do not add up
    CHECK(resolver.resolve(StyleKeys::emphasis(2), inHeading).fontSize == 9);

    const ResolvedStyle italic = resolver.resolve(StyleKeys::emphasis(1), inHeading);
    CHECK(italic.fontSize == 24);
    CHECK(italic.fontWeight == QFont::Bold);
    CHECK(italic.italic);
    CHECK(italic.spaceBefore == 0);

    const QList<StyleKey> inParagraph{StyleKeys::document(), StyleKeys::paragraph()};
    CHECK(resolver.resolve(StyleKeys::text(), inParagraph).spaceAfter == 0);
}

TEST_CASE("Resolution is deterministic and read-only", "[styleresolver]")
{
    StyleMatch table;
    table.setStyle(QStringLiteral("list-item.italic"), foreground(red));
    table.setStyle(QStringLiteral("list-item"), fontSize(13));
    const StyleResolver resolver(table);

    QList<StyleKey> ancestry = itemAncestry();
    const ResolvedStyle first = resolver.resolve(StyleKeys::emphasis(1), ancestry);
    const ResolvedStyle second = resolver.resolve(StyleKeys::emphasis(1), ancestry);
    CHECK(first == second);
    CHECK(table.count() == 2);

    SECTION("resolving step by step gives the same result") {
        const ResolvedStyle doc = resolver.resolveChild(nullptr, StyleKeys::document(), {});
        const ResolvedStyle list = resolver.resolveChild(&doc, StyleKeys::list(false),
                                                         {StyleKeys::document()});
        const ResolvedStyle item = resolver.resolveChild(
            &list, StyleKeys::listItem(), {StyleKeys::document(), StyleKeys::list(false)});
        const ResolvedStyle italic = resolver.resolveChild(&item, StyleKeys::emphasis(1), ancestry);
        CHECK(italic == first);
        CHECK(italic.fontSize == 13);
        CHECK(italic.foreground == red);
    }
}
