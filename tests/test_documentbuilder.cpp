#include "testhelpers.h"

#include "converter.h"
#include "documentbuilder.h"
#include "stylematch.h"

namespace {

Styled::Document build(const char *markdown, const StyleMatch &table = StyleMatch())
{
    Token::Document tokens;
    QString error;
    REQUIRE(Converter::parse(QString::fromUtf8(markdown), &tokens, &error));
    DocumentBuilder builder(table);
    return builder.build(tokens);
}

template<typename T>
QList<T> elementsOf(const Styled::Document &document)
{
    QList<T> result;
    for (const Styled::Element &element : document) {
        if (const auto *e = std::get_if<T>(&element))
            result.append(*e);
    }
    return result;
}

QStringList runTexts(const Styled::Document &document)
{
    QStringList result;
    for (const Styled::TextRun &run : elementsOf<Styled::TextRun>(document))
        result << run.text;
    return result;
}

ElementStyle foreground(const QColor &color)
{
    ElementStyle s;
    s.setForeground(color);
    return s;
}

} // namespace

TEST_CASE("A paragraph is framed by block breaks", "[documentbuilder]")
{
    const Styled::Document doc = build("hello");
    REQUIRE(doc.size() == 3);

    const auto &open = std::get<Styled::BlockBreak>(doc.at(0));
    CHECK(open.opening);
    CHECK(open.blockKey == QStringLiteral("paragraph"));

    const auto &run = std::get<Styled::TextRun>(doc.at(1));
    CHECK(run.text == QStringLiteral("hello"));
    CHECK(run.style.fontFamily == QStringLiteral("Noto Serif"));

    const auto &close = std::get<Styled::BlockBreak>(doc.at(2));
    CHECK_FALSE(close.opening);
    CHECK(close.space == 6);
}

TEST_CASE("Headings carry their level's style", "[documentbuilder]")
{
    const Styled::Document doc = build("## Title");
    REQUIRE(doc.size() == 3);
    CHECK(std::get<Styled::BlockBreak>(doc.at(0)).blockKey == QStringLiteral("heading-2"));

    const auto &run = std::get<Styled::TextRun>(doc.at(1));
    CHECK(run.style.fontSize == 20);
    CHECK(run.style.fontWeight == QFont::Bold);
}

TEST_CASE("Emphasis levels map to italic, bold and bold-italic", "[documentbuilder]")
{
    const auto runs = elementsOf<Styled::TextRun>(build("*i* **b** ***bi***"));
    REQUIRE(runs.size() == 5);

    CHECK(runs.at(0).style.italic);
    CHECK(runs.at(0).style.fontWeight == QFont::Normal);
    CHECK_FALSE(runs.at(2).style.italic);
    CHECK(runs.at(2).style.fontWeight == QFont::Bold);
    CHECK(runs.at(4).style.italic);
    CHECK(runs.at(4).style.fontWeight == QFont::Bold);

    const auto nested = elementsOf<Styled::TextRun>(build("**bold *and italic* text**"));
    REQUIRE(nested.size() == 3);
    CHECK(nested.at(1).text == QStringLiteral("and italic"));
    CHECK(nested.at(1).style.italic);
    CHECK(nested.at(1).style.fontWeight == QFont::Bold);

    const auto siblings = elementsOf<Styled::TextRun>(build("*a **b** c **d** e*"));
    REQUIRE(siblings.size() == 5);
    for (int i : {0, 2, 4}) {
        CHECK(siblings.at(i).style.italic);
        CHECK(siblings.at(i).style.fontWeight == QFont::Normal);
    }
    for (int i : {1, 3}) {
        CHECK(siblings.at(i).style.italic);
        CHECK(siblings.at(i).style.fontWeight == QFont::Bold);
    }
    CHECK(siblings.at(3).text == QStringLiteral("d"));
}

TEST_CASE("A link keeps its URL and label together", "[documentbuilder]")
{
    const Styled::Document doc = build("[click *here*](http://a.b) after");

    const auto links = elementsOf<Styled::Link>(doc);
    REQUIRE(links.size() == 1);
    CHECK(links.first().url == QStringLiteral("http://a.b"));
    REQUIRE(links.first().runs.size() == 2);
    CHECK(links.first().runs.at(0).text == QStringLiteral("click "));
    CHECK(links.first().runs.at(0).style.underline);
    CHECK(links.first().runs.at(1).text == QStringLiteral("here"));
    CHECK(links.first().runs.at(1).style.italic);

    // Label text never leaks out as a free-standing run
    CHECK(runTexts(doc) == QStringList{QStringLiteral(" after")});

    SECTION("an empty label shows the destination") {
        const auto empty = elementsOf<Styled::Link>(build("[](http://a.b)"));
        REQUIRE(empty.size() == 1);
        REQUIRE(empty.first().runs.size() == 1);
        CHECK(empty.first().runs.first().text == QStringLiteral("http://a.b"));
    }
    SECTION("an image inside a label contributes its alt text") {
        const Styled::Document d = build("[![logo](i.png)](http://a.b)");
        CHECK(elementsOf<Styled::Image>(d).isEmpty());
        const auto l = elementsOf<Styled::Link>(d);
        REQUIRE(l.size() == 1);
        REQUIRE(l.first().runs.size() == 1);
        CHECK(l.first().runs.first().text == QStringLiteral("logo"));
    }
    SECTION("an image without alt text contributes its source") {
        const auto l = elementsOf<Styled::Link>(build("[![](i.png)](http://a.b)"));
        REQUIRE(l.size() == 1);
        REQUIRE(l.first().runs.size() == 1);
        CHECK(l.first().runs.first().text == QStringLiteral("i.png"));
    }
    SECTION("a label of empty runs falls back to the destination") {
        Token::Link link;
        link.url = QStringLiteral("http://a.b");
        link.label.append(Token::Text{QString(), {}});
        Token::Paragraph paragraph;
        paragraph.children.append(link);
        Token::Document tokens;
        tokens.blocks.append(paragraph);

        const StyleMatch table;
        DocumentBuilder builder(table);
        const auto l = elementsOf<Styled::Link>(builder.build(tokens));
        REQUIRE(l.size() == 1);
        REQUIRE(l.first().runs.size() == 1);
        CHECK(l.first().runs.first().text == QStringLiteral("http://a.b"));
    }
}

TEST_CASE("Ordered list numbering restarts per list", "[documentbuilder]")
{
    const auto items = elementsOf<Styled::ListItemBegin>(
        build("1. a\n2. b\n\nbetween\n\n1. c\n2. d"));
    REQUIRE(items.size() == 4);
    CHECK(items.at(0).number == 1);
    CHECK(items.at(1).number == 2);
    CHECK(items.at(2).number == 1);
    CHECK(items.at(3).number == 2);
    CHECK(items.at(1).label == QStringLiteral("2."));

    SECTION("source numbers are not copied") {
        const auto renumbered = elementsOf<Styled::ListItemBegin>(build("3. x\n4. y"));
        REQUIRE(renumbered.size() == 2);
        CHECK(renumbered.at(0).number == 1);
        CHECK(renumbered.at(1).label == QStringLiteral("2."));
    }
    SECTION("bullets have no number") {
        const auto bullets = elementsOf<Styled::ListItemBegin>(build("- x"));
        REQUIRE(bullets.size() == 1);
        CHECK_FALSE(bullets.first().ordered);
        CHECK(bullets.first().number == 0);
        CHECK(bullets.first().label == QStringLiteral("•"));
    }
}

TEST_CASE("Nested list items are bracketed by depth", "[documentbuilder]")
{
    const Styled::Document doc = build("- a\n  - b");

    QStringList shape;
    for (const Styled::Element &element : doc) {
        if (const auto *b = std::get_if<Styled::BlockBreak>(&element))
            shape << (b->opening ? QStringLiteral("(") : QStringLiteral(")"));
        else if (const auto *begin = std::get_if<Styled::ListItemBegin>(&element))
            shape << QStringLiteral("B%1").arg(begin->depth);
        else if (const auto *end = std::get_if<Styled::ListItemEnd>(&element))
            shape << QStringLiteral("E%1").arg(end->depth);
        else if (const auto *run = std::get_if<Styled::TextRun>(&element))
            shape << run->text;
    }
    CHECK(shape.join(QLatin1Char(' ')) == QStringLiteral("( B1 a ( B2 b E2 ) E1 )"));
}

TEST_CASE("Code blocks, rules and images", "[documentbuilder]")
{
    SECTION("code block") {
        const Styled::Document doc = build("```py\nprint(1)\n```");
        REQUIRE(doc.size() == 3);
        CHECK(std::get<Styled::BlockBreak>(doc.at(0)).blockKey == QStringLiteral("code-block"));
        const auto &code = std::get<Styled::CodeBlock>(doc.at(1));
        CHECK(code.language == QStringLiteral("py"));
        CHECK(code.code == QStringLiteral("print(1)\n"));
        CHECK(code.style.fontFamily == QStringLiteral("JetBrains Mono"));
    }
    SECTION("rule") {
        const Styled::Document doc = build("---");
        REQUIRE(doc.size() == 3);
        CHECK(std::holds_alternative<Styled::Rule>(doc.at(1)));
    }
    SECTION("image") {
        const auto images = elementsOf<Styled::Image>(build("![alt text](pic.png)"));
        REQUIRE(images.size() == 1);
        CHECK(images.first().source == QStringLiteral("pic.png"));
        CHECK(images.first().alt == QStringLiteral("alt text"));
    }
}

TEST_CASE("Soft breaks become spaces", "[documentbuilder]")
{
    CHECK(runTexts(build("a\nb")) == QStringList{QStringLiteral("a"), QStringLiteral(" "),
                                                 QStringLiteral("b")});
}

TEST_CASE("Block quotes pass character style to their paragraphs", "[documentbuilder]")
{
    const Styled::Document doc = build("> q");
    REQUIRE(doc.size() == 5);
    CHECK(std::get<Styled::BlockBreak>(doc.at(0)).blockKey == QStringLiteral("block-quote"));
    CHECK(std::get<Styled::BlockBreak>(doc.at(1)).blockKey == QStringLiteral("paragraph"));
    CHECK(std::get<Styled::TextRun>(doc.at(2)).style.foreground == QColor(0x55, 0x55, 0x55));
}

TEST_CASE("Composite table entries reach the output", "[documentbuilder]")
{
    const QColor green(0, 255, 0);
    StyleMatch table;
    table.setStyle(QStringLiteral("list-item.italic"), foreground(green));
    table.setStyle(QStringLiteral("list-marker"), foreground(Qt::red));

    const auto inList = elementsOf<Styled::TextRun>(build("- *x*", table));
    REQUIRE(inList.size() == 1);
    CHECK(inList.first().style.foreground == green);

    const auto items = elementsOf<Styled::ListItemBegin>(build("- *x*", table));
    REQUIRE(items.size() == 1);
    CHECK(items.first().markerStyle.foreground == QColor(Qt::red));

    const auto outside = elementsOf<Styled::TextRun>(build("*x*", table));
    REQUIRE(outside.size() == 1);
    CHECK(outside.first().style.foreground == QColor(0x1a, 0x1a, 0x1a));
}

TEST_CASE("Token overrides win over the table", "[documentbuilder]")
{
    StyleMatch table;
    table.setStyle(QStringLiteral("text"), foreground(QColor(0, 0, 255)));

    Token::Paragraph paragraph;
    paragraph.children.append(Token::Text{QStringLiteral("plain"), {}});
    paragraph.children.append(Token::Text{QStringLiteral("red"), foreground(QColor(255, 0, 0))});
    Token::Document tokens;
    tokens.blocks.append(paragraph);

    DocumentBuilder builder(table);
    const auto runs = elementsOf<Styled::TextRun>(builder.build(tokens));
    REQUIRE(runs.size() == 2);
    CHECK(runs.at(0).style.foreground == QColor(0, 0, 255));
    CHECK(runs.at(1).style.foreground == QColor(255, 0, 0));
}

TEST_CASE("An empty document yields no elements", "[documentbuilder]")
{
    CHECK(build("").isEmpty());
    CHECK(build("\n\n   \n").isEmpty());
}
