#include "testhelpers.h"

#include <QElapsedTimer>

using TestHelpers::scan;

namespace {

QList<LexicalUnit::Kind> kinds(const QList<LexicalUnit> &units)
{
    QList<LexicalUnit::Kind> result;
    for (const LexicalUnit &unit : units)
        result.append(unit.kind);
    return result;
}

QString joinedText(const QList<LexicalUnit> &units)
{
    QString result;
    for (const LexicalUnit &unit : units) {
        if (unit.kind == LexicalUnit::Text)
            result += unit.text;
    }
    return result;
}

} // namespace

TEST_CASE("Heading markers are recognised at line start", "[scanner]")
{
    const auto units = scan(QStringLiteral("## Title\n"));
    REQUIRE(kinds(units) == QList<LexicalUnit::Kind>{
        LexicalUnit::HeadingMarker, LexicalUnit::Text, LexicalUnit::LineEnd});
    CHECK(units[0].count == 2);
    CHECK(units[1].text == QStringLiteral("Title"));
}

TEST_CASE("Heading closing sequence is stripped", "[scanner]")
{
    const auto units = scan(QStringLiteral("### Title ###"));
    REQUIRE(units.size() == 3);
    CHECK(units[1].text == QStringLiteral("Title"));
}

TEST_CASE("Hash without following space is text", "[scanner]")
{
    const auto units = scan(QStringLiteral("#hashtag"));
    REQUIRE(kinds(units) == QList<LexicalUnit::Kind>{LexicalUnit::Text, LexicalUnit::LineEnd});
    CHECK(units[0].text == QStringLiteral("#hashtag"));
}

TEST_CASE("Escaped markers become literal text", "[scanner]")
{
    const auto units = scan(QStringLiteral("\\*not emphasis\\* \\[x\\]"));
    REQUIRE(kinds(units) == QList<LexicalUnit::Kind>{LexicalUnit::Text, LexicalUnit::LineEnd});
    CHECK(units[0].text == QStringLiteral("*not emphasis* [x]"));
}

TEST_CASE("Backslash before an ordinary character is kept", "[scanner]")
{
    const auto units = scan(QStringLiteral("C:\\path"));
    CHECK(units[0].text == QStringLiteral("C:\\path"));
}

TEST_CASE("Emphasis runs carry flanking information", "[scanner]")
{
    SECTION("surrounded by spaces neither opens nor closes") {
        const auto units = scan(QStringLiteral("a * b"));
        REQUIRE(units.size() == 4);
        CHECK(units[1].kind == LexicalUnit::EmphasisMarker);
        CHECK_FALSE(units[1].canOpen);
        CHECK_FALSE(units[1].canClose);
    }
    SECTION("run length and direction") {
        const auto units = scan(QStringLiteral("**bold**"));
        REQUIRE(units.size() == 4);
        CHECK(units[0].count == 2);
        CHECK(units[0].canOpen);
        CHECK_FALSE(units[0].canClose);
        CHECK(units[2].canClose);
        CHECK_FALSE(units[2].canOpen);
    }
    SECTION("intraword underscores stay inert") {
        const auto units = scan(QStringLiteral("snake_case_name"));
        for (const LexicalUnit &unit : units) {
            if (unit.kind == LexicalUnit::EmphasisMarker) {
                CHECK_FALSE(unit.canOpen);
                CHECK_FALSE(unit.canClose);
            }
        }
    }
}

TEST_CASE("Code spans are delimited by equal backtick runs", "[scanner]")
{
    const auto units = scan(QStringLiteral("use `x*y` here"));
    REQUIRE(kinds(units) == QList<LexicalUnit::Kind>{
        LexicalUnit::Text, LexicalUnit::CodeSpanMarker, LexicalUnit::RawText,
        LexicalUnit::CodeSpanMarker, LexicalUnit::Text, LexicalUnit::LineEnd});
    CHECK(units[2].text == QStringLiteral("x*y"));

    SECTION("double backticks allow a single one inside") {
        const auto u = scan(QStringLiteral("`` a`b ``"));
        REQUIRE(u.size() == 4);
        CHECK(u[1].text == QStringLiteral("a`b"));
    }
    SECTION("an unmatched backtick is text") {
        const auto u = scan(QStringLiteral("a `b"));
        REQUIRE(kinds(u) == QList<LexicalUnit::Kind>{LexicalUnit::Text, LexicalUnit::LineEnd});
        CHECK(u[0].text == QStringLiteral("a `b"));
    }
    SECTION("runs of other lengths are skipped") {
        const auto u = scan(QStringLiteral("`a ``b`` c` d"));
        REQUIRE(kinds(u) == QList<LexicalUnit::Kind>{
            LexicalUnit::CodeSpanMarker, LexicalUnit::RawText, LexicalUnit::CodeSpanMarker,
            LexicalUnit::Text, LexicalUnit::LineEnd});
        CHECK(u[1].text == QStringLiteral("a ``b`` c"));
    }
    SECTION("each line pairs its own runs") {
        const auto u = scan(QStringLiteral("a `b\nc` d"));
        CHECK(kinds(u).count(LexicalUnit::CodeSpanMarker) == 0);
        CHECK(joinedText(u) == QStringLiteral("a `bc` d"));
    }
}

TEST_CASE("Fenced code lines are emitted verbatim", "[scanner]")
{
    const auto units = scan(QStringLiteral("```rust\nlet *x* = 1;\n```\n"));
    REQUIRE(kinds(units) == QList<LexicalUnit::Kind>{
        LexicalUnit::CodeFence, LexicalUnit::RawText, LexicalUnit::CodeFence});
    CHECK(units[0].info == QStringLiteral("rust"));
    CHECK(units[0].canOpen);
    CHECK(units[1].text == QStringLiteral("let *x* = 1;\n"));
    CHECK_FALSE(units[2].canOpen);
}

TEST_CASE("A shorter fence does not close a longer one", "[scanner]")
{
    const auto units = scan(QStringLiteral("````\n```\n````"));
    REQUIRE(kinds(units) == QList<LexicalUnit::Kind>{
        LexicalUnit::CodeFence, LexicalUnit::RawText, LexicalUnit::CodeFence});
    CHECK(units[1].text == QStringLiteral("```\n"));
}

TEST_CASE("Link brackets and targets", "[scanner]")
{
    const auto units = scan(QStringLiteral("[a](http://x.org \"title\")"));
    REQUIRE(kinds(units) == QList<LexicalUnit::Kind>{
        LexicalUnit::LinkBracket, LexicalUnit::Text, LexicalUnit::LinkBracket,
        LexicalUnit::LinkTarget, LexicalUnit::LineEnd});
    CHECK(units[3].info == QStringLiteral("http://x.org"));
    CHECK(units[3].text == QStringLiteral("(http://x.org \"title\")"));

    SECTION("image opener") {
        const auto u = scan(QStringLiteral("![alt](a.png)"));
        CHECK(u[0].image);
        CHECK(u[0].text == QStringLiteral("!["));
    }
    SECTION("angle-bracket destination") {
        const auto u = scan(QStringLiteral("[a](<x y>)"));
        CHECK(u[3].info == QStringLiteral("x y"));
    }
    SECTION("missing closing paren leaves the parenthesis as text") {
        const auto u = scan(QStringLiteral("[a](b"));
        REQUIRE(kinds(u) == QList<LexicalUnit::Kind>{
            LexicalUnit::LinkBracket, LexicalUnit::Text, LexicalUnit::LinkBracket,
            LexicalUnit::Text, LexicalUnit::LineEnd});
        CHECK(u[3].text == QStringLiteral("(b"));
    }
    SECTION("an unbalanced parenthesis does not hide a later target") {
        const auto u = scan(QStringLiteral("[a](x(y) [b](z)"));
        REQUIRE(kinds(u).count(LexicalUnit::LinkTarget) == 1);
        CHECK(u.at(u.size() - 2).info == QStringLiteral("z"));
    }
    SECTION("nested parentheses stay inside the destination") {
        const auto u = scan(QStringLiteral("[a](f(1)) (b)"));
        REQUIRE(u.size() == 6);
        CHECK(u[3].info == QStringLiteral("f(1)"));
        CHECK(u[4].text == QStringLiteral(" (b)"));
    }
}

TEST_CASE("HTML comments are dropped", "[scanner]")
{
    SECTION("within a line") {
        const auto units = scan(QStringLiteral("a<!-- hidden -->b"));
        CHECK(joinedText(units) == QStringLiteral("ab"));
    }
    SECTION("across lines") {
        const auto units = scan(QStringLiteral("a <!--\nx\n--> b\nc"));
        CHECK(joinedText(units) == QStringLiteral("a  bc"));
        CHECK(kinds(units).count(LexicalUnit::LineEnd) == 2);
    }
    SECTION("unterminated comment stays literal") {
        const auto units = scan(QStringLiteral("a <!-- b"));
        CHECK(joinedText(units) == QStringLiteral("a <!-- b"));
    }
    SECTION("a closed comment before an unterminated one") {
        CHECK(joinedText(scan(QStringLiteral("a<!--x-->b<!--c"))) == QStringLiteral("ab<!--c"));
        CHECK(joinedText(scan(QStringLiteral("a<!--b\nc<!--d-->e"))) == QStringLiteral("ae"));
    }
}

TEST_CASE("Unclosed constructs scan in linear time", "[scanner]")
{
    QElapsedTimer timer;
    timer.start();

    SECTION("comment openers") {
        const QString text = QStringLiteral("<!--").repeated(100000);
        CHECK(joinedText(scan(text)) == text);
    }
    SECTION("link closers without a target") {
        const QString text = QStringLiteral("](").repeated(100000);
        const auto units = scan(text);
        CHECK(kinds(units).count(LexicalUnit::LinkTarget) == 0);
        CHECK(joinedText(units) == QStringLiteral("(").repeated(100000));
    }
    SECTION("backtick runs of distinct lengths") {
        QString text;
        for (int n = 1; n <= 400; ++n)
            text += QString(n, QLatin1Char('`')) + QLatin1Char('a');
        const auto units = scan(text);
        CHECK(kinds(units).count(LexicalUnit::CodeSpanMarker) == 0);
        CHECK(joinedText(units) == text);
    }

    CHECK(timer.elapsed() < 5000);
}

TEST_CASE("List markers", "[scanner]")
{
    SECTION("bullet") {
        const auto units = scan(QStringLiteral("- item"));
        REQUIRE(units.size() == 3);
        CHECK(units[0].kind == LexicalUnit::ListMarker);
        CHECK_FALSE(units[0].ordered);
        CHECK(units[0].indent == 0);
    }
    SECTION("ordered with indentation") {
        const auto units = scan(QStringLiteral("  3. third"));
        REQUIRE(units[0].kind == LexicalUnit::ListMarker);
        CHECK(units[0].ordered);
        CHECK(units[0].count == 3);
        CHECK(units[0].indent == 2);
        CHECK(units[1].text == QStringLiteral("third"));
    }
    SECTION("not a marker without a following space") {
        CHECK(scan(QStringLiteral("-not"))[0].kind == LexicalUnit::Text);
        CHECK(scan(QStringLiteral("1.5 apples"))[0].kind == LexicalUnit::Text);
    }
}

TEST_CASE("Line-level constructs", "[scanner]")
{
    CHECK(scan(QStringLiteral("* * *"))[0].kind == LexicalUnit::ThematicBreak);
    CHECK(scan(QStringLiteral("---"))[0].kind == LexicalUnit::ThematicBreak);
    CHECK(scan(QStringLiteral("   \n"))[0].kind == LexicalUnit::BlankLine);

    const auto quote = scan(QStringLiteral("> hi"));
    REQUIRE(kinds(quote) == QList<LexicalUnit::Kind>{
        LexicalUnit::QuoteMarker, LexicalUnit::Text, LexicalUnit::LineEnd});
    CHECK(quote[1].text == QStringLiteral("hi"));
}

TEST_CASE("CRLF line endings are tolerated", "[scanner]")
{
    const auto units = scan(QStringLiteral("a\r\nb\r\n"));
    REQUIRE(kinds(units) == QList<LexicalUnit::Kind>{
        LexicalUnit::Text, LexicalUnit::LineEnd, LexicalUnit::Text, LexicalUnit::LineEnd});
    CHECK(units[0].text == QStringLiteral("a"));
    CHECK(units[2].text == QStringLiteral("b"));
}

TEST_CASE("Unpaired surrogates are malformed input", "[scanner]")
{
    QString text = QStringLiteral("ok ");
    text.append(QChar(0xD800));
    text.append(QStringLiteral(" tail"));

    Scanner scanner;
    const auto units = scanner.scan(text);
    CHECK(scanner.hasError());
    CHECK_FALSE(scanner.errorString().isEmpty());
    CHECK(units.isEmpty());
}

TEST_CASE("Offsets point into the source", "[scanner]")
{
    const QString source = QStringLiteral("ab *cd*");
    const auto units = scan(source);
    for (const LexicalUnit &unit : units) {
        if (unit.kind == LexicalUnit::EmphasisMarker)
            CHECK(source.mid(unit.offset, unit.count) == QStringLiteral("*"));
    }
}
