#include <catch2/catch_test_macros.hpp>
#include "line_splitter.hpp"
#include "text_decoder.hpp"
#include <string>

using namespace tailf;

namespace {

std::vector<SplitLine> feed(LineSplitter& splitter, const std::string& data) {
    std::vector<SplitLine> out;
    splitter.feed(data.data(), data.size(), out);
    return out;
}

} // namespace

TEST_CASE("LineSplitter splits on newlines", "[splitter]") {
    LineSplitter splitter(1024);

    SECTION("Complete lines") {
        auto lines = feed(splitter, "one\ntwo\r\nthree\n");
        REQUIRE(lines.size() == 3);
        REQUIRE(lines[0].text == "one");
        REQUIRE(lines[1].text == "two");
        REQUIRE(lines[2].text == "three");
        REQUIRE_FALSE(splitter.has_partial());
    }

    SECTION("Partial line waits for its newline") {
        auto first = feed(splitter, "hel");
        REQUIRE(first.empty());
        REQUIRE(splitter.has_partial());

        auto second = feed(splitter, "lo\nwor");
        REQUIRE(second.size() == 1);
        REQUIRE(second[0].text == "hello");

        std::vector<SplitLine> flushed;
        REQUIRE(splitter.flush(flushed));
        REQUIRE(flushed.size() == 1);
        REQUIRE(flushed[0].text == "wor");
        REQUIRE_FALSE(splitter.flush(flushed));
    }

    SECTION("Empty lines are kept") {
        auto lines = feed(splitter, "\n\nx\n");
        REQUIRE(lines.size() == 3);
        REQUIRE(lines[0].text.empty());
        REQUIRE(lines[2].text == "x");
    }
}

TEST_CASE("LineSplitter enforces the line length limit", "[splitter]") {
    LineSplitter splitter(8);

    SECTION("Overlong line is cut and the rest dropped") {
        auto lines = feed(splitter, "0123456789abcdef\nnext\n");
        REQUIRE(lines.size() == 2);
        REQUIRE(lines[0].text == "01234567");
        REQUIRE(lines[0].truncated);
        REQUIRE(lines[1].text == "next");
        REQUIRE_FALSE(lines[1].truncated);
    }

    SECTION("Limit hit across feeds") {
        REQUIRE(feed(splitter, "01234").empty());
        auto lines = feed(splitter, "56789");
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].text == "01234567");
        REQUIRE(lines[0].truncated);

        // Remainder of the same line is discarded
        auto rest = feed(splitter, "more\nok\n");
        REQUIRE(rest.size() == 1);
        REQUIRE(rest[0].text == "ok");
    }

    SECTION("Line exactly at the limit is not truncated") {
        auto lines = feed(splitter, "01234567\n");
        REQUIRE(lines.size() == 1);
        REQUIRE_FALSE(lines[0].truncated);
    }
}

TEST_CASE("LineSplitter skip_to_next_line", "[splitter]") {
    LineSplitter splitter(1024);
    splitter.skip_to_next_line();

    auto lines = feed(splitter, "tial line\nfirst whole\n");
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].text == "first whole");

    splitter.feed("abc", 3, lines);
    splitter.reset();
    REQUIRE_FALSE(splitter.has_partial());
}

TEST_CASE("strip_ansi_codes", "[splitter]") {
    REQUIRE(strip_ansi_codes("\x1b[31mred\x1b[0m") == "red");
    REQUIRE(strip_ansi_codes("[0;32mINFO[0m started") == "INFO started");
    REQUIRE(strip_ansi_codes("array[3] stays") == "array[3] stays");
    REQUIRE(strip_ansi_codes("plain") == "plain");
}

TEST_CASE("TextDecoder", "[decoder]") {
    SECTION("UTF-8 passes through, malformed bytes are replaced") {
        TextDecoder decoder("utf-8");
        REQUIRE(decoder.is_utf8());
        REQUIRE(decoder.decode("caf\xc3\xa9") == "caf\xc3\xa9");
        REQUIRE(decoder.decode("bad\xff!") == "bad\xef\xbf\xbd!");
    }

    SECTION("Latin-1 is converted") {
        TextDecoder decoder("latin1");
        REQUIRE_FALSE(decoder.is_utf8());
        REQUIRE(decoder.decode("caf\xe9") == "caf\xc3\xa9");
    }
}
