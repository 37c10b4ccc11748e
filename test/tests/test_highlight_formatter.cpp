#include <gtest/gtest.h>
#include "prism_con.hpp"
#include "utils/test_utils.hpp"

using prism::HighlightFormatter;
using prism::KeywordLayer;
using prism::WordColourMap;

class HighlightFormatterTest : public ::testing::Test {
protected:
    HighlightFormatterTest() : p(prism::Palette::make(true)) {}

    std::string format(const std::string &text, const std::string &colour,
                       const std::vector<KeywordLayer> &layers) {
        return HighlightFormatter::format(text, colour, layers, p, "|");
    }

    prism::Palette p;
};

TEST_F(HighlightFormatterTest, DisabledPaletteReturnsTextUnchanged) {
    prism::Palette plain = prism::Palette::make(false);
    WordColourMap words;
    words["STAT"] = "";
    std::vector<KeywordLayer> layers(1, KeywordLayer(&words, plain.highlight));
    EXPECT_EQ(HighlightFormatter::format("a|STAT|b\n", plain.dull, layers, plain, "|"),
              "a|STAT|b\n");
}

TEST_F(HighlightFormatterTest, PlainTextGetsMessageColour) {
    EXPECT_EQ(format("hello\n", p.dull, std::vector<KeywordLayer>()),
              p.none + p.dull + "hello\n");
}

TEST_F(HighlightFormatterTest, KeywordGetsItsColour) {
    WordColourMap words;
    words["STAT"] = p.stat;
    std::vector<KeywordLayer> layers(1, KeywordLayer(&words, p.highlight));
    EXPECT_EQ(format("abc STAT def", p.dull, layers),
              p.none + p.dull + "abc " + p.none + p.stat + "STAT" + p.none + p.dull + " def");
}

TEST_F(HighlightFormatterTest, EmptyColourUsesLayerDefault) {
    WordColourMap words;
    words["key"] = "";
    std::vector<KeywordLayer> layers(1, KeywordLayer(&words, p.lowlight));
    EXPECT_EQ(format("a key", p.user, layers),
              p.none + p.user + "a " + p.none + p.lowlight + "key" + p.none + p.user + "");
}

TEST_F(HighlightFormatterTest, SeparatorUsesDisabledColour) {
    EXPECT_EQ(format("a|b", p.dull, std::vector<KeywordLayer>()),
              p.none + p.dull + "a" + p.none + p.disabled + "|" + p.none + p.dull + "b");
}

TEST_F(HighlightFormatterTest, WordAsLongAsTextIsIgnored) {
    WordColourMap words;
    words["STAT"] = p.stat;
    std::vector<KeywordLayer> layers(1, KeywordLayer(&words, p.highlight));
    EXPECT_EQ(format("STAT", p.dull, layers), p.none + p.dull + "STAT");
}

TEST_F(HighlightFormatterTest, EmptyKeywordIsIgnored) {
    WordColourMap words;
    words[""] = p.error;
    std::vector<KeywordLayer> layers(1, KeywordLayer(&words, p.highlight));
    EXPECT_EQ(format("text", p.dull, layers), p.none + p.dull + "text");
}

TEST_F(HighlightFormatterTest, EarlierLayerWins) {
    WordColourMap first;
    first["foo"] = "";
    WordColourMap second;
    second["foo"] = p.error;
    std::vector<KeywordLayer> layers;
    layers.push_back(KeywordLayer(&first, p.highlight));
    layers.push_back(KeywordLayer(&second, p.highlight));
    EXPECT_EQ(format("x foo", p.dull, layers),
              p.none + p.dull + "x " + p.none + p.highlight + "foo" + p.none + p.dull + "");
}

TEST_F(HighlightFormatterTest, LongestKeywordFirstAndMatchesNotResplit) {
    WordColourMap words;
    words["foo"] = p.lowlight;
    words["foobar"] = p.highlight;
    std::vector<KeywordLayer> layers(1, KeywordLayer(&words, p.highlight));
    EXPECT_EQ(format("foobar foo!", p.dull, layers),
              p.none + p.dull + "" +
              p.none + p.highlight + "foobar" +
              p.none + p.dull + " " +
              p.none + p.lowlight + "foo" +
              p.none + p.dull + "!");
}

TEST_F(HighlightFormatterTest, RepeatedKeyword) {
    WordColourMap words;
    words["ab"] = p.error;
    std::vector<KeywordLayer> layers(1, KeywordLayer(&words, p.highlight));
    std::string out = format("ab ab", p.dull, layers);
    EXPECT_EQ(TestUtils::countOccurrences(out, p.error + "ab"), 2u);
}

TEST_F(HighlightFormatterTest, SameInputSameOutput) {
    WordColourMap words;
    words["WARN"] = p.warn;
    words["ERRO"] = p.error;
    std::vector<KeywordLayer> layers(1, KeywordLayer(&words, p.highlight));
    std::string text = "prism|WARN|26-01-01 00:00:00.000| ERRO and WARN\n";
    EXPECT_EQ(format(text, p.dull, layers), format(text, p.dull, layers));
}

TEST_F(HighlightFormatterTest, NullLayerIsSkipped) {
    std::vector<KeywordLayer> layers(1, KeywordLayer(nullptr, p.highlight));
    EXPECT_EQ(format("text", p.dull, layers), p.none + p.dull + "text");
}
