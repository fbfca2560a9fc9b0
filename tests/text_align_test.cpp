#include <gtest/gtest.h>
#include "cliutil/format/text_align.hpp"

using namespace cliutil::format;

namespace {

AlignOptions aligned(TextAlign align, int width) {
    AlignOptions options;
    options.align = align;
    options.width = width;
    return options;
}

}

TEST(wordWrap, breaks_at_spaces) {
    EXPECT_EQ("the quick\nbrown fox", wordWrap("the quick brown fox", 10, "\n", true));
}

TEST(wordWrap, cuts_long_words) {
    EXPECT_EQ("abcd\nefgh\nij", wordWrap("abcdefghij", 4, "\n", true));
}

TEST(wordWrap, keeps_long_words_without_cut) {
    EXPECT_EQ("abcdefghij\nxy", wordWrap("abcdefghij xy", 4, "\n", false));
}

TEST(wordWrap, keeps_existing_breaks) {
    EXPECT_EQ("ab\ncd ef", wordWrap("ab\ncd ef", 10, "\n", true));
}

TEST(textAlign, left_collapses_spaces_and_wraps) {
    EXPECT_EQ("the quick\nbrown fox", textAlign("  the   quick brown  fox ", aligned(TextAlign::LEFT, 10)));
}

TEST(textAlign, left_separates_paragraphs) {
    EXPECT_EQ("one\n\ntwo", textAlign("one\ntwo", aligned(TextAlign::LEFT, 10)));
}

TEST(textAlign, left_paragraph_indent) {
    AlignOptions options = aligned(TextAlign::LEFT, 20);
    options.paragraph_indent = 2;
    EXPECT_EQ("  one\n\n  two", textAlign("one\ntwo", options));
}

TEST(textAlign, right_pads_on_the_left) {
    EXPECT_EQ("       abc", textAlign("abc", aligned(TextAlign::RIGHT, 10)));
}

TEST(textAlign, center_splits_padding) {
    EXPECT_EQ("   abc   ", textAlign("abc", aligned(TextAlign::CENTER, 9)));
}

TEST(textAlign, justify_leaves_last_line) {
    EXPECT_EQ("aa  bb  cc\ndd", textAlign("aa bb cc dd", aligned(TextAlign::JUSTIFY, 10)));
}

TEST(textAlign, justify_all_lines) {
    AlignOptions options = aligned(TextAlign::JUSTIFY, 10);
    options.justify_all_lines = true;
    EXPECT_EQ("aa  bb  cc\ndd", textAlign("aa bb cc dd", options));
    EXPECT_EQ("aa       b", textAlign("aa b", options));
}

TEST(textIndent, adds_levels) {
    EXPECT_EQ("    a\n    b", textIndent("a\nb", "  ", 2));
}

TEST(textIndent, removes_up_to_levels) {
    EXPECT_EQ("  a\nb\nc", textIndent("    a\n  b\nc", "  ", -1));
}

TEST(textIndent, zero_levels_is_identity) {
    EXPECT_EQ("a\nb", textIndent("a\nb", "  ", 0));
}
