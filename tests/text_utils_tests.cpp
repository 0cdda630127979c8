#include <gtest/gtest.h>
#include "modules/TextUtils.h"

TEST(TextUtilsTest, CleanTextStripsDebris) {
    EXPECT_EQ(cleanText("Sure! ## \"Great  game tonight\" ", "alice"), "Great game tonight");
    EXPECT_EQ(cleanText("[Loving the new park]", "alice"), "Loving the new park");
    EXPECT_EQ(cleanText("(just a thought)", "alice"), "just a thought");
    EXPECT_EQ(cleanText("   \n  ", "alice"), "");
}

// The author's own handle is dropped, longer handles sharing the prefix are kept
TEST(TextUtilsTest, CleanTextDropsSelfMention) {
    EXPECT_EQ(cleanText("@alice thanks @bob", "alice"), "thanks @bob");
    EXPECT_EQ(cleanText("hi @alice_2", "alice"), "hi @alice_2");
}

TEST(TextUtilsTest, ExtractTags) {
    const std::string text = "Vote #today and tell @bob, #today #vote2024 @carol_x!";
    EXPECT_EQ(extractTags(text, '#'), (std::vector<std::string>{"#today", "#vote2024"}));
    EXPECT_EQ(extractTags(text, '@'), (std::vector<std::string>{"@bob", "@carol_x"}));
    EXPECT_TRUE(extractTags("nothing # here", '#').empty());
}

TEST(TextUtilsTest, CleanEmotions) {
    const std::vector<std::string> allowed = {"joy", "anger", "fear"};
    EXPECT_EQ(cleanEmotions("**Joy**, anger and boredom; joy again", allowed),
              (std::vector<std::string>{"joy", "anger"}));
    EXPECT_TRUE(cleanEmotions("none", allowed).empty());
}

TEST(TextUtilsTest, ParseReaction) {
    EXPECT_EQ(parseReaction("I would LIKE this"), Reaction::Like);
    EXPECT_EQ(parseReaction("dislike."), Reaction::Dislike);
    EXPECT_FALSE(parseReaction("NONE").has_value());
    EXPECT_FALSE(parseReaction("likely not").has_value());
}

TEST(TextUtilsTest, ParseChoice) {
    const std::vector<std::string> options = {"democrat", "republican"};
    EXPECT_EQ(parseChoice("I'd go Republican this time", options).value_or(""), "republican");
    EXPECT_FALSE(parseChoice("undecided", options).has_value());
    EXPECT_FALSE(parseChoice("democrats", options).has_value());
}
