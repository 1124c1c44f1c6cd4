//! # Error Explanation Tests

#include "diag/explain.hpp"

#include <gtest/gtest.h>

using namespace tyfix::diag;

TEST(ExplainTest, EveryCodeHasAnExplanation) {
    for (auto error : all_error_codes()) {
        const auto* text = explanation_for(error);
        ASSERT_NE(text, nullptr) << code(error);
        EXPECT_NE(text->find("[" + code(error) + "]"), std::string::npos) << code(error);
        EXPECT_NE(text->find("How to fix"), std::string::npos) << code(error);
    }
    EXPECT_EQ(get_explanations().size(), all_error_codes().size());
}

TEST(ExplainTest, MismatchedTypesMentionsConversions) {
    const auto* text = explanation_for(ErrorCode::E0308);
    ASSERT_NE(text, nullptr);
    EXPECT_NE(text->find("Mismatched types"), std::string::npos);
    EXPECT_NE(text->find("FromStr"), std::string::npos);
}

TEST(LevenshteinTest, Distances) {
    EXPECT_EQ(levenshtein_distance("", "abc"), 3u);
    EXPECT_EQ(levenshtein_distance("E0308", "E0308"), 0u);
    EXPECT_EQ(levenshtein_distance("e0308", "E0308"), 0u);
    EXPECT_EQ(levenshtein_distance("E0380", "E0308"), 2u);
    EXPECT_EQ(levenshtein_distance("kitten", "sitting"), 3u);
}

TEST(SimilarCandidatesTest, ClosestFirstThenByName) {
    std::vector<std::string> codes = {"E0603", "E0614", "E0616", "E0624", "E0308"};
    auto similar = find_similar_candidates("E0615", codes, 3, 2);
    ASSERT_EQ(similar.size(), 3u);
    EXPECT_EQ(similar[0], "E0614");
    EXPECT_EQ(similar[1], "E0616");
    EXPECT_EQ(similar[2], "E0603");
}

TEST(SimilarCandidatesTest, NothingWithinDistance) {
    EXPECT_TRUE(find_similar_candidates("X", {"E0308"}, 3, 2).empty());
    EXPECT_TRUE(find_similar_candidates("", {"E0308"}).empty());
}
