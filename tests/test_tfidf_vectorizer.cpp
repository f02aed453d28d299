#include "core/errors.hpp"
#include "models/tfidf_vectorizer.hpp"
#include <cmath>
#include <gtest/gtest.h>

TEST(TfidfVectorizerTest, AnalyzeDropsSingleCharacterTokensAndAddsBigrams) {
  EXPECT_EQ(TfidfVectorizer::analyze("I'm Batman!"),
            (std::vector<std::string>{"batman"}));
  EXPECT_EQ(TfidfVectorizer::analyze("With great POWER"),
            (std::vector<std::string>{"with", "great", "power", "with great",
                                      "great power"}));
  EXPECT_TRUE(TfidfVectorizer::analyze("  ... ").empty());
}

TEST(TfidfVectorizerTest, AnalyzeSplitsOnUnicodePunctuation) {
  // Curly apostrophe (U+2019) and em dash (U+2014) separate words
  EXPECT_EQ(TfidfVectorizer::analyze("I\u2019m Batman\u2014the night"),
            (std::vector<std::string>{"batman", "the", "night", "batman the",
                                      "the night"}));
  // No-break space and guillemets are separators, accented letters are not
  EXPECT_EQ(TfidfVectorizer::analyze("\u00abCaf\u00e9\u00a0no\u00ebl\u00bb"),
            (std::vector<std::string>{"caf\u00e9", "no\u00ebl",
                                      "caf\u00e9 no\u00ebl"}));
}

TEST(TfidfVectorizerTest, VocabularyKeepsMostFrequentTermsSorted) {
  TfidfVectorizer vectorizer(3);
  vectorizer.fit({"red apple", "green apple"});

  // "apple" occurs twice; the remaining slots go to the lexicographically
  // smallest single-occurrence terms
  EXPECT_EQ(vectorizer.vocabulary(),
            (std::vector<std::string>{"apple", "green", "green apple"}));
  ASSERT_EQ(vectorizer.idf().size(), 3u);
  EXPECT_DOUBLE_EQ(vectorizer.idf()[0], 1.0);
  EXPECT_DOUBLE_EQ(vectorizer.idf()[1], std::log(3.0 / 2.0) + 1.0);
}

TEST(TfidfVectorizerTest, RowsAreL2Normalised) {
  TfidfVectorizer vectorizer(3);
  vectorizer.fit({"red apple", "green apple"});

  auto rows = vectorizer.transform({"red apple", "green apple", "blue sky"});
  ASSERT_EQ(rows.size(), 3u);

  EXPECT_EQ(rows[0], (std::vector<double>{1.0, 0.0, 0.0}));

  const double g = std::log(3.0 / 2.0) + 1.0;
  const double norm = std::sqrt(1.0 + 2.0 * g * g);
  EXPECT_NEAR(rows[1][0], 1.0 / norm, 1e-12);
  EXPECT_NEAR(rows[1][1], g / norm, 1e-12);
  EXPECT_NEAR(rows[1][2], g / norm, 1e-12);

  // Out-of-vocabulary text gives an all-zero row
  EXPECT_EQ(rows[2], (std::vector<double>(3, 0.0)));
}

TEST(TfidfVectorizerTest, TransformIsRepeatable) {
  TfidfVectorizer vectorizer(10);
  vectorizer.fit({"with great power", "i am iron man", "i am batman"});
  EXPECT_EQ(vectorizer.transform({"great power man"}),
            vectorizer.transform({"great power man"}));
}

TEST(TfidfVectorizerTest, TransformBeforeFitThrows) {
  TfidfVectorizer vectorizer;
  EXPECT_THROW(vectorizer.transform({"text"}), NotFittedError);
}

TEST(TfidfVectorizerTest, ZeroMaxFeaturesIsRejected) {
  EXPECT_THROW(TfidfVectorizer(0), InvalidArgumentError);
}

TEST(TfidfVectorizerTest, JsonRestoresIdenticalOutput) {
  TfidfVectorizer vectorizer(5);
  vectorizer.fit({"dark knight", "friendly neighbourhood hero"});
  TfidfVectorizer restored = TfidfVectorizer::from_json(vectorizer.to_json());
  EXPECT_EQ(restored.transform({"dark hero"}),
            vectorizer.transform({"dark hero"}));

  nlohmann::json broken = vectorizer.to_json();
  broken["idf"] = {1.0};
  EXPECT_THROW(TfidfVectorizer::from_json(broken), CorruptStateError);
}
