#include "character_fixtures.hpp"
#include "core/errors.hpp"
#include "models/feature_assembler.hpp"
#include <gtest/gtest.h>

TEST(FeatureAssemblerTest, FitFreezesNamesInColumnOrder) {
  FeatureAssembler assembler(50);
  auto data = assembler.build(TestData::three_heroes(), true);

  const auto &names = assembler.feature_names();
  const size_t n_text = assembler.vectorizer().vocabulary_size();
  ASSERT_EQ(assembler.width(), 4 + n_text + 2);
  EXPECT_EQ(names[0], "powers_count");
  EXPECT_EQ(names[1], "name_length");
  EXPECT_EQ(names[2], "quote_length");
  EXPECT_EQ(names[3], "description_length");
  if (n_text > 0)
    EXPECT_EQ(names[4], "tfidf_0");
  EXPECT_EQ(names[assembler.width() - 2], "universe");
  EXPECT_EQ(names[assembler.width() - 1], "genre");

  ASSERT_EQ(data.features.size(), 3u);
  for (const auto &row : data.features)
    EXPECT_EQ(row.size(), assembler.width());
}

TEST(FeatureAssemblerTest, ScalarAndCategoricalColumns) {
  FeatureAssembler assembler;
  auto data = assembler.build(TestData::three_heroes(), true);
  const size_t w = assembler.width();

  const auto &batman = data.features[2];
  EXPECT_DOUBLE_EQ(batman[0], 3.0);  // powers
  EXPECT_DOUBLE_EQ(batman[1], 6.0);  // "Batman"
  EXPECT_DOUBLE_EQ(batman[2], 11.0); // "I'm Batman."
  EXPECT_DOUBLE_EQ(batman[w - 2], 0.0); // DC sorts before Marvel
  EXPECT_DOUBLE_EQ(batman[w - 1], 0.0);
  EXPECT_DOUBLE_EQ(data.features[0][w - 2], 1.0);

  EXPECT_EQ(data.class_targets,
            (std::vector<std::string>{"spider-man", "iron-man", "batman"}));
  EXPECT_EQ(data.regression_targets, (std::vector<double>{7, 6, 8}));
}

TEST(FeatureAssemblerTest, AbsentFieldsUseDefaults) {
  CharacterRecord sparse;
  sparse.id = "mystery";

  FeatureAssembler assembler;
  auto data = assembler.build({TestData::batman(), sparse}, true);
  const auto &row = data.features[1];

  EXPECT_DOUBLE_EQ(row[0], 0.0);
  EXPECT_DOUBLE_EQ(row[1], 0.0);
  EXPECT_DOUBLE_EQ(row[2], 0.0);
  EXPECT_DOUBLE_EQ(row[3], 0.0);
  EXPECT_EQ(assembler.universe_encoder().classes(),
            (std::vector<std::string>{"DC", "Unknown"}));
  EXPECT_DOUBLE_EQ(data.regression_targets[1], 5.0);
}

TEST(FeatureAssemblerTest, TransformKeepsWidthAndIsIdempotent) {
  FeatureAssembler assembler;
  assembler.build(TestData::three_heroes(), true);

  auto guess = TestData::spider_man_guess();
  auto first = assembler.transform_one(guess);
  auto second = assembler.transform_one(guess);
  EXPECT_EQ(first.size(), assembler.width());
  EXPECT_EQ(first, second);

  auto batch = assembler.build({guess, TestData::iron_man()}, false);
  EXPECT_EQ(batch.features[0], first);
}

TEST(FeatureAssemblerTest, TransformBeforeFitThrows) {
  FeatureAssembler assembler;
  EXPECT_THROW(assembler.build(TestData::three_heroes(), false),
               NotFittedError);
  EXPECT_THROW(assembler.transform_one(TestData::batman()), NotFittedError);
}

TEST(FeatureAssemblerTest, SecondFitIsRejected) {
  FeatureAssembler assembler;
  assembler.build(TestData::three_heroes(), true);
  auto names = assembler.feature_names();

  EXPECT_THROW(assembler.build({TestData::batman()}, true),
               InvalidArgumentError);
  EXPECT_EQ(assembler.feature_names(), names);
}

TEST(FeatureAssemblerTest, UnknownUniverseIsRejected) {
  FeatureAssembler assembler;
  assembler.build(TestData::three_heroes(), true);

  auto outsider = TestData::spider_man_guess();
  outsider.universe = "Image";
  EXPECT_THROW(assembler.transform_one(outsider), UnknownCategoryError);
}

TEST(FeatureAssemblerTest, JsonRoundTripKeepsFeatures) {
  FeatureAssembler assembler;
  assembler.build(TestData::three_heroes(), true);

  FeatureAssembler restored = FeatureAssembler::from_json(assembler.to_json());
  EXPECT_EQ(restored.feature_names(), assembler.feature_names());
  EXPECT_EQ(restored.transform_one(TestData::spider_man_guess()),
            assembler.transform_one(TestData::spider_man_guess()));

  nlohmann::json broken = assembler.to_json();
  broken["feature_names"].erase(0);
  EXPECT_THROW(FeatureAssembler::from_json(broken), CorruptStateError);
}
