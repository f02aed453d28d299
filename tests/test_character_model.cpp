#include "character_fixtures.hpp"
#include "core/errors.hpp"
#include "models/character_model.hpp"
#include <gtest/gtest.h>

class CharacterModelTest : public ::testing::Test {
protected:
  CharacterModel model;
};

TEST_F(CharacterModelTest, ThreeHeroesTrainInDegradedMode) {
  TrainingMetrics metrics = model.train(TestData::three_heroes());

  ASSERT_TRUE(model.is_trained());
  EXPECT_TRUE(metrics.degraded_split);
  EXPECT_EQ(metrics.n_training_samples + metrics.n_test_samples, 3u);
  EXPECT_EQ(metrics.n_classes, 3u);
  EXPECT_GE(metrics.test_accuracy, 0.0);
  EXPECT_LE(metrics.test_accuracy, 1.0);
  // Same partition on both sides
  EXPECT_DOUBLE_EQ(metrics.train_accuracy, metrics.test_accuracy);
  EXPECT_DOUBLE_EQ(metrics.train_r2, metrics.test_r2);
  EXPECT_TRUE(metrics.cv_scores.empty());

  double difficulty = model.predict_value(TestData::spider_man_guess());
  EXPECT_GE(difficulty, 0.0);
  EXPECT_LE(difficulty, 10.0);
}

TEST_F(CharacterModelTest, MetricsJsonLayout) {
  nlohmann::json j = model.train(TestData::three_heroes()).to_json();

  EXPECT_EQ(j["classifier"]["n_classes"], 3);
  EXPECT_TRUE(j["classifier"]["cv_mean"].is_null());
  EXPECT_TRUE(j["regressor"].contains("train_r2"));
  EXPECT_TRUE(j["degraded_split"].get<bool>());
  EXPECT_EQ(j["n_training_samples"], 3);
  EXPECT_EQ(j["n_test_samples"], 0);
}

TEST_F(CharacterModelTest, PredictsTrainingCharacterBack) {
  model.train(TestData::three_heroes());

  auto predictions = model.predict_label(TestData::spider_man(), 3);
  ASSERT_FALSE(predictions.empty());
  EXPECT_EQ(predictions.front().label, "spider-man");
  EXPECT_DOUBLE_EQ(predictions.front().probability, 1.0);
  EXPECT_DOUBLE_EQ(predictions.front().confidence, 100.0);
}

TEST_F(CharacterModelTest, TopKContract) {
  model.train(TestData::twelve_records(), TreeParams{1, 2, 1});

  for (size_t k : {1u, 2u, 3u}) {
    auto predictions = model.predict_label(TestData::spider_man_guess(), k);
    EXPECT_LE(predictions.size(), k);
    EXPECT_FALSE(predictions.empty());
    for (size_t i = 0; i < predictions.size(); ++i) {
      EXPECT_GT(predictions[i].probability, 0.0);
      EXPECT_DOUBLE_EQ(predictions[i].confidence,
                       predictions[i].probability * 100.0);
      if (i > 0)
        EXPECT_LE(predictions[i].probability, predictions[i - 1].probability);
    }
  }
  EXPECT_THROW(model.predict_label(TestData::spider_man_guess(), 0),
               InvalidArgumentError);
}

TEST_F(CharacterModelTest, GenuineSplitRunsCrossValidation) {
  TrainingMetrics metrics = model.train(TestData::twelve_records());

  EXPECT_FALSE(metrics.degraded_split);
  EXPECT_EQ(metrics.n_training_samples, 9u);
  EXPECT_EQ(metrics.n_test_samples, 3u);
  ASSERT_EQ(metrics.cv_scores.size(), 3u); // min(5, 3 classes)
  EXPECT_GE(metrics.cv_mean, 0.0);
  EXPECT_LE(metrics.cv_mean, 1.0);
  EXPECT_EQ(metrics.n_features, model.state().assembler.width());
}

TEST_F(CharacterModelTest, DifficultyIsClipped) {
  auto low = TestData::make_character("low", "Lo", "down below", "Marvel",
                                      "Comedy", {}, -5, "");
  auto high = TestData::make_character("high", "Highest", "up above",
                                       "Marvel", "Comedy", {"a", "b"}, 15,
                                       "far far up");
  model.train({low, high});

  EXPECT_DOUBLE_EQ(model.state().regressor.predict_value(
                       model.state().assembler.transform_one(low)),
                   -5.0);
  EXPECT_DOUBLE_EQ(model.predict_value(low), 0.0);
  EXPECT_DOUBLE_EQ(model.predict_value(high), 10.0);
}

TEST_F(CharacterModelTest, UnknownUniverseIsRejected) {
  model.train(TestData::three_heroes());
  auto outsider = TestData::spider_man_guess();
  outsider.universe = "Image";

  EXPECT_THROW(model.predict_label(outsider, 3), UnknownCategoryError);
  EXPECT_THROW(model.predict_value(outsider), UnknownCategoryError);
}

TEST_F(CharacterModelTest, UntrainedModelRefusesPredictions) {
  EXPECT_FALSE(model.is_trained());
  EXPECT_THROW(model.predict_label(TestData::batman(), 3), NotTrainedError);
  EXPECT_THROW(model.predict_value(TestData::batman()), NotTrainedError);

  nlohmann::json info = model.model_info();
  EXPECT_FALSE(info["classifier"]["is_trained"].get<bool>());
  EXPECT_EQ(info["classifier"]["n_classes"], 0);
  EXPECT_EQ(info["n_features"], 0);
}

TEST_F(CharacterModelTest, TrainingInputValidation) {
  EXPECT_THROW(model.train({}), InsufficientDataError);

  auto nameless = TestData::batman();
  nameless.id.reset();
  EXPECT_THROW(model.train({TestData::spider_man(), nameless}),
               InvalidRecordError);
  EXPECT_FALSE(model.is_trained());
}

TEST_F(CharacterModelTest, FailedRetrainKeepsPreviousState) {
  model.train(TestData::three_heroes());
  auto before = model.predict_label(TestData::spider_man_guess(), 3);

  auto nameless = TestData::batman();
  nameless.id.reset();
  EXPECT_THROW(model.train({nameless}), InvalidRecordError);

  ASSERT_TRUE(model.is_trained());
  auto after = model.predict_label(TestData::spider_man_guess(), 3);
  ASSERT_EQ(after.size(), before.size());
  EXPECT_EQ(after.front().label, before.front().label);
}

TEST_F(CharacterModelTest, RetrainingReplacesFeatureSpace) {
  model.train({TestData::batman(), TestData::iron_man()});
  EXPECT_EQ(model.state().class_names().size(), 2u);

  model.train(TestData::three_heroes());
  EXPECT_EQ(model.state().class_names(),
            (std::vector<std::string>{"batman", "iron-man", "spider-man"}));
}

TEST_F(CharacterModelTest, TrainingIsDeterministic) {
  CharacterModel other;
  auto a = model.train(TestData::twelve_records());
  auto b = other.train(TestData::twelve_records());

  EXPECT_EQ(a.to_json(), b.to_json());
  EXPECT_EQ(model.predict_value(TestData::spider_man_guess()),
            other.predict_value(TestData::spider_man_guess()));
}

TEST_F(CharacterModelTest, ModelInfoAfterTraining) {
  model.train(TestData::three_heroes());
  nlohmann::json info = model.model_info();

  EXPECT_TRUE(info["classifier"]["is_trained"].get<bool>());
  EXPECT_TRUE(info["regressor"]["is_trained"].get<bool>());
  EXPECT_EQ(info["classifier"]["classes"].size(), 3u);
  EXPECT_EQ(info["n_features"], model.state().assembler.width());
  EXPECT_EQ(info["feature_names"].size(), model.state().assembler.width());
}
