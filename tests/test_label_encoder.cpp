#include "core/errors.hpp"
#include "models/label_encoder.hpp"
#include <gtest/gtest.h>

TEST(LabelEncoderTest, CodesFollowSortedUniqueLabels) {
  LabelEncoder encoder("universe");
  encoder.fit({"Marvel", "DC", "Marvel", "Image"});

  ASSERT_TRUE(encoder.is_fitted());
  EXPECT_EQ(encoder.classes(),
            (std::vector<std::string>{"DC", "Image", "Marvel"}));
  EXPECT_EQ(encoder.transform({"Marvel", "DC"}), (std::vector<int>{2, 0}));
  EXPECT_EQ(encoder.inverse({1, 2}),
            (std::vector<std::string>{"Image", "Marvel"}));
}

TEST(LabelEncoderTest, UnknownLabelNamesFieldAndValue) {
  LabelEncoder encoder("universe");
  encoder.fit({"Marvel", "DC"});

  try {
    encoder.transform_one("Dark Horse");
    FAIL() << "Expected UnknownCategoryError";
  } catch (const UnknownCategoryError &e) {
    EXPECT_EQ(e.field(), "universe");
    EXPECT_EQ(e.value(), "Dark Horse");
  }
}

TEST(LabelEncoderTest, UseBeforeFitIsNotFitted) {
  LabelEncoder encoder;
  EXPECT_THROW(encoder.transform_one("x"), NotFittedError);
  EXPECT_THROW(encoder.inverse_one(0), NotFittedError);
}

TEST(LabelEncoderTest, InverseRejectsOutOfRangeCode) {
  LabelEncoder encoder;
  encoder.fit({"a", "b"});
  EXPECT_THROW(encoder.inverse_one(2), InvalidArgumentError);
  EXPECT_THROW(encoder.inverse_one(-1), InvalidArgumentError);
}

TEST(LabelEncoderTest, JsonKeepsMapping) {
  LabelEncoder encoder("genre");
  encoder.fit({"Fantasy", "Anime", "Superhero Action"});

  LabelEncoder restored = LabelEncoder::from_json(encoder.to_json());
  EXPECT_EQ(restored.field(), "genre");
  EXPECT_EQ(restored.classes(), encoder.classes());
  EXPECT_EQ(restored.transform_one("Fantasy"), encoder.transform_one("Fantasy"));
}

TEST(LabelEncoderTest, UnsortedStoredClassesAreCorrupt) {
  nlohmann::json j = {{"field", "genre"},
                      {"fitted", true},
                      {"classes", {"b", "a"}}};
  EXPECT_THROW(LabelEncoder::from_json(j), CorruptStateError);

  j["classes"] = {"a", "a"};
  EXPECT_THROW(LabelEncoder::from_json(j), CorruptStateError);
}
