#include "character_fixtures.hpp"
#include "core/errors.hpp"
#include "models/model_persistence.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

class ModelPersistenceTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir = std::filesystem::temp_directory_path() / "charactle_persist_test";
    std::filesystem::create_directories(test_dir);
    model.train(TestData::twelve_records());
  }

  void TearDown() override {
    if (std::filesystem::exists(test_dir))
      std::filesystem::remove_all(test_dir);
  }

  static std::vector<CharacterRecord> probes() {
    auto records = TestData::twelve_records();
    records.push_back(TestData::spider_man_guess());
    return records;
  }

  std::filesystem::path test_dir;
  CharacterModel model;
};

TEST_F(ModelPersistenceTest, RoundTripPredictsBitIdentically) {
  auto blob = ModelPersistence::save(model.state());
  ASSERT_FALSE(blob.empty());

  CharacterModel restored;
  restored.replace_state(ModelPersistence::load(blob));
  ASSERT_TRUE(restored.is_trained());

  for (const auto &record : probes()) {
    auto expected = model.predict_label(record, 3);
    auto actual = restored.predict_label(record, 3);
    ASSERT_EQ(actual.size(), expected.size());
    for (size_t i = 0; i < actual.size(); ++i) {
      EXPECT_EQ(actual[i].label, expected[i].label);
      EXPECT_EQ(actual[i].probability, expected[i].probability);
    }
    EXPECT_EQ(restored.predict_value(record), model.predict_value(record));
  }

  EXPECT_EQ(restored.model_info(), model.model_info());
  EXPECT_EQ(restored.state().metrics.to_json(),
            model.state().metrics.to_json());
}

TEST_F(ModelPersistenceTest, UntrainedStateRoundTrips) {
  CharacterModel untrained;
  auto state = ModelPersistence::load(ModelPersistence::save(untrained.state()));
  EXPECT_FALSE(state->classifier_trained);
  EXPECT_FALSE(state->regressor_trained);
}

TEST_F(ModelPersistenceTest, GarbageBlobIsCorrupt) {
  EXPECT_THROW(ModelPersistence::load({}), CorruptStateError);
  EXPECT_THROW(ModelPersistence::load({0xff, 0x00, 0x13}), CorruptStateError);

  // Valid CBOR, but not a model document
  auto other = nlohmann::json::to_cbor(nlohmann::json{{"hello", "world"}});
  EXPECT_THROW(ModelPersistence::load(other), CorruptStateError);
}

TEST_F(ModelPersistenceTest, VersionMismatchIsCorrupt) {
  nlohmann::json j = ModelPersistence::state_to_json(model.state());
  j["format_version"] = ModelPersistence::FORMAT_VERSION + 1;
  EXPECT_THROW(ModelPersistence::load(nlohmann::json::to_cbor(j)),
               CorruptStateError);
}

TEST_F(ModelPersistenceTest, MissingComponentIsCorrupt) {
  nlohmann::json j = ModelPersistence::state_to_json(model.state());
  j.erase("regressor");
  EXPECT_THROW(ModelPersistence::load(nlohmann::json::to_cbor(j)),
               CorruptStateError);
}

TEST_F(ModelPersistenceTest, InconsistentWidthIsCorrupt) {
  nlohmann::json j = ModelPersistence::state_to_json(model.state());
  j["classifier"]["n_features"] = j["classifier"]["n_features"].get<size_t>() + 1;
  EXPECT_THROW(ModelPersistence::load(nlohmann::json::to_cbor(j)),
               CorruptStateError);
}

TEST_F(ModelPersistenceTest, FileRoundTripReplacesAtomically) {
  const std::string path = (test_dir / "nested" / "model.cbor").string();
  ModelPersistence::save_to_file(model.state(), path);

  EXPECT_TRUE(std::filesystem::exists(path));
  EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));

  auto state = ModelPersistence::load_from_file(path);
  EXPECT_EQ(state->class_names(), model.state().class_names());
}

TEST_F(ModelPersistenceTest, FileErrors) {
  EXPECT_THROW(
      ModelPersistence::load_from_file((test_dir / "missing.cbor").string()),
      PersistenceIOError);

  const std::string junk = (test_dir / "junk.cbor").string();
  {
    std::ofstream out(junk, std::ios::binary);
    out << "definitely not cbor";
  }
  EXPECT_THROW(ModelPersistence::load_from_file(junk), CorruptStateError);
}
