#ifndef FEATURE_ASSEMBLER_HPP
#define FEATURE_ASSEMBLER_HPP

#include "models/character_record.hpp"
#include "models/features.hpp"
#include "models/label_encoder.hpp"
#include "models/tfidf_vectorizer.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

struct AssembledFeatures {
  FeatureMatrix features;
  std::vector<std::string> class_targets;   // character ids ("" when absent)
  std::vector<double> regression_targets;   // difficulty
};

// Turns character records into the fixed-order feature matrix:
//   [powers_count, name_length, quote_length, description_length,
//    tfidf_0 .. tfidf_{N-1}, universe, genre]
// The first build() with fit=true fits the vectorizer and both categorical
// encoders and freezes the feature names; every later build() with fit=false
// reuses them unchanged.
class FeatureAssembler {
public:
  explicit FeatureAssembler(size_t max_text_features = 50);

  AssembledFeatures build(const std::vector<CharacterRecord> &records,
                          bool fit);

  // Transform-only assembly of a single record (fit=false)
  std::vector<double> transform_one(const CharacterRecord &record) const;

  bool is_fitted() const { return fitted_; }
  size_t width() const { return feature_names_.size(); }
  const std::vector<std::string> &feature_names() const {
    return feature_names_;
  }
  const TfidfVectorizer &vectorizer() const { return vectorizer_; }
  const LabelEncoder &universe_encoder() const { return universe_encoder_; }
  const LabelEncoder &genre_encoder() const { return genre_encoder_; }

  nlohmann::json to_json() const;
  static FeatureAssembler from_json(const nlohmann::json &j);

private:
  TfidfVectorizer vectorizer_;
  LabelEncoder universe_encoder_{"universe"};
  LabelEncoder genre_encoder_{"genre"};
  std::vector<std::string> feature_names_;
  bool fitted_ = false;

  AssembledFeatures assemble(const std::vector<CharacterRecord> &records) const;
  void log_feature_row(const std::vector<double> &row) const;
};

#endif // FEATURE_ASSEMBLER_HPP
