#include "models/feature_assembler.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "models/features.hpp"
#include "utils/utils.hpp"

#include <cstddef>
#include <sstream>
#include <utility>
#include <vector>

FeatureAssembler::FeatureAssembler(size_t max_text_features)
    : vectorizer_(max_text_features) {}

AssembledFeatures
FeatureAssembler::build(const std::vector<CharacterRecord> &records, bool fit) {
  LOG(LogLevel::TRACE, LogComponent::ML_FEATURES,
      "Entering FeatureAssembler::build with " << records.size()
                                               << " records, fit=" << fit);

  if (!fit) {
    if (!fitted_)
      throw NotFittedError("FeatureAssembler");
    return assemble(records);
  }

  if (fitted_)
    throw InvalidArgumentError(
        "fit", "FeatureAssembler is already fitted; retraining needs a fresh "
               "model state");

  // Fit into local copies first so a failure leaves this assembler untouched
  std::vector<std::string> corpus;
  std::vector<std::string> universes;
  std::vector<std::string> genres;
  corpus.reserve(records.size());
  universes.reserve(records.size());
  genres.reserve(records.size());
  for (const auto &record : records) {
    corpus.push_back(record.combined_text());
    universes.push_back(record.universe_or_default());
    genres.push_back(record.genre_or_default());
  }

  TfidfVectorizer vectorizer(vectorizer_.max_features());
  vectorizer.fit(corpus);
  LabelEncoder universe_encoder("universe");
  universe_encoder.fit(universes);
  LabelEncoder genre_encoder("genre");
  genre_encoder.fit(genres);

  std::vector<std::string> names;
  for (int f = 0; f < static_cast<int>(ScalarFeature::SCALAR_COUNT); ++f)
    names.push_back(get_feature_name(static_cast<ScalarFeature>(f)));
  for (size_t t = 0; t < vectorizer.vocabulary_size(); ++t)
    names.push_back(get_text_feature_name(t));
  for (int f = 0; f < static_cast<int>(CategoricalFeature::CATEGORICAL_COUNT);
       ++f)
    names.push_back(get_feature_name(static_cast<CategoricalFeature>(f)));

  vectorizer_ = std::move(vectorizer);
  universe_encoder_ = std::move(universe_encoder);
  genre_encoder_ = std::move(genre_encoder);
  feature_names_ = std::move(names);
  fitted_ = true;

  LOG(LogLevel::INFO, LogComponent::ML_FEATURES,
      "Feature space frozen: " << feature_names_.size() << " columns ("
                               << vectorizer_.vocabulary_size()
                               << " text terms, "
                               << universe_encoder_.size() << " universes, "
                               << genre_encoder_.size() << " genres)");

  return assemble(records);
}

AssembledFeatures
FeatureAssembler::assemble(const std::vector<CharacterRecord> &records) const {
  std::vector<std::string> corpus;
  corpus.reserve(records.size());
  for (const auto &record : records)
    corpus.push_back(record.combined_text());
  FeatureMatrix text_features = vectorizer_.transform(corpus);

  const size_t n_scalars = static_cast<size_t>(ScalarFeature::SCALAR_COUNT);
  const size_t n_text = vectorizer_.vocabulary_size();

  AssembledFeatures out;
  out.features.reserve(records.size());
  out.class_targets.reserve(records.size());
  out.regression_targets.reserve(records.size());

  for (size_t i = 0; i < records.size(); ++i) {
    const auto &record = records[i];

    // Initialize a vector of the frozen width with all zeros
    std::vector<double> features(width(), 0.0);

    // --- Numeric scalars ---
    features[static_cast<size_t>(ScalarFeature::POWERS_COUNT)] =
        static_cast<double>(record.powers.size());
    features[static_cast<size_t>(ScalarFeature::NAME_LENGTH)] =
        static_cast<double>(Utils::utf8_length(record.name_or_empty()));
    features[static_cast<size_t>(ScalarFeature::QUOTE_LENGTH)] =
        static_cast<double>(Utils::utf8_length(record.quote_or_empty()));
    features[static_cast<size_t>(ScalarFeature::DESCRIPTION_LENGTH)] =
        static_cast<double>(Utils::utf8_length(record.description_or_empty()));

    // --- Text weights ---
    for (size_t t = 0; t < n_text; ++t)
      features[n_scalars + t] = text_features[i][t];

    // --- Categoricals ---
    const size_t categorical_offset = n_scalars + n_text;
    features[categorical_offset +
             static_cast<size_t>(CategoricalFeature::UNIVERSE)] =
        universe_encoder_.transform_one(record.universe_or_default());
    features[categorical_offset +
             static_cast<size_t>(CategoricalFeature::GENRE)] =
        genre_encoder_.transform_one(record.genre_or_default());

    log_feature_row(features);

    out.features.push_back(std::move(features));
    out.class_targets.push_back(record.id.value_or(""));
    out.regression_targets.push_back(record.difficulty_or_default());
  }

  return out;
}

std::vector<double>
FeatureAssembler::transform_one(const CharacterRecord &record) const {
  if (!fitted_)
    throw NotFittedError("FeatureAssembler");
  return std::move(assemble({record}).features.front());
}

void FeatureAssembler::log_feature_row(const std::vector<double> &row) const {
  if (!LogManager::instance().should_log(LogLevel::TRACE,
                                         LogComponent::ML_FEATURES))
    return;

  std::ostringstream ss;
  ss << "Feature vector: [";
  for (size_t i = 0; i < row.size(); ++i) {
    ss << row[i] << (i == row.size() - 1 ? "" : ", ");
  }
  ss << "]";
  LOG(LogLevel::TRACE, LogComponent::ML_FEATURES, ss.str());
}

nlohmann::json FeatureAssembler::to_json() const {
  return {{"fitted", fitted_},
          {"feature_names", feature_names_},
          {"vectorizer", vectorizer_.to_json()},
          {"universe_encoder", universe_encoder_.to_json()},
          {"genre_encoder", genre_encoder_.to_json()}};
}

FeatureAssembler FeatureAssembler::from_json(const nlohmann::json &j) {
  FeatureAssembler assembler;
  assembler.vectorizer_ = TfidfVectorizer::from_json(j.at("vectorizer"));
  assembler.universe_encoder_ =
      LabelEncoder::from_json(j.at("universe_encoder"));
  assembler.genre_encoder_ = LabelEncoder::from_json(j.at("genre_encoder"));
  assembler.feature_names_ =
      j.at("feature_names").get<std::vector<std::string>>();
  assembler.fitted_ = j.at("fitted").get<bool>();

  if (assembler.fitted_) {
    const size_t expected =
        static_cast<size_t>(ScalarFeature::SCALAR_COUNT) +
        assembler.vectorizer_.vocabulary_size() +
        static_cast<size_t>(CategoricalFeature::CATEGORICAL_COUNT);
    if (assembler.feature_names_.size() != expected ||
        !assembler.vectorizer_.is_fitted() ||
        !assembler.universe_encoder_.is_fitted() ||
        !assembler.genre_encoder_.is_fitted())
      throw CorruptStateError(
          "Feature assembler state is inconsistent: expected " +
          std::to_string(expected) + " feature names, found " +
          std::to_string(assembler.feature_names_.size()));
  }
  return assembler;
}
