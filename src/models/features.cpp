#include "models/features.hpp"

std::string get_feature_name(ScalarFeature f) {
  switch (f) {
  case ScalarFeature::POWERS_COUNT:
    return "powers_count";
  case ScalarFeature::NAME_LENGTH:
    return "name_length";
  case ScalarFeature::QUOTE_LENGTH:
    return "quote_length";
  case ScalarFeature::DESCRIPTION_LENGTH:
    return "description_length";
  default:
    return "unknown_feature";
  }
}

std::string get_feature_name(CategoricalFeature f) {
  switch (f) {
  case CategoricalFeature::UNIVERSE:
    return "universe";
  case CategoricalFeature::GENRE:
    return "genre";
  default:
    return "unknown_feature";
  }
}

std::string get_text_feature_name(size_t index) {
  return "tfidf_" + std::to_string(index);
}
