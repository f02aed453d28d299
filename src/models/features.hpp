#ifndef FEATURES_HPP
#define FEATURES_HPP

#include <cstddef>
#include <string>
#include <vector>

// One row per record, columns in the frozen feature order
using FeatureMatrix = std::vector<std::vector<double>>;

// Leading numeric columns of every feature vector, in column order.
enum class ScalarFeature {
  POWERS_COUNT,
  NAME_LENGTH,
  QUOTE_LENGTH,
  DESCRIPTION_LENGTH,

  // This must always be the last item. It automatically provides the total
  // count.
  SCALAR_COUNT
};

// Trailing integer-coded categorical columns, in column order.
enum class CategoricalFeature {
  UNIVERSE,
  GENRE,

  CATEGORICAL_COUNT
};

std::string get_feature_name(ScalarFeature f);
std::string get_feature_name(CategoricalFeature f);
// Name of the text column `index` ("tfidf_<index>")
std::string get_text_feature_name(size_t index);

#endif // FEATURES_HPP
