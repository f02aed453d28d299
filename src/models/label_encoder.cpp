#include "models/label_encoder.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <set>
#include <utility>

LabelEncoder::LabelEncoder(std::string field) : field_(std::move(field)) {}

void LabelEncoder::fit(const std::vector<std::string> &values) {
  std::set<std::string> unique(values.begin(), values.end());
  classes_.assign(unique.begin(), unique.end());
  rebuild_index();
  fitted_ = true;
}

void LabelEncoder::rebuild_index() {
  index_.clear();
  for (size_t i = 0; i < classes_.size(); ++i)
    index_[classes_[i]] = static_cast<int>(i);
}

int LabelEncoder::transform_one(const std::string &value) const {
  if (!fitted_)
    throw NotFittedError(field_ + " encoder");

  auto it = index_.find(value);
  if (it == index_.end())
    throw UnknownCategoryError(field_, value);
  return it->second;
}

std::vector<int>
LabelEncoder::transform(const std::vector<std::string> &values) const {
  std::vector<int> codes;
  codes.reserve(values.size());
  for (const auto &value : values)
    codes.push_back(transform_one(value));
  return codes;
}

std::vector<int>
LabelEncoder::fit_transform(const std::vector<std::string> &values) {
  fit(values);
  return transform(values);
}

const std::string &LabelEncoder::inverse_one(int code) const {
  if (!fitted_)
    throw NotFittedError(field_ + " encoder");
  if (code < 0 || static_cast<size_t>(code) >= classes_.size())
    throw InvalidArgumentError(
        "code", "Code " + std::to_string(code) + " is out of range for " +
                    field_ + " encoder with " +
                    std::to_string(classes_.size()) + " classes");
  return classes_[static_cast<size_t>(code)];
}

std::vector<std::string>
LabelEncoder::inverse(const std::vector<int> &codes) const {
  std::vector<std::string> labels;
  labels.reserve(codes.size());
  for (int code : codes)
    labels.push_back(inverse_one(code));
  return labels;
}

nlohmann::json LabelEncoder::to_json() const {
  return {{"field", field_}, {"fitted", fitted_}, {"classes", classes_}};
}

LabelEncoder LabelEncoder::from_json(const nlohmann::json &j) {
  LabelEncoder encoder(j.at("field").get<std::string>());
  encoder.fitted_ = j.at("fitted").get<bool>();
  encoder.classes_ = j.at("classes").get<std::vector<std::string>>();
  if (!std::is_sorted(encoder.classes_.begin(), encoder.classes_.end()) ||
      std::adjacent_find(encoder.classes_.begin(), encoder.classes_.end()) !=
          encoder.classes_.end())
    throw CorruptStateError("Encoder '" + encoder.field_ +
                            "' classes are not sorted and unique");
  encoder.rebuild_index();
  return encoder;
}
