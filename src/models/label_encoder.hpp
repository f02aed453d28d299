#ifndef LABEL_ENCODER_HPP
#define LABEL_ENCODER_HPP

#include <nlohmann/json.hpp>

#include <string>
#include <unordered_map>
#include <vector>

// Bidirectional mapping between category labels and dense integer codes.
// Codes follow the lexicographic order of the distinct labels seen by fit().
class LabelEncoder {
public:
  // `field` names the encoded attribute in error messages ("universe", ...)
  explicit LabelEncoder(std::string field = "label");

  void fit(const std::vector<std::string> &values);
  std::vector<int> transform(const std::vector<std::string> &values) const;
  int transform_one(const std::string &value) const;
  std::vector<int> fit_transform(const std::vector<std::string> &values);

  std::vector<std::string> inverse(const std::vector<int> &codes) const;
  const std::string &inverse_one(int code) const;

  bool is_fitted() const { return fitted_; }
  const std::vector<std::string> &classes() const { return classes_; }
  size_t size() const { return classes_.size(); }
  const std::string &field() const { return field_; }

  nlohmann::json to_json() const;
  static LabelEncoder from_json(const nlohmann::json &j);

private:
  std::string field_;
  bool fitted_ = false;
  std::vector<std::string> classes_;
  std::unordered_map<std::string, int> index_;

  void rebuild_index();
};

#endif // LABEL_ENCODER_HPP
