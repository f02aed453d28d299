#ifndef TFIDF_VECTORIZER_HPP
#define TFIDF_VECTORIZER_HPP

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

// Bag-of-terms vectorizer over unigrams and bigrams, weighted by smoothed
// TF-IDF and L2-normalised per document. The vocabulary is capped at
// `max_features` terms, chosen by total corpus frequency.
class TfidfVectorizer {
public:
  explicit TfidfVectorizer(size_t max_features = 50);

  void fit(const std::vector<std::string> &corpus);
  std::vector<std::vector<double>>
  transform(const std::vector<std::string> &corpus) const;
  std::vector<std::vector<double>>
  fit_transform(const std::vector<std::string> &corpus);

  bool is_fitted() const { return fitted_; }
  size_t max_features() const { return max_features_; }
  // Actual width of transform() output; at most max_features()
  size_t vocabulary_size() const { return vocabulary_.size(); }
  // Terms in column order
  const std::vector<std::string> &vocabulary() const { return vocabulary_; }
  const std::vector<double> &idf() const { return idf_; }

  // Lowercased word tokens of two or more characters, followed by the
  // space-joined bigrams of adjacent tokens.
  static std::vector<std::string> analyze(std::string_view document);

  nlohmann::json to_json() const;
  static TfidfVectorizer from_json(const nlohmann::json &j);

private:
  size_t max_features_;
  bool fitted_ = false;
  std::vector<std::string> vocabulary_;
  std::vector<double> idf_;
  std::map<std::string, size_t> term_index_;

  void rebuild_index();
};

#endif // TFIDF_VECTORIZER_HPP
