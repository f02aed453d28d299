#include "models/tfidf_vectorizer.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <set>
#include <unordered_map>
#include <utility>

namespace {
struct ScannedChar {
  size_t length;
  bool is_word;
};

// Latin-1 symbols that still count as word characters (ordinal indicators,
// micro sign, superscript digits, vulgar fractions)
bool is_latin1_word_symbol(uint32_t cp) {
  switch (cp) {
  case 0xAA:
  case 0xB2:
  case 0xB3:
  case 0xB5:
  case 0xB9:
  case 0xBA:
  case 0xBC:
  case 0xBD:
  case 0xBE:
    return true;
  default:
    return false;
  }
}

bool is_separator_code_point(uint32_t cp) {
  if (cp >= 0x80 && cp <= 0xBF)
    return !is_latin1_word_symbol(cp);
  return cp == 0xD7 || cp == 0xF7 ||
         (cp >= 0x2000 && cp <= 0x206F) || // general punctuation
         (cp >= 0x2E00 && cp <= 0x2E7F) || // supplemental punctuation
         (cp >= 0x3000 && cp <= 0x303F) || // CJK symbols and punctuation
         cp == 0xFEFF;
}

// Classifies the character starting at byte `i`. Malformed sequences are
// consumed one byte at a time and kept as word characters.
ScannedChar scan_char(const std::string &text, size_t i) {
  const unsigned char lead = static_cast<unsigned char>(text[i]);
  if (lead < 0x80)
    return {1, std::isalnum(lead) != 0 || lead == '_'};

  size_t length = 0;
  uint32_t cp = 0;
  if ((lead & 0xE0) == 0xC0) {
    length = 2;
    cp = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    length = 3;
    cp = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    length = 4;
    cp = lead & 0x07;
  } else {
    return {1, true};
  }
  if (i + length > text.size())
    return {1, true};
  for (size_t k = 1; k < length; ++k) {
    const unsigned char c = static_cast<unsigned char>(text[i + k]);
    if ((c & 0xC0) != 0x80)
      return {1, true};
    cp = (cp << 6) | (c & 0x3F);
  }
  return {length, !is_separator_code_point(cp)};
}
} // namespace

TfidfVectorizer::TfidfVectorizer(size_t max_features)
    : max_features_(max_features) {
  if (max_features_ == 0)
    throw InvalidArgumentError("max_features",
                               "TfidfVectorizer needs max_features >= 1");
}

std::vector<std::string> TfidfVectorizer::analyze(std::string_view document) {
  std::string lowered = Utils::to_lower_ascii(document);

  std::vector<std::string> tokens;
  std::string current;
  auto flush = [&]() {
    if (Utils::utf8_length(current) >= 2)
      tokens.push_back(current);
    current.clear();
  };

  size_t i = 0;
  while (i < lowered.size()) {
    const ScannedChar ch = scan_char(lowered, i);
    if (ch.is_word)
      current.append(lowered, i, ch.length);
    else
      flush();
    i += ch.length;
  }
  flush();

  std::vector<std::string> terms = tokens;
  for (size_t t = 0; t + 1 < tokens.size(); ++t)
    terms.push_back(tokens[t] + " " + tokens[t + 1]);
  return terms;
}

void TfidfVectorizer::fit(const std::vector<std::string> &corpus) {
  std::map<std::string, size_t> term_counts;
  std::map<std::string, size_t> document_counts;

  for (const auto &document : corpus) {
    auto terms = analyze(document);
    std::set<std::string> seen;
    for (const auto &term : terms) {
      ++term_counts[term];
      if (seen.insert(term).second)
        ++document_counts[term];
    }
  }

  // Keep the most frequent terms; std::map iteration gives lexicographic
  // order, and stable_sort keeps it among equal counts.
  std::vector<std::pair<std::string, size_t>> ranked(term_counts.begin(),
                                                     term_counts.end());
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const auto &a, const auto &b) {
                     return a.second > b.second;
                   });
  if (ranked.size() > max_features_)
    ranked.resize(max_features_);

  vocabulary_.clear();
  for (const auto &entry : ranked)
    vocabulary_.push_back(entry.first);
  std::sort(vocabulary_.begin(), vocabulary_.end());

  const double n_documents = static_cast<double>(corpus.size());
  idf_.clear();
  for (const auto &term : vocabulary_) {
    double df = static_cast<double>(document_counts[term]);
    idf_.push_back(std::log((1.0 + n_documents) / (1.0 + df)) + 1.0);
  }

  rebuild_index();
  fitted_ = true;

  LOG(LogLevel::DEBUG, LogComponent::ML_FEATURES,
      "TF-IDF vocabulary fitted: " << vocabulary_.size() << " of "
                                   << term_counts.size()
                                   << " candidate terms kept from "
                                   << corpus.size() << " documents");
}

void TfidfVectorizer::rebuild_index() {
  term_index_.clear();
  for (size_t i = 0; i < vocabulary_.size(); ++i)
    term_index_[vocabulary_[i]] = i;
}

std::vector<std::vector<double>>
TfidfVectorizer::transform(const std::vector<std::string> &corpus) const {
  if (!fitted_)
    throw NotFittedError("TfidfVectorizer");

  std::vector<std::vector<double>> matrix;
  matrix.reserve(corpus.size());

  for (const auto &document : corpus) {
    std::vector<double> row(vocabulary_.size(), 0.0);
    for (const auto &term : analyze(document)) {
      auto it = term_index_.find(term);
      if (it != term_index_.end())
        row[it->second] += 1.0;
    }

    double norm = 0.0;
    for (size_t col = 0; col < row.size(); ++col) {
      row[col] *= idf_[col];
      norm += row[col] * row[col];
    }
    if (norm > 0.0) {
      norm = std::sqrt(norm);
      for (double &value : row)
        value /= norm;
    }
    matrix.push_back(std::move(row));
  }
  return matrix;
}

std::vector<std::vector<double>>
TfidfVectorizer::fit_transform(const std::vector<std::string> &corpus) {
  fit(corpus);
  return transform(corpus);
}

nlohmann::json TfidfVectorizer::to_json() const {
  return {{"max_features", max_features_},
          {"fitted", fitted_},
          {"vocabulary", vocabulary_},
          {"idf", idf_}};
}

TfidfVectorizer TfidfVectorizer::from_json(const nlohmann::json &j) {
  TfidfVectorizer vectorizer(j.at("max_features").get<size_t>());
  vectorizer.fitted_ = j.at("fitted").get<bool>();
  vectorizer.vocabulary_ = j.at("vocabulary").get<std::vector<std::string>>();
  vectorizer.idf_ = j.at("idf").get<std::vector<double>>();
  if (vectorizer.vocabulary_.size() != vectorizer.idf_.size())
    throw CorruptStateError("TF-IDF vocabulary and idf weights differ in size");
  if (vectorizer.vocabulary_.size() > vectorizer.max_features_)
    throw CorruptStateError("TF-IDF vocabulary exceeds max_features");
  vectorizer.rebuild_index();
  return vectorizer;
}
