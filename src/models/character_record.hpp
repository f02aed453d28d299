#ifndef CHARACTER_RECORD_HPP
#define CHARACTER_RECORD_HPP

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

// One guessable character as exported from the game's catalogue. Optional
// fields keep "absent" distinguishable from "empty"; the accessors below are
// the only place defaults are applied.
struct CharacterRecord {
  static constexpr const char *DEFAULT_CATEGORY = "Unknown";
  static constexpr double DEFAULT_DIFFICULTY = 5.0;

  std::optional<std::string> id;
  std::optional<std::string> name;
  std::optional<std::string> quote;
  std::optional<std::string> description;
  std::optional<std::string> universe;
  std::optional<std::string> genre;
  std::vector<std::string> powers;
  std::optional<double> difficulty;

  const std::string &name_or_empty() const;
  const std::string &quote_or_empty() const;
  const std::string &description_or_empty() const;
  std::string universe_or_default() const;
  std::string genre_or_default() const;
  double difficulty_or_default() const;

  // Text fed to the TF-IDF vectorizer: "quote name description"
  std::string combined_text() const;
};

// Parses a record from an already-decoded JSON object. Unknown keys are
// ignored, null values count as absent. Throws InvalidRecordError when a known
// field has the wrong type.
CharacterRecord character_from_json(const nlohmann::json &j);
nlohmann::json character_to_json(const CharacterRecord &record);

#endif // CHARACTER_RECORD_HPP
