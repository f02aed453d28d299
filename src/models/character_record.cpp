#include "models/character_record.hpp"
#include "core/errors.hpp"

#include <string>

namespace {
const std::string kEmpty;

std::optional<std::string> optional_string(const nlohmann::json &j,
                                           const char *key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null())
    return std::nullopt;
  if (!it->is_string())
    throw InvalidRecordError(key, std::string("Field '") + key +
                                      "' must be a string");
  return it->get<std::string>();
}
} // namespace

const std::string &CharacterRecord::name_or_empty() const {
  return name ? *name : kEmpty;
}

const std::string &CharacterRecord::quote_or_empty() const {
  return quote ? *quote : kEmpty;
}

const std::string &CharacterRecord::description_or_empty() const {
  return description ? *description : kEmpty;
}

std::string CharacterRecord::universe_or_default() const {
  return universe.value_or(DEFAULT_CATEGORY);
}

std::string CharacterRecord::genre_or_default() const {
  return genre.value_or(DEFAULT_CATEGORY);
}

double CharacterRecord::difficulty_or_default() const {
  return difficulty.value_or(DEFAULT_DIFFICULTY);
}

std::string CharacterRecord::combined_text() const {
  return quote_or_empty() + " " + name_or_empty() + " " +
         description_or_empty();
}

CharacterRecord character_from_json(const nlohmann::json &j) {
  if (!j.is_object())
    throw InvalidRecordError("", "Character record must be a JSON object");

  CharacterRecord record;

  auto id_it = j.find("id");
  if (id_it != j.end() && !id_it->is_null()) {
    // Catalogue ids are strings, but numeric ids are accepted and stringified
    if (id_it->is_string())
      record.id = id_it->get<std::string>();
    else if (id_it->is_number_integer())
      record.id = std::to_string(id_it->get<long long>());
    else
      throw InvalidRecordError("id", "Field 'id' must be a string");
  }

  record.name = optional_string(j, "name");
  record.quote = optional_string(j, "quote");
  record.description = optional_string(j, "description");
  record.universe = optional_string(j, "universe");
  record.genre = optional_string(j, "genre");

  auto powers_it = j.find("powers");
  if (powers_it != j.end() && !powers_it->is_null()) {
    if (!powers_it->is_array())
      throw InvalidRecordError("powers", "Field 'powers' must be an array");
    for (const auto &power : *powers_it) {
      if (!power.is_string())
        throw InvalidRecordError("powers",
                                 "Field 'powers' must contain strings");
      record.powers.push_back(power.get<std::string>());
    }
  }

  auto difficulty_it = j.find("difficulty");
  if (difficulty_it != j.end() && !difficulty_it->is_null()) {
    if (!difficulty_it->is_number())
      throw InvalidRecordError("difficulty",
                               "Field 'difficulty' must be a number");
    record.difficulty = difficulty_it->get<double>();
  }

  return record;
}

nlohmann::json character_to_json(const CharacterRecord &record) {
  nlohmann::json j = nlohmann::json::object();
  if (record.id)
    j["id"] = *record.id;
  if (record.name)
    j["name"] = *record.name;
  if (record.quote)
    j["quote"] = *record.quote;
  if (record.description)
    j["description"] = *record.description;
  if (record.universe)
    j["universe"] = *record.universe;
  if (record.genre)
    j["genre"] = *record.genre;
  j["powers"] = record.powers;
  if (record.difficulty)
    j["difficulty"] = *record.difficulty;
  return j;
}
