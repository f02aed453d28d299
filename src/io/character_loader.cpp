#include "io/character_loader.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <fstream>
#include <utility>

CharacterLoader::CharacterLoader(std::string filepath)
    : filepath_(std::move(filepath)) {}

std::vector<CharacterRecord> CharacterLoader::load() const {
  std::ifstream in(filepath_);
  if (!in.is_open()) {
    LOG(LogLevel::ERROR, LogComponent::IO_READER,
        "Could not open character catalogue: " << filepath_);
    throw PersistenceIOError(filepath_, "Could not open character catalogue");
  }

  nlohmann::json document;
  try {
    in >> document;
  } catch (const nlohmann::json::parse_error &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_READER,
        "Character catalogue " << filepath_ << " is not valid JSON: "
                               << e.what());
    throw InvalidRecordError("characters", std::string("Catalogue ") +
                                               filepath_ +
                                               " is not valid JSON: " + e.what());
  }

  auto records = parse(document);
  LOG(LogLevel::INFO, LogComponent::IO_READER,
      "Loaded " << records.size() << " characters from " << filepath_);
  return records;
}

std::vector<CharacterRecord>
CharacterLoader::parse(const nlohmann::json &document) {
  const nlohmann::json *list = &document;
  if (document.is_object()) {
    auto it = document.find("characters");
    if (it == document.end())
      throw InvalidRecordError("characters",
                               "Expected a 'characters' array in the document");
    list = &*it;
  }
  if (!list->is_array())
    throw InvalidRecordError("characters", "'characters' must be an array");

  std::vector<CharacterRecord> records;
  records.reserve(list->size());
  size_t index = 0;
  for (const auto &entry : *list) {
    if (!entry.is_object())
      throw InvalidRecordError("characters",
                               "Character at index " + std::to_string(index) +
                                   " is not an object");
    records.push_back(character_from_json(entry));
    ++index;
  }
  LOG(LogLevel::TRACE, LogComponent::IO_READER,
      "Parsed " << records.size() << " character records");
  return records;
}
