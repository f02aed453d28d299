#ifndef CHARACTER_LOADER_HPP
#define CHARACTER_LOADER_HPP

#include "models/character_record.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

// Reads the exported character catalogue. Accepts either a top-level array
// of records or an object with a "characters" array.
class CharacterLoader {
public:
  explicit CharacterLoader(std::string filepath);

  std::vector<CharacterRecord> load() const;

  // Shared with the HTTP adapter, which receives the same layout in bodies
  static std::vector<CharacterRecord> parse(const nlohmann::json &document);

private:
  std::string filepath_;
};

#endif // CHARACTER_LOADER_HPP
