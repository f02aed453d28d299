#ifndef MODEL_PERSISTENCE_HPP
#define MODEL_PERSISTENCE_HPP

#include "models/character_model.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Saves and restores a complete ModelState as one CBOR document. Loading is
// all-or-nothing: a new state is returned only when every component decoded
// and cross-checked, otherwise CorruptStateError is thrown.
namespace ModelPersistence {

constexpr const char *MAGIC = "charactle-dt";
constexpr int FORMAT_VERSION = 1;

nlohmann::json state_to_json(const ModelState &state);
std::unique_ptr<ModelState> state_from_json(const nlohmann::json &j);

std::vector<std::uint8_t> save(const ModelState &state);
std::unique_ptr<ModelState> load(const std::vector<std::uint8_t> &blob);

// Writes to "<path>.tmp" and renames over `path`, so an existing model file
// is only replaced by a complete one
void save_to_file(const ModelState &state, const std::string &path);
std::unique_ptr<ModelState> load_from_file(const std::string &path);

} // namespace ModelPersistence

#endif // MODEL_PERSISTENCE_HPP
