#include "models/model_persistence.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace ModelPersistence {

nlohmann::json state_to_json(const ModelState &state) {
  return {{"magic", MAGIC},
          {"format_version", FORMAT_VERSION},
          {"assembler", state.assembler.to_json()},
          {"label_encoder", state.label_encoder.to_json()},
          {"classifier", state.classifier.to_json()},
          {"regressor", state.regressor.to_json()},
          {"classifier_trained", state.classifier_trained},
          {"regressor_trained", state.regressor_trained},
          {"metrics", state.metrics.to_json()}};
}

namespace {
void check_consistency(const ModelState &state) {
  if (state.classifier.task() != TreeTask::CLASSIFICATION ||
      state.regressor.task() != TreeTask::REGRESSION)
    throw CorruptStateError("Model trees are stored under the wrong task");

  if (state.classifier_trained != state.classifier.is_fitted() ||
      state.regressor_trained != state.regressor.is_fitted())
    throw CorruptStateError("Trained flags disagree with the stored trees");

  if (state.classifier_trained) {
    if (!state.assembler.is_fitted())
      throw CorruptStateError("Trained classifier without a fitted assembler");
    if (state.classifier.n_features() != state.assembler.width())
      throw CorruptStateError(
          "Classifier expects " + std::to_string(state.classifier.n_features()) +
          " features but the assembler produces " +
          std::to_string(state.assembler.width()));
    if (state.classifier.n_classes() != state.label_encoder.size())
      throw CorruptStateError("Classifier class count differs from the label "
                              "encoder");
  }
  if (state.regressor_trained &&
      state.regressor.n_features() != state.assembler.width())
    throw CorruptStateError("Regressor feature count differs from the "
                            "assembler width");
}
} // namespace

std::unique_ptr<ModelState> state_from_json(const nlohmann::json &j) {
  try {
    if (!j.is_object() || !j.contains("magic") ||
        j.at("magic").get<std::string>() != MAGIC)
      throw CorruptStateError("Blob is not a saved character model");

    const int version = j.at("format_version").get<int>();
    if (version != FORMAT_VERSION)
      throw CorruptStateError("Unsupported model format version " +
                              std::to_string(version) + " (expected " +
                              std::to_string(FORMAT_VERSION) + ")");

    auto state = std::make_unique<ModelState>();
    state->assembler = FeatureAssembler::from_json(j.at("assembler"));
    state->label_encoder = LabelEncoder::from_json(j.at("label_encoder"));
    state->classifier = DecisionTree::from_json(j.at("classifier"));
    state->regressor = DecisionTree::from_json(j.at("regressor"));
    state->classifier_trained = j.at("classifier_trained").get<bool>();
    state->regressor_trained = j.at("regressor_trained").get<bool>();
    state->metrics = TrainingMetrics::from_json(j.at("metrics"));

    check_consistency(*state);
    return state;
  } catch (const nlohmann::json::exception &e) {
    throw CorruptStateError(std::string("Malformed model state: ") + e.what());
  } catch (const InvalidArgumentError &e) {
    // Stored hyperparameters rejected by the tree constructor
    throw CorruptStateError(std::string("Invalid stored parameter: ") +
                            e.what());
  }
}

std::vector<std::uint8_t> save(const ModelState &state) {
  return nlohmann::json::to_cbor(state_to_json(state));
}

std::unique_ptr<ModelState> load(const std::vector<std::uint8_t> &blob) {
  if (blob.empty())
    throw CorruptStateError("Model blob is empty");

  nlohmann::json j;
  try {
    j = nlohmann::json::from_cbor(blob);
  } catch (const nlohmann::json::exception &e) {
    throw CorruptStateError(std::string("Model blob is not valid CBOR: ") +
                            e.what());
  }
  return state_from_json(j);
}

void save_to_file(const ModelState &state, const std::string &path) {
  const std::vector<std::uint8_t> blob = save(state);
  const std::string tmp_path = path + ".tmp";

  if (!Utils::create_directory_for_file(path))
    throw PersistenceIOError(path, "Could not create model directory");

  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
      throw PersistenceIOError(tmp_path, "Could not open model file for writing");
    out.write(reinterpret_cast<const char *>(blob.data()),
              static_cast<std::streamsize>(blob.size()));
    out.flush();
    if (!out)
      throw PersistenceIOError(tmp_path, "Failed writing model file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::filesystem::remove(tmp_path, ec);
    throw PersistenceIOError(path, "Could not move model file into place");
  }

  LOG(LogLevel::INFO, LogComponent::STATE_PERSIST,
      "Saved model (" << blob.size() << " bytes) to " << path);
}

std::unique_ptr<ModelState> load_from_file(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open())
    throw PersistenceIOError(path, "Could not open model file");

  std::vector<std::uint8_t> blob((std::istreambuf_iterator<char>(in)),
                                 std::istreambuf_iterator<char>());
  if (in.bad())
    throw PersistenceIOError(path, "Failed reading model file");

  auto state = load(blob);
  LOG(LogLevel::INFO, LogComponent::STATE_PERSIST,
      "Loaded model with " << state->label_encoder.size() << " classes from "
                           << path);
  return state;
}

} // namespace ModelPersistence
