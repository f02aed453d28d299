#include "io/web/model_service.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "io/character_loader.hpp"
#include "models/model_persistence.hpp"
#include "models/tree_introspection.hpp"
#include "utils/utils.hpp"

#include <mutex>

namespace {
// `details` names what was rejected, e.g. {"argument": "top_n"}
ServiceResponse error_response(int status, const std::string &message,
                               const nlohmann::json &details = nullptr) {
  nlohmann::json body = {{"success", false}, {"error", message}};
  if (details.is_object())
    body.update(details);
  return {status, body};
}

template <typename T>
T query_number(const std::optional<std::string> &raw, T fallback,
               const std::string &name) {
  if (!raw)
    return fallback;
  auto parsed = Utils::string_to_number<T>(*raw);
  if (!parsed)
    throw InvalidArgumentError(name, "Query parameter '" + name +
                                         "' must be a number, got '" + *raw +
                                         "'");
  return *parsed;
}
} // namespace

ModelService::ModelService(const Config::AppConfig &config)
    : config_(config), model_(config.decision_tree) {}

template <typename Fn>
ServiceResponse ModelService::guarded(const char *endpoint,
                                      Fn &&handler) const {
  try {
    return handler();
  } catch (const NotTrainedError &e) {
    return error_response(409, e.what(), {{"model", e.model()}});
  } catch (const NotFittedError &e) {
    return error_response(409, e.what(), {{"component", e.component()}});
  } catch (const CorruptStateError &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_SERVER,
        endpoint << ": corrupt model state: " << e.what());
    return error_response(500, e.what());
  } catch (const PersistenceIOError &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_SERVER,
        endpoint << ": " << e.what());
    return error_response(500, e.what());
  } catch (const InvalidArgumentError &e) {
    return error_response(400, e.what(), {{"argument", e.argument()}});
  } catch (const InvalidRecordError &e) {
    return error_response(400, e.what(), {{"field", e.field()}});
  } catch (const UnknownCategoryError &e) {
    return error_response(400, e.what(),
                          {{"field", e.field()}, {"value", e.value()}});
  } catch (const ModelError &e) {
    LOG(LogLevel::DEBUG, LogComponent::IO_SERVER,
        endpoint << ": rejected request: " << e.what());
    return error_response(400, e.what());
  } catch (const nlohmann::json::exception &e) {
    return error_response(400, std::string("Malformed request body: ") +
                                   e.what());
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_SERVER,
        endpoint << ": unexpected failure: " << e.what());
    return error_response(500, e.what());
  }
}

ServiceResponse ModelService::health() const {
  std::shared_lock<std::shared_mutex> lock(model_mutex_);
  const ModelState &state = model_.state();
  // "loaded" means a servable model is in memory, trained or restored
  nlohmann::json decision_tree = {
      {"loaded", model_.is_trained()},
      {"trained_classifier", state.classifier_trained},
      {"trained_regressor", state.regressor_trained}};
  return {200,
          {{"success", true},
           {"status", "healthy"},
           {"service", "charactle-ml"},
           {"models", {{"decision_tree", decision_tree}}}}};
}

TreeParams ModelService::params_from_body(const nlohmann::json &body) const {
  TreeParams params{config_.decision_tree.max_depth,
                    config_.decision_tree.min_samples_split,
                    config_.decision_tree.min_samples_leaf};
  if (body.is_object()) {
    params.max_depth = body.value("max_depth", params.max_depth);
    params.min_samples_split =
        body.value("min_samples_split", params.min_samples_split);
    params.min_samples_leaf =
        body.value("min_samples_leaf", params.min_samples_leaf);
  }
  return params;
}

CharacterRecord ModelService::character_from_body(const nlohmann::json &body) {
  if (!body.is_object() || !body.contains("character") ||
      !body.at("character").is_object())
    throw InvalidRecordError("character",
                             "Request body needs a 'character' object");
  return character_from_json(body.at("character"));
}

ServiceResponse ModelService::train(const nlohmann::json &body) {
  return guarded("train-dt", [&]() -> ServiceResponse {
    const TreeParams params = params_from_body(body);
    std::vector<CharacterRecord> records;
    if (body.is_object() && body.contains("characters"))
      records = CharacterLoader::parse(body.at("characters"));
    else
      records = CharacterLoader(config_.characters_path).load();

    TrainingMetrics metrics = train_records(records, params);
    if (config_.save_model_after_training)
      save_model(config_.model_path);

    return {200,
            {{"success", true},
             {"message", "Decision tree models trained"},
             {"metrics", metrics.to_json()}}};
  });
}

ServiceResponse ModelService::predict(const nlohmann::json &body) const {
  return guarded("predict-dt", [&]() -> ServiceResponse {
    const CharacterRecord record = character_from_body(body);
    size_t top_k = config_.server.default_top_k;
    if (body.contains("top_k")) {
      const int requested = body.at("top_k").get<int>();
      if (requested < 1)
        throw InvalidArgumentError("top_k", "top_k must be at least 1");
      top_k = static_cast<size_t>(requested);
    }

    std::shared_lock<std::shared_mutex> lock(model_mutex_);
    nlohmann::json predictions = nlohmann::json::array();
    for (const auto &p : model_.predict_label(record, top_k))
      predictions.push_back({{"character", p.label},
                             {"probability", p.probability},
                             {"confidence", p.confidence}});
    return {200, {{"success", true}, {"predictions", predictions}}};
  });
}

ServiceResponse
ModelService::predict_difficulty(const nlohmann::json &body) const {
  return guarded("predict-difficulty-dt", [&]() -> ServiceResponse {
    const CharacterRecord record = character_from_body(body);
    std::shared_lock<std::shared_mutex> lock(model_mutex_);
    return {200,
            {{"success", true}, {"difficulty", model_.predict_value(record)}}};
  });
}

ServiceResponse ModelService::feature_importance(
    const std::optional<std::string> &top_n) const {
  return guarded("dt-feature-importance", [&]() -> ServiceResponse {
    const int n = query_number<int>(top_n, static_cast<int>(DEFAULT_TOP_N),
                                    "top_n");
    if (n < 1)
      throw InvalidArgumentError("top_n", "top_n must be at least 1");

    std::shared_lock<std::shared_mutex> lock(model_mutex_);
    nlohmann::json features = nlohmann::json::array();
    for (const auto &f :
         TreeIntrospection::feature_importance(model_, static_cast<size_t>(n)))
      features.push_back({{"feature", f.feature}, {"importance", f.importance}});
    return {200, {{"success", true}, {"features", features}}};
  });
}

ServiceResponse
ModelService::rules(const std::optional<std::string> &max_depth) const {
  return guarded("dt-rules", [&]() -> ServiceResponse {
    const int depth =
        query_number<int>(max_depth, DEFAULT_RULES_DEPTH, "max_depth");
    std::shared_lock<std::shared_mutex> lock(model_mutex_);
    return {200,
            {{"success", true},
             {"rules", TreeIntrospection::decision_rules(model_, depth)}}};
  });
}

ServiceResponse
ModelService::visualize(const std::optional<std::string> &tree_type,
                        const std::optional<std::string> &max_depth) const {
  return guarded("dt-visualize", [&]() -> ServiceResponse {
    const DiagramTarget target =
        parse_diagram_target(tree_type.value_or("classifier"));
    const int depth =
        query_number<int>(max_depth, DEFAULT_DIAGRAM_DEPTH, "max_depth");

    std::shared_lock<std::shared_mutex> lock(model_mutex_);
    nlohmann::json body =
        TreeIntrospection::render_diagram(model_, target, depth).to_json();
    body["success"] = true;
    return {200, body};
  });
}

ServiceResponse ModelService::info() const {
  return guarded("dt-info", [&]() -> ServiceResponse {
    std::shared_lock<std::shared_mutex> lock(model_mutex_);
    return {200, {{"success", true}, {"model_info", model_.model_info()}}};
  });
}

TrainingMetrics
ModelService::train_records(const std::vector<CharacterRecord> &records,
                            const TreeParams &params) {
  std::unique_lock<std::shared_mutex> lock(model_mutex_);
  return model_.train(records, params);
}

void ModelService::load_model(const std::string &path) {
  // Decode outside the lock; only the swap is exclusive
  auto state = ModelPersistence::load_from_file(path);
  std::unique_lock<std::shared_mutex> lock(model_mutex_);
  model_.replace_state(std::move(state));
}

void ModelService::save_model(const std::string &path) const {
  // Exclusive so two saves never share the temporary file
  std::unique_lock<std::shared_mutex> lock(model_mutex_);
  ModelPersistence::save_to_file(model_.state(), path);
}

bool ModelService::is_trained() const {
  std::shared_lock<std::shared_mutex> lock(model_mutex_);
  return model_.is_trained();
}
