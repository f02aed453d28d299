#ifndef TREE_INTROSPECTION_HPP
#define TREE_INTROSPECTION_HPP

#include "models/character_model.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

struct FeatureImportance {
  std::string feature;
  double importance = 0.0;
};

struct RenderedDiagram {
  std::string format = "svg";
  std::string encoding = "base64";
  std::string image;

  nlohmann::json to_json() const {
    return {{"format", format}, {"encoding", encoding}, {"image", image}};
  }
};

enum class DiagramTarget { CLASSIFIER, REGRESSOR };

// Parses "classifier" / "regressor"; anything else is an InvalidArgumentError
DiagramTarget parse_diagram_target(const std::string &which);

// Read-only views over a trained CharacterModel. Every call throws
// NotTrainedError when the model it inspects has not been trained.
namespace TreeIntrospection {

// Highest-importance classifier features, zero-importance ones excluded
std::vector<FeatureImportance> feature_importance(const CharacterModel &model,
                                                  size_t top_n);

// Classifier branching logic in export_text layout:
//   |--- name_length <= 6.50
//   |   |--- class: batman
//   |--- name_length >  6.50
//   ...
// Branches deeper than max_depth split levels are summarised.
std::string decision_rules(const CharacterModel &model, int max_depth);

// SVG drawing of the first max_depth levels of the chosen tree
std::string render_svg(const CharacterModel &model, DiagramTarget which,
                       int max_depth);
RenderedDiagram render_diagram(const CharacterModel &model, DiagramTarget which,
                               int max_depth);
RenderedDiagram render_diagram(const CharacterModel &model,
                               const std::string &which, int max_depth);

} // namespace TreeIntrospection

#endif // TREE_INTROSPECTION_HPP
