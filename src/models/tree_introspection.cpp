#include "models/tree_introspection.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <iomanip>
#include <numeric>
#include <sstream>

DiagramTarget parse_diagram_target(const std::string &which) {
  if (which == "classifier")
    return DiagramTarget::CLASSIFIER;
  if (which == "regressor")
    return DiagramTarget::REGRESSOR;
  throw InvalidArgumentError("tree_type",
                             "Unsupported tree type '" + which +
                                 "', expected 'classifier' or 'regressor'");
}

namespace {
constexpr int kNodeWidth = 190;
constexpr int kNodeHeight = 76;
constexpr int kHorizontalGap = 20;
constexpr int kLevelHeight = 120;
constexpr int kMargin = 20;
constexpr int kTitleHeight = 40;

void require_max_depth(int max_depth) {
  if (max_depth < 1)
    throw InvalidArgumentError("max_depth", "max_depth must be at least 1");
}

const DecisionTree &trained_tree(const CharacterModel &model,
                                 DiagramTarget which) {
  const ModelState &state = model.state();
  if (which == DiagramTarget::CLASSIFIER) {
    if (!state.classifier_trained)
      throw NotTrainedError("Classifier");
    return state.classifier;
  }
  if (!state.regressor_trained)
    throw NotTrainedError("Regressor");
  return state.regressor;
}

std::string format_fixed(double value, int precision = 2) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << value;
  return oss.str();
}

std::string leaf_label(const ModelState &state, const DecisionTree &tree,
                       const Node &node) {
  if (tree.task() == TreeTask::CLASSIFICATION) {
    auto best = std::max_element(node.value.begin(), node.value.end());
    return state.label_encoder.inverse_one(
        static_cast<int>(best - node.value.begin()));
  }
  return format_fixed(node.value.front());
}

// Number of node levels below and including `node`; a lone leaf is 1
int subtree_depth(const Node &node) {
  if (node.is_leaf)
    return 1;
  return 1 + std::max(subtree_depth(*node.left_child),
                      subtree_depth(*node.right_child));
}

void write_rules(std::ostringstream &out, const ModelState &state,
                 const Node &node, int level, int max_depth) {
  const std::vector<std::string> &names = state.assembler.feature_names();
  std::string indent;
  for (int i = 0; i < level; ++i)
    indent += "|   ";
  indent += "|--- ";

  if (node.is_leaf) {
    out << indent << "class: " << leaf_label(state, state.classifier, node)
        << "\n";
    return;
  }
  if (level >= max_depth) {
    out << indent << "truncated branch of depth " << subtree_depth(node)
        << "\n";
    return;
  }

  const std::string &name = names[static_cast<size_t>(node.feature_index)];
  const std::string threshold = format_fixed(node.split_value);
  out << indent << name << " <= " << threshold << "\n";
  write_rules(out, state, *node.left_child, level + 1, max_depth);
  out << indent << name << " >  " << threshold << "\n";
  write_rules(out, state, *node.right_child, level + 1, max_depth);
}

std::string xml_escape(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    default:
      out += c;
    }
  }
  return out;
}

struct PlacedNode {
  const Node *node;
  int level;
  double x; // centre
  bool elided;
  int parent; // index into the placed list, -1 for the root
};

// Leaves of the drawn (depth-limited) tree get consecutive slots; inner nodes
// are centred over their children.
double place(const Node &node, int level, int max_depth, int parent,
             int &next_slot, std::vector<PlacedNode> &placed) {
  const int index = static_cast<int>(placed.size());
  placed.push_back({&node, level, 0.0, false, parent});

  if (!node.is_leaf && level >= max_depth) {
    placed[static_cast<size_t>(index)].elided = true;
  }

  double x;
  if (node.is_leaf || level >= max_depth) {
    x = kMargin + next_slot * (kNodeWidth + kHorizontalGap) + kNodeWidth / 2.0;
    ++next_slot;
  } else {
    double left = place(*node.left_child, level + 1, max_depth, index,
                        next_slot, placed);
    double right = place(*node.right_child, level + 1, max_depth, index,
                         next_slot, placed);
    x = (left + right) / 2.0;
  }
  placed[static_cast<size_t>(index)].x = x;
  return x;
}

double node_top(int level) { return kMargin + kTitleHeight + level * kLevelHeight; }
} // namespace

namespace TreeIntrospection {

std::vector<FeatureImportance> feature_importance(const CharacterModel &model,
                                                  size_t top_n) {
  const DecisionTree &tree = trained_tree(model, DiagramTarget::CLASSIFIER);
  if (top_n == 0)
    throw InvalidArgumentError("top_n", "top_n must be at least 1");

  const std::vector<double> scores = tree.feature_importances();
  const std::vector<std::string> &names = model.state().assembler.feature_names();

  std::vector<size_t> order(scores.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(),
                   [&](size_t a, size_t b) { return scores[a] > scores[b]; });

  std::vector<FeatureImportance> result;
  for (size_t idx : order) {
    if (result.size() == top_n || scores[idx] <= 0.0)
      break;
    result.push_back({names[idx], scores[idx]});
  }
  return result;
}

std::string decision_rules(const CharacterModel &model, int max_depth) {
  const DecisionTree &tree = trained_tree(model, DiagramTarget::CLASSIFIER);
  require_max_depth(max_depth);

  std::ostringstream out;
  write_rules(out, model.state(), *tree.root(), 0, max_depth);
  return out.str();
}

std::string render_svg(const CharacterModel &model, DiagramTarget which,
                       int max_depth) {
  const DecisionTree &tree = trained_tree(model, which);
  require_max_depth(max_depth);
  const ModelState &state = model.state();
  const std::vector<std::string> &names = state.assembler.feature_names();
  const bool classifier = which == DiagramTarget::CLASSIFIER;

  std::vector<PlacedNode> placed;
  int slots = 0;
  place(*tree.root(), 0, max_depth, -1, slots, placed);

  int levels = 0;
  for (const auto &p : placed)
    levels = std::max(levels, p.level);
  const int width = std::max(2 * kMargin + slots * (kNodeWidth + kHorizontalGap),
                             360);
  const int height = static_cast<int>(node_top(levels)) + kNodeHeight + kMargin;

  std::ostringstream out;
  out << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << width
      << "\" height=\"" << height << "\" viewBox=\"0 0 " << width << " "
      << height << "\" font-family=\"sans-serif\" font-size=\"11\">\n";
  out << "<rect width=\"100%\" height=\"100%\" fill=\"#ffffff\"/>\n";
  out << "<text x=\"" << width / 2 << "\" y=\"" << kMargin + 16
      << "\" font-size=\"16\" font-weight=\"bold\" text-anchor=\"middle\">"
      << "Decision Tree - " << (classifier ? "Classifier" : "Regressor")
      << "</text>\n";

  for (const auto &p : placed) {
    if (p.parent < 0)
      continue;
    const PlacedNode &parent = placed[static_cast<size_t>(p.parent)];
    out << "<line x1=\"" << parent.x << "\" y1=\""
        << node_top(parent.level) + kNodeHeight << "\" x2=\"" << p.x
        << "\" y2=\"" << node_top(p.level)
        << "\" stroke=\"#666666\" stroke-width=\"1.5\"/>\n";
  }

  const std::string impurity_name = classifier ? "gini" : "squared_error";
  for (const auto &p : placed) {
    const double left = p.x - kNodeWidth / 2.0;
    const double top = node_top(p.level);
    const char *fill = p.node->is_leaf ? "#e8f4e8" : "#e8eef8";
    if (p.elided)
      fill = "#f2f2f2";
    out << "<rect x=\"" << left << "\" y=\"" << top << "\" width=\""
        << kNodeWidth << "\" height=\"" << kNodeHeight
        << "\" rx=\"6\" fill=\"" << fill << "\" stroke=\"#333333\"/>\n";

    std::vector<std::string> lines;
    if (p.elided) {
      lines.push_back("(...)");
    } else {
      if (!p.node->is_leaf)
        lines.push_back(names[static_cast<size_t>(p.node->feature_index)] +
                        " <= " + format_fixed(p.node->split_value));
      lines.push_back(impurity_name + " = " + format_fixed(p.node->impurity, 3));
      lines.push_back("samples = " + std::to_string(p.node->n_samples));
      lines.push_back((classifier ? "class = " : "value = ") +
                      leaf_label(state, tree, *p.node));
    }

    const double line_height = 15.0;
    double y = top + kNodeHeight / 2.0 -
               line_height * (static_cast<double>(lines.size()) - 1) / 2.0 + 4;
    for (const auto &line : lines) {
      out << "<text x=\"" << p.x << "\" y=\"" << y
          << "\" text-anchor=\"middle\">" << xml_escape(line) << "</text>\n";
      y += line_height;
    }
  }
  out << "</svg>\n";

  LOG(LogLevel::DEBUG, LogComponent::ML_INTROSPECTION,
      "Rendered " << (classifier ? "classifier" : "regressor") << " diagram: "
                  << placed.size() << " nodes, max_depth=" << max_depth);
  return out.str();
}

RenderedDiagram render_diagram(const CharacterModel &model, DiagramTarget which,
                               int max_depth) {
  RenderedDiagram diagram;
  diagram.image = Utils::base64_encode(render_svg(model, which, max_depth));
  return diagram;
}

RenderedDiagram render_diagram(const CharacterModel &model,
                               const std::string &which, int max_depth) {
  return render_diagram(model, parse_diagram_target(which), max_depth);
}

} // namespace TreeIntrospection
