#include "models/model_evaluation.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

double accuracy_score(const std::vector<int> &y_true,
                      const std::vector<int> &y_pred) {
  if (y_true.size() != y_pred.size())
    throw InvalidArgumentError("y_pred", "Label vectors differ in length");
  if (y_true.empty())
    return 0.0;
  size_t correct = 0;
  for (size_t i = 0; i < y_true.size(); ++i)
    if (y_true[i] == y_pred[i])
      ++correct;
  return static_cast<double>(correct) / static_cast<double>(y_true.size());
}

double r2_score(const std::vector<double> &y_true,
                const std::vector<double> &y_pred) {
  if (y_true.size() != y_pred.size())
    throw InvalidArgumentError("y_pred", "Target vectors differ in length");
  if (y_true.empty())
    return 0.0;

  const double mean = mean_of(y_true);
  double ss_res = 0.0;
  double ss_tot = 0.0;
  for (size_t i = 0; i < y_true.size(); ++i) {
    ss_res += (y_true[i] - y_pred[i]) * (y_true[i] - y_pred[i]);
    ss_tot += (y_true[i] - mean) * (y_true[i] - mean);
  }
  if (ss_tot == 0.0)
    return ss_res == 0.0 ? 1.0 : 0.0;
  return 1.0 - ss_res / ss_tot;
}

double mean_of(const std::vector<double> &values) {
  if (values.empty())
    return 0.0;
  return std::accumulate(values.begin(), values.end(), 0.0) /
         static_cast<double>(values.size());
}

double stddev_of(const std::vector<double> &values) {
  if (values.empty())
    return 0.0;
  const double mean = mean_of(values);
  double sum_sq = 0.0;
  for (double v : values)
    sum_sq += (v - mean) * (v - mean);
  return std::sqrt(sum_sq / static_cast<double>(values.size()));
}

namespace {
std::vector<std::vector<size_t>> group_by_class(const std::vector<int> &y,
                                                size_t n_classes) {
  std::vector<std::vector<size_t>> members(n_classes);
  for (size_t i = 0; i < y.size(); ++i) {
    if (y[i] < 0 || static_cast<size_t>(y[i]) >= n_classes)
      throw InvalidArgumentError("y", "Class code " + std::to_string(y[i]) +
                                          " outside [0, " +
                                          std::to_string(n_classes) + ")");
    members[static_cast<size_t>(y[i])].push_back(i);
  }
  return members;
}
} // namespace

std::optional<TrainTestSplit> stratified_train_test_split(
    const std::vector<int> &y, size_t n_classes, double test_size,
    uint32_t seed) {
  if (test_size <= 0.0 || test_size >= 1.0)
    throw InvalidArgumentError("test_size", "test_size must be in (0, 1)");

  const size_t n = y.size();
  const size_t n_test =
      static_cast<size_t>(std::ceil(test_size * static_cast<double>(n)));
  if (n_test < n_classes || n - n_test < n_classes)
    return std::nullopt;

  auto members = group_by_class(y, n_classes);

  // Floor of the proportional share, then hand out the rest by largest
  // remainder. A class never gives away its last training sample.
  std::vector<size_t> quota(n_classes, 0);
  std::vector<double> remainder(n_classes, 0.0);
  size_t assigned = 0;
  for (size_t c = 0; c < n_classes; ++c) {
    const double exact = static_cast<double>(members[c].size()) *
                         static_cast<double>(n_test) / static_cast<double>(n);
    quota[c] = std::min(static_cast<size_t>(std::floor(exact)),
                        members[c].size() - 1);
    remainder[c] = exact - std::floor(exact);
    assigned += quota[c];
  }

  std::vector<size_t> order(n_classes);
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    return remainder[a] > remainder[b];
  });
  while (assigned < n_test) {
    bool progressed = false;
    for (size_t c : order) {
      if (assigned == n_test)
        break;
      if (quota[c] + 1 < members[c].size()) {
        ++quota[c];
        ++assigned;
        progressed = true;
      }
    }
    if (!progressed)
      return std::nullopt;
  }

  std::mt19937 rng(seed);
  TrainTestSplit split;
  for (size_t c = 0; c < n_classes; ++c) {
    std::shuffle(members[c].begin(), members[c].end(), rng);
    for (size_t i = 0; i < members[c].size(); ++i) {
      if (i < quota[c])
        split.test.push_back(members[c][i]);
      else
        split.train.push_back(members[c][i]);
    }
  }
  std::sort(split.train.begin(), split.train.end());
  std::sort(split.test.begin(), split.test.end());
  return split;
}

std::vector<std::vector<size_t>> stratified_kfold(const std::vector<int> &y,
                                                  size_t n_classes, size_t k) {
  if (k < 2)
    throw InvalidArgumentError("k", "Cross-validation needs at least 2 folds");
  if (k > y.size())
    throw InvalidArgumentError("k", "More folds than samples");

  auto members = group_by_class(y, n_classes);
  std::vector<std::vector<size_t>> folds(k);
  size_t next_fold = 0;
  for (const auto &class_members : members) {
    for (size_t i : class_members) {
      folds[next_fold].push_back(i);
      next_fold = (next_fold + 1) % k;
    }
  }
  for (auto &fold : folds)
    std::sort(fold.begin(), fold.end());
  return folds;
}

std::vector<double> cross_val_accuracy(const FeatureMatrix &X,
                                       const std::vector<int> &y,
                                       size_t n_classes,
                                       const TreeParams &params, size_t k) {
  auto folds = stratified_kfold(y, n_classes, k);
  std::vector<double> scores;
  scores.reserve(folds.size());

  for (const auto &test_idx : folds) {
    std::vector<bool> in_test(y.size(), false);
    for (size_t i : test_idx)
      in_test[i] = true;
    std::vector<size_t> train_idx;
    for (size_t i = 0; i < y.size(); ++i)
      if (!in_test[i])
        train_idx.push_back(i);

    DecisionTree fold_tree(TreeTask::CLASSIFICATION, params);
    fold_tree.fit_classifier(select_rows(X, train_idx),
                             select_rows(y, train_idx), n_classes);

    std::vector<int> predicted;
    predicted.reserve(test_idx.size());
    for (size_t i : test_idx)
      predicted.push_back(fold_tree.predict_class(X[i]));
    scores.push_back(accuracy_score(select_rows(y, test_idx), predicted));
  }

  LOG(LogLevel::DEBUG, LogComponent::ML_TRAINING,
      "Cross-validation over " << k << " folds, mean accuracy "
                               << mean_of(scores));
  return scores;
}
