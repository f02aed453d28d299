#ifndef MODEL_EVALUATION_HPP
#define MODEL_EVALUATION_HPP

#include "models/decision_tree.hpp"
#include "models/features.hpp"

#include <cstdint>
#include <optional>
#include <vector>

struct TrainTestSplit {
  std::vector<size_t> train;
  std::vector<size_t> test;
};

// Fraction of positions where the two label vectors agree
double accuracy_score(const std::vector<int> &y_true,
                      const std::vector<int> &y_pred);

// Coefficient of determination. A constant target gives 1.0 for a perfect
// fit and 0.0 otherwise.
double r2_score(const std::vector<double> &y_true,
                const std::vector<double> &y_pred);

double mean_of(const std::vector<double> &values);
// Population standard deviation
double stddev_of(const std::vector<double> &values);

// Seeded stratified split. The test partition holds ceil(test_size * n)
// samples distributed over classes by largest remainder, and every class
// keeps at least one training sample. Returns nullopt when no such split
// exists (a partition would be smaller than the number of classes).
std::optional<TrainTestSplit> stratified_train_test_split(
    const std::vector<int> &y, size_t n_classes, double test_size,
    uint32_t seed);

// Deterministic stratified k-fold: samples of each class are dealt to the
// folds in order. Returns the test indices of each fold.
std::vector<std::vector<size_t>> stratified_kfold(const std::vector<int> &y,
                                                  size_t n_classes, size_t k);

// Accuracy of a freshly fitted classifier on every fold
std::vector<double> cross_val_accuracy(const FeatureMatrix &X,
                                       const std::vector<int> &y,
                                       size_t n_classes,
                                       const TreeParams &params, size_t k);

template <typename T>
std::vector<T> select_rows(const std::vector<T> &values,
                           const std::vector<size_t> &indices) {
  std::vector<T> out;
  out.reserve(indices.size());
  for (size_t i : indices)
    out.push_back(values[i]);
  return out;
}

#endif // MODEL_EVALUATION_HPP
