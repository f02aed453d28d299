#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Base class for every typed failure raised by the model pipeline. The
// serving layer translates these into user-visible responses.
class ModelError : public std::runtime_error {
public:
  explicit ModelError(const std::string &msg) : std::runtime_error(msg) {}
};

// An encoder, vectorizer or assembler was used before it was fitted.
class NotFittedError : public ModelError {
public:
  explicit NotFittedError(const std::string &component)
      : ModelError(component + " is not fitted yet"), component_(component) {}

  const std::string &component() const { return component_; }

private:
  std::string component_;
};

// A prediction or introspection call was made before train().
class NotTrainedError : public ModelError {
public:
  explicit NotTrainedError(const std::string &model)
      : ModelError(model + " not trained. Call train() first."),
        model_(model) {}

  const std::string &model() const { return model_; }

private:
  std::string model_;
};

class UnknownCategoryError : public ModelError {
public:
  UnknownCategoryError(const std::string &field, const std::string &value)
      : ModelError("Unknown " + field + " '" + value +
                   "' (not seen during training)"),
        field_(field), value_(value) {}

  const std::string &field() const { return field_; }
  const std::string &value() const { return value_; }

private:
  std::string field_;
  std::string value_;
};

class InsufficientDataError : public ModelError {
public:
  explicit InsufficientDataError(const std::string &msg) : ModelError(msg) {}
};

class InvalidRecordError : public ModelError {
public:
  InvalidRecordError(const std::string &field, const std::string &msg)
      : ModelError(msg), field_(field) {}

  const std::string &field() const { return field_; }

private:
  std::string field_;
};

class InvalidArgumentError : public ModelError {
public:
  InvalidArgumentError(const std::string &argument, const std::string &msg)
      : ModelError(msg), argument_(argument) {}

  const std::string &argument() const { return argument_; }

private:
  std::string argument_;
};

// A persisted model blob is malformed, truncated or from another format
// version.
class CorruptStateError : public ModelError {
public:
  explicit CorruptStateError(const std::string &msg) : ModelError(msg) {}
};

// A model file could not be opened, written or renamed.
class PersistenceIOError : public ModelError {
public:
  PersistenceIOError(const std::string &path, const std::string &msg)
      : ModelError(msg + ": " + path) {}
};

#endif // ERRORS_HPP
