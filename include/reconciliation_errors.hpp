#ifndef RECONCILIATION_ERRORS_HPP_
#define RECONCILIATION_ERRORS_HPP_

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace payrecon {

enum class ErrorCode {
  MALFORMED_MESSAGE,
  AMBIGUOUS_MATCH,
  STORAGE_CONFLICT,
  STORAGE_FAILURE,
  INVALID_CONFIG,
  INVALID_INPUT,
  INTERNAL
};

inline std::string toString(ErrorCode code) {
  switch (code) {
    case ErrorCode::MALFORMED_MESSAGE: return "MALFORMED_MESSAGE";
    case ErrorCode::AMBIGUOUS_MATCH: return "AMBIGUOUS_MATCH";
    case ErrorCode::STORAGE_CONFLICT: return "STORAGE_CONFLICT";
    case ErrorCode::STORAGE_FAILURE: return "STORAGE_FAILURE";
    case ErrorCode::INVALID_CONFIG: return "INVALID_CONFIG";
    case ErrorCode::INVALID_INPUT: return "INVALID_INPUT";
    case ErrorCode::INTERNAL: return "INTERNAL";
  }
  return "UNKNOWN";
}

/**
 * Base class for all errors raised by the reconciliation core.
 */
class ReconciliationError : public std::runtime_error {
 public:
  ReconciliationError(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

/**
 * A required wire message tag is missing or cannot be decoded.
 */
class MalformedMessageError : public ReconciliationError {
 public:
  explicit MalformedMessageError(const std::string& message)
      : ReconciliationError(ErrorCode::MALFORMED_MESSAGE, message) {}
};

/**
 * Two candidates tie on an exact-reference match. Needs manual resolution.
 */
class AmbiguousMatchError : public ReconciliationError {
 public:
  explicit AmbiguousMatchError(const std::string& message)
      : ReconciliationError(ErrorCode::AMBIGUOUS_MATCH, message) {}
};

/**
 * The obligation store refused to reconcile an obligation a second time.
 */
class StorageConflictError : public ReconciliationError {
 public:
  StorageConflictError(const std::string& obligation_id, const std::string& transaction_id)
      : ReconciliationError(ErrorCode::STORAGE_CONFLICT,
                            "obligation " + obligation_id +
                                " already reconciled; rejected transaction " + transaction_id),
        obligation_id_(obligation_id) {}

  const std::string& obligationId() const { return obligation_id_; }

 private:
  std::string obligation_id_;
};

class ConfigError : public ReconciliationError {
 public:
  explicit ConfigError(const std::string& message)
      : ReconciliationError(ErrorCode::INVALID_CONFIG, message) {}
};

struct ErrorInfo {
  ErrorCode code = ErrorCode::INTERNAL;
  std::string message;

  static ErrorInfo from(const ReconciliationError& e) { return ErrorInfo{e.code(), e.what()}; }
};

/**
 * Value-or-error holder used for per-item results in batch processing.
 */
template <typename T>
class Result {
 public:
  Result(T value) : data_(std::move(value)) {}
  Result(ErrorInfo error) : data_(std::move(error)) {}

  bool ok() const { return std::holds_alternative<T>(data_); }
  explicit operator bool() const { return ok(); }

  const T& value() const { return std::get<T>(data_); }
  T& value() { return std::get<T>(data_); }
  const ErrorInfo& error() const { return std::get<ErrorInfo>(data_); }

  const T* operator->() const { return &value(); }
  const T& operator*() const { return value(); }

 private:
  std::variant<T, ErrorInfo> data_;
};

}  // namespace payrecon

#endif  // RECONCILIATION_ERRORS_HPP_
