#pragma once

#include <exception>
#include <string>
#include <string_view>

namespace parastore::common {

enum class ErrorCode {
  NotFound,
  ReadError,
  ParseError,
  ValidationError,
  WriteError,
  RenameError,
  BackupError,
  DeleteError,
  FsError,
  NotArchivable,
  AlreadyArchived,
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code);

struct Error {
  ErrorCode code = ErrorCode::FsError;
  std::string message;
  // Original failure (filesystem_error, YAML::Exception, ValidationFailure, ...).
  std::exception_ptr cause;

  [[nodiscard]] bool has_cause() const { return cause != nullptr; }
  // what() of the cause, or empty when there is none or it is not a std::exception.
  [[nodiscard]] std::string cause_message() const;
};

[[nodiscard]] Error make_error(ErrorCode code, std::string message,
                               std::exception_ptr cause = nullptr);

// Re-labels an error from a lower layer, keeping its cause. The new message is
// `prefix + ": " + inner.message`.
[[nodiscard]] Error rewrap(ErrorCode code, const std::string &prefix, const Error &inner);

// Message for an arbitrary in-flight exception; non-std exceptions are coerced.
[[nodiscard]] std::string describe_exception(const std::exception_ptr &ptr);

} // namespace parastore::common
