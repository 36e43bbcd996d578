#include "parastore/common/error.hpp"

namespace parastore::common {

std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::NotFound:
    return "NOT_FOUND";
  case ErrorCode::ReadError:
    return "READ_ERROR";
  case ErrorCode::ParseError:
    return "PARSE_ERROR";
  case ErrorCode::ValidationError:
    return "VALIDATION_ERROR";
  case ErrorCode::WriteError:
    return "WRITE_ERROR";
  case ErrorCode::RenameError:
    return "RENAME_ERROR";
  case ErrorCode::BackupError:
    return "BACKUP_ERROR";
  case ErrorCode::DeleteError:
    return "DELETE_ERROR";
  case ErrorCode::FsError:
    return "FS_ERROR";
  case ErrorCode::NotArchivable:
    return "NOT_ARCHIVABLE";
  case ErrorCode::AlreadyArchived:
    return "ALREADY_ARCHIVED";
  }
  return "FS_ERROR";
}

std::string Error::cause_message() const {
  if (cause == nullptr) {
    return "";
  }
  return describe_exception(cause);
}

Error make_error(const ErrorCode code, std::string message, std::exception_ptr cause) {
  return Error{.code = code, .message = std::move(message), .cause = std::move(cause)};
}

Error rewrap(const ErrorCode code, const std::string &prefix, const Error &inner) {
  return Error{.code = code, .message = prefix + ": " + inner.message, .cause = inner.cause};
}

std::string describe_exception(const std::exception_ptr &ptr) {
  if (ptr == nullptr) {
    return "";
  }
  try {
    std::rethrow_exception(ptr);
  } catch (const std::exception &ex) {
    return ex.what();
  } catch (const std::string &text) {
    return text;
  } catch (const char *text) {
    return text != nullptr ? std::string(text) : std::string("unknown error");
  } catch (...) {
    return "unknown error";
  }
}

} // namespace parastore::common
