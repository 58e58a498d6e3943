#ifndef LIBFLOW_EXCEPTIONS_H
#define LIBFLOW_EXCEPTIONS_H

#include <cstddef>     // std::size_t
#include <exception>   // std::exception
#include <sstream>     // std::ostringstream
#include <string>      // std::string
#include <string_view> // std::string_view

namespace libflow {

inline std::string format_exception(
    std::string_view message, std::string_view path, std::size_t offset) {
  std::ostringstream rv{};
  rv << message << " ('" << path << "':" << offset << ")";
  return rv.str();
}

// Base class for all exceptions thrown from libflow.
class Exception : public std::exception {
public:
  explicit Exception(std::string_view message) : m_message{message} {};

  const char* what() const noexcept override { return m_message.c_str(); };

private:
  std::string m_message{};
};

enum class PathErrorKind {
  empty_path,
  invalid_segment,
  empty_index,
  invalid_index,
  wildcard_not_allowed,
};

// An exception thrown due to a malformed path string, or when a path
// containing a wildcard is given where a concrete path is required.
//
// _offset_ is the byte offset of the offending segment in _path_.
class PathError : public Exception {
public:
  PathError(std::string_view message, PathErrorKind kind, std::string_view path,
      std::size_t offset)
      : Exception{format_exception(message, path, offset)}, m_kind{kind},
        m_path{path}, m_offset{offset} {};

  PathErrorKind kind() const noexcept { return m_kind; };
  const std::string& path() const noexcept { return m_path; };
  std::size_t offset() const noexcept { return m_offset; };

private:
  PathErrorKind m_kind{};
  std::string m_path{};
  std::size_t m_offset{};
};

// An exception thrown when an assignment or condition string can not be
// split into its path and value parts.
class ArgumentError : public Exception {
public:
  explicit ArgumentError(std::string_view message) : Exception{message} {};
};

// An exception thrown from Pipeline::apply() when one of its operations
// fails. _index_ is the zero-based position of the failing operation.
class StepError : public Exception {
public:
  StepError(std::size_t index, std::string_view description,
      std::string_view cause)
      : Exception{format_step_error(index, description, cause)}, m_index{index},
        m_description{description}, m_cause{cause} {};

  std::size_t index() const noexcept { return m_index; };
  const std::string& description() const noexcept { return m_description; };
  const std::string& cause() const noexcept { return m_cause; };

private:
  std::size_t m_index{};
  std::string m_description{};
  std::string m_cause{};

  static std::string format_step_error(std::size_t index,
      std::string_view description, std::string_view cause) {
    std::ostringstream rv{};
    rv << "pipeline step " << index;
    if (!description.empty()) {
      rv << " (" << description << ")";
    }
    rv << " failed: " << cause;
    return rv.str();
  }
};

// An exception thrown due to undecodable input, an unknown format name or
// a failed format detection.
class FormatError : public Exception {
public:
  explicit FormatError(std::string_view message) : Exception{message} {};
};

// An exception thrown when asking a read-only format for a formatter.
class UnsupportedError : public FormatError {
public:
  explicit UnsupportedError(std::string_view message) : FormatError{message} {};
};

// An exception thrown due to invalid command line arguments.
class UsageError : public Exception {
public:
  explicit UsageError(std::string_view message) : Exception{message} {};
};

} // namespace libflow

#endif // LIBFLOW_EXCEPTIONS_H
