#ifndef LIBFLOW_FORMATS_FORMAT_H
#define LIBFLOW_FORMATS_FORMAT_H

#include "libflow/document.hpp"
#include <functional>  // std::function
#include <iostream>    // std::istream std::ostream
#include <memory>      // std::unique_ptr
#include <string>      // std::string
#include <string_view> // std::string_view

namespace libflow {

// The number of leading bytes handed to detectors.
inline constexpr std::size_t DETECT_PEEK_SIZE{1024};

struct FormatterOptions {
  bool compact{false};
};

// Score how likely a byte prefix is to be in a given format. 100 means an
// unambiguous marker was found, 0 rules the format out.
class Detector {
public:
  virtual ~Detector() = default;
  virtual int detect(std::string_view prefix) const = 0;
};

using DocumentCallback = std::function<void(Document)>;

// Stream decoded documents, in input order, to a callback. Decoding stops
// at the end of input. Decode errors are thrown as FormatError and
// exceptions thrown by the callback propagate unchanged.
class DocumentParser {
public:
  virtual ~DocumentParser() = default;
  virtual void for_each(const DocumentCallback& callback) = 0;
};

// Serialize documents one at a time. _close()_ must be called once after
// the last _write()_.
class Formatter {
public:
  virtual ~Formatter() = default;
  virtual void write(const Document& document) = 0;
  virtual void close() = 0;
};

// Return _prefix_ without leading spaces, tabs and line breaks.
std::string_view trim_leading_space(std::string_view prefix) noexcept;

// Return true if the first line of _prefix_ has a `:` before any `,` or `}`,
// suggesting YAML `key: value` style.
bool looks_like_key_value(std::string_view prefix) noexcept;

// A detector, parser and formatter triple for one serialization.
class Format {
public:
  virtual ~Format() = default;

  virtual std::string name() const = 0;
  virtual const Detector& detector() const = 0;

  // Return a parser reading from _in_. _in_ must outlive the parser.
  virtual std::unique_ptr<DocumentParser> new_parser(std::istream& in) const = 0;

  // Return a formatter writing to _out_. _out_ must outlive the formatter.
  // Throws an UnsupportedError for read-only formats.
  virtual std::unique_ptr<Formatter> new_formatter(
      std::ostream& out, const FormatterOptions& options) const = 0;
};

} // namespace libflow

#endif // LIBFLOW_FORMATS_FORMAT_H
