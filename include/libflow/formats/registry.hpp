#ifndef LIBFLOW_FORMATS_REGISTRY_H
#define LIBFLOW_FORMATS_REGISTRY_H

#include "libflow/formats/format.hpp"
#include <functional>  // std::less
#include <iostream>    // std::istream std::streambuf
#include <map>         // std::map
#include <memory>      // std::shared_ptr std::unique_ptr
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

namespace libflow {

// A read only stream buffer that yields _prefix_ before the remaining
// contents of _source_. Used to give back bytes peeked from a stream that
// can not seek.
class ReplayStreambuf : public std::streambuf {
public:
  ReplayStreambuf(std::string prefix, std::streambuf* source)
      : m_prefix{std::move(prefix)}, m_source{source} {};

protected:
  int_type underflow() override;

private:
  static constexpr std::size_t BUFFER_SIZE{64 * 1024};

  std::string m_prefix{};
  std::streambuf* m_source{nullptr};
  bool m_replayed{false};
  std::vector<char> m_buffer{};
};

// The outcome of Registry::auto_detect(). _stream()_ reads the whole input,
// including the bytes consumed during detection.
class Detection {
public:
  Detection(std::shared_ptr<const Format> format, int confidence,
      std::istream& in, std::string prefix, bool rewound);

  const std::shared_ptr<const Format>& format() const noexcept {
    return m_format;
  };
  int confidence() const noexcept { return m_confidence; };
  std::istream& stream() noexcept { return *m_stream; };

private:
  std::shared_ptr<const Format> m_format{};
  int m_confidence{0};
  std::unique_ptr<ReplayStreambuf> m_replay_buffer{};
  std::unique_ptr<std::istream> m_replay_stream{};
  std::istream* m_stream{nullptr};
};

// A mapping of format names to formats.
class Registry {
public:
  // Register _format_, replacing any format with the same name.
  void add(std::shared_ptr<const Format> format);

  // Return the format named _name_. Throws a FormatError if there is no
  // such format.
  std::shared_ptr<const Format> get(std::string_view name) const;

  bool contains(std::string_view name) const;

  // Return the names of all registered formats, sorted.
  std::vector<std::string> names() const;

  // Peek at most DETECT_PEEK_SIZE bytes from _in_ and return the format
  // whose detector scores highest. Ties go to the first name in sorted
  // order. Throws a FormatError if no detector scores above zero.
  Detection auto_detect(std::istream& in) const;

private:
  std::map<std::string, std::shared_ptr<const Format>, std::less<>>
      m_formats{};
};

// Register the json, yaml, avro and parquet formats with _registry_.
void register_builtin_formats(Registry& registry);

// The process wide registry. It is empty until formats are registered.
Registry& default_registry();

} // namespace libflow

#endif // LIBFLOW_FORMATS_REGISTRY_H
