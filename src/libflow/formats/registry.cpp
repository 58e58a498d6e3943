#include "libflow/formats/registry.hpp"
#include "libflow/exceptions.hpp"      // libflow::FormatError
#include "libflow/formats/avro.hpp"    // libflow::AvroFormat
#include "libflow/formats/json.hpp"    // libflow::JsonFormat
#include "libflow/formats/parquet.hpp" // libflow::ParquetFormat
#include "libflow/formats/yaml.hpp"    // libflow::YamlFormat
#include <string>                      // std::string
#include <utility>                     // std::move

namespace libflow {

using namespace std::string_literals;

ReplayStreambuf::int_type ReplayStreambuf::underflow() {
  if (gptr() < egptr()) {
    return traits_type::to_int_type(*gptr());
  }

  if (!m_replayed) {
    m_replayed = true;
    if (!m_prefix.empty()) {
      setg(m_prefix.data(), m_prefix.data(), m_prefix.data() + m_prefix.size());
      return traits_type::to_int_type(*gptr());
    }
  }

  if (m_buffer.empty()) {
    m_buffer.resize(BUFFER_SIZE);
  }

  auto n{m_source->sgetn(m_buffer.data(),
      static_cast<std::streamsize>(m_buffer.size()))};
  if (n <= 0) {
    return traits_type::eof();
  }

  setg(m_buffer.data(), m_buffer.data(), m_buffer.data() + n);
  return traits_type::to_int_type(*gptr());
}

Detection::Detection(std::shared_ptr<const Format> format, int confidence,
    std::istream& in, std::string prefix, bool rewound)
    : m_format{std::move(format)}, m_confidence{confidence} {
  if (rewound) {
    m_stream = &in;
    return;
  }
  m_replay_buffer =
      std::make_unique<ReplayStreambuf>(std::move(prefix), in.rdbuf());
  m_replay_stream = std::make_unique<std::istream>(m_replay_buffer.get());
  m_stream = m_replay_stream.get();
}

void Registry::add(std::shared_ptr<const Format> format) {
  auto name{format->name()};
  m_formats.insert_or_assign(std::move(name), std::move(format));
}

std::shared_ptr<const Format> Registry::get(std::string_view name) const {
  auto it{m_formats.find(name)};
  if (it == m_formats.end()) {
    throw FormatError("unknown format: "s + std::string{name});
  }
  return it->second;
}

bool Registry::contains(std::string_view name) const {
  return m_formats.find(name) != m_formats.end();
}

std::vector<std::string> Registry::names() const {
  std::vector<std::string> rv{};
  for (const auto& [name, _] : m_formats) {
    rv.push_back(name);
  }
  return rv;
}

Detection Registry::auto_detect(std::istream& in) const {
  auto start{in.tellg()};
  in.clear();

  std::string prefix(DETECT_PEEK_SIZE, '\0');
  in.read(prefix.data(), static_cast<std::streamsize>(prefix.size()));
  prefix.resize(static_cast<std::size_t>(in.gcount()));
  in.clear();

  bool rewound{false};
  if (start != std::istream::pos_type(-1)) {
    in.seekg(start);
    rewound = !in.fail();
    in.clear();
  }

  std::shared_ptr<const Format> best{};
  int best_score{0};
  for (const auto& [name, format] : m_formats) {
    auto score{format->detector().detect(prefix)};
    if (score > best_score) {
      best_score = score;
      best = format;
    }
  }

  if (!best) {
    throw FormatError("unable to detect format from input");
  }

  return Detection{best, best_score, in, std::move(prefix), rewound};
}

void register_builtin_formats(Registry& registry) {
  registry.add(std::make_shared<JsonFormat>());
  registry.add(std::make_shared<YamlFormat>());
  registry.add(std::make_shared<AvroFormat>());
  registry.add(std::make_shared<ParquetFormat>());
}

Registry& default_registry() {
  static Registry registry{};
  return registry;
}

} // namespace libflow
