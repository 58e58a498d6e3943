#include "libflow/formats/avro.hpp"
#include "libflow/exceptions.hpp"          // libflow::FormatError
#include "libflow/formats/compression.hpp" // libflow::inflate_raw
#include <cstring>                         // std::memcpy
#include <string>                          // std::string std::to_string
#include <utility>                         // std::move

namespace libflow {

using namespace std::string_literals;

namespace {

const std::map<std::string, AvroType> PRIMITIVES{
    {"null", AvroType::null_},
    {"boolean", AvroType::boolean},
    {"int", AvroType::int_},
    {"long", AvroType::long_},
    {"float", AvroType::float_},
    {"double", AvroType::double_},
    {"bytes", AvroType::bytes},
    {"string", AvroType::string},
};

// Read exactly _n_ bytes from _in_.
std::string read_exact(std::istream& in, std::size_t n) {
  std::string rv(n, '\0');
  in.read(rv.data(), static_cast<std::streamsize>(n));
  if (static_cast<std::size_t>(in.gcount()) != n) {
    throw FormatError("unexpected end of input");
  }
  return rv;
}

// Read a zig-zag encoded variable length long from _in_.
std::int64_t read_stream_long(std::istream& in) {
  std::uint64_t value{0};
  for (int shift{0}; shift < 64; shift += 7) {
    auto c{in.get()};
    if (c == std::char_traits<char>::eof()) {
      throw FormatError("unexpected end of input");
    }
    value |= static_cast<std::uint64_t>(c & 0x7F) << shift;
    if ((c & 0x80) == 0) {
      return static_cast<std::int64_t>(value >> 1) ^
             -static_cast<std::int64_t>(value & 1);
    }
  }
  throw FormatError("varint is too long");
}

std::size_t to_size(std::int64_t n, std::string_view what) {
  if (n < 0) {
    throw FormatError("negative "s + std::string{what} + " " + std::to_string(n));
  }
  return static_cast<std::size_t>(n);
}

std::string qualify(const std::string& name, const std::string& ns) {
  if (ns.empty() || name.find('.') != std::string::npos) {
    return name;
  }
  return ns + "." + name;
}

} // namespace

std::string avro_type_to_string(AvroType type) {
  switch (type) {
  case AvroType::null_:
    return "null";
  case AvroType::boolean:
    return "boolean";
  case AvroType::int_:
    return "int";
  case AvroType::long_:
    return "long";
  case AvroType::float_:
    return "float";
  case AvroType::double_:
    return "double";
  case AvroType::bytes:
    return "bytes";
  case AvroType::string:
    return "string";
  case AvroType::record:
    return "record";
  case AvroType::enum_:
    return "enum";
  case AvroType::array:
    return "array";
  case AvroType::map:
    return "map";
  case AvroType::union_:
    return "union";
  case AvroType::fixed:
    return "fixed";
  default:
    return "unknown";
  }
}

AvroSchema::AvroSchema(std::string_view json) {
  Json::CharReaderBuilder builder{};
  std::unique_ptr<Json::CharReader> reader{builder.newCharReader()};
  Json::Value root{};
  std::string errors{};
  if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors)) {
    throw FormatError("invalid schema: "s + errors);
  }
  m_root = parse_node(root, "");
}

AvroNode* AvroSchema::make_node(AvroType type) {
  m_nodes.push_back(std::make_unique<AvroNode>());
  m_nodes.back()->type = type;
  return m_nodes.back().get();
}

const AvroNode* AvroSchema::lookup(
    const std::string& name, const std::string& ns) const {
  auto it{m_named.find(qualify(name, ns))};
  if (it == m_named.end()) {
    it = m_named.find(name);
  }
  if (it == m_named.end()) {
    throw FormatError("unknown type \""s + name + "\" in schema"s);
  }
  return it->second;
}

const AvroNode* AvroSchema::parse_node(
    const Json::Value& value, const std::string& ns) {
  if (value.isString()) {
    auto name{value.asString()};
    auto it{PRIMITIVES.find(name)};
    if (it != PRIMITIVES.end()) {
      return make_node(it->second);
    }
    return lookup(name, ns);
  }

  if (value.isArray()) {
    auto node{make_node(AvroType::union_)};
    for (const auto& branch : value) {
      node->branches.push_back(parse_node(branch, ns));
    }
    if (node->branches.empty()) {
      throw FormatError("union without branches in schema");
    }
    return node;
  }

  if (!value.isObject() || !value.isMember("type")) {
    throw FormatError("schema node must be a string, array or object with a "
                      "\"type\" member");
  }

  const auto& type{value["type"]};
  if (!type.isString()) {
    return parse_node(type, ns);
  }

  auto type_name{type.asString()};
  if (type_name == "record" || type_name == "error") {
    return parse_named(value, AvroType::record, ns);
  }
  if (type_name == "enum") {
    return parse_named(value, AvroType::enum_, ns);
  }
  if (type_name == "fixed") {
    return parse_named(value, AvroType::fixed, ns);
  }
  if (type_name == "array") {
    auto node{make_node(AvroType::array)};
    node->items = parse_node(value["items"], ns);
    return node;
  }
  if (type_name == "map") {
    auto node{make_node(AvroType::map)};
    node->items = parse_node(value["values"], ns);
    return node;
  }

  // Primitives, possibly annotated with a logical type.
  return parse_node(type, ns);
}

const AvroNode* AvroSchema::parse_named(
    const Json::Value& value, AvroType type, const std::string& ns) {
  if (!value["name"].isString()) {
    throw FormatError(
        avro_type_to_string(type) + " without a name in schema"s);
  }

  auto name{value["name"].asString()};
  auto own_ns{value["namespace"].isString() ? value["namespace"].asString()
                                            : ns};
  auto full_name{qualify(name, own_ns)};
  auto last_dot{full_name.rfind('.')};
  if (last_dot != std::string::npos) {
    own_ns = full_name.substr(0, last_dot);
  }

  auto node{make_node(type)};
  node->name = full_name;
  m_named[full_name] = node;

  if (type == AvroType::record) {
    for (const auto& field : value["fields"]) {
      if (!field["name"].isString()) {
        throw FormatError("record field without a name in schema");
      }
      node->fields.emplace_back(
          field["name"].asString(), parse_node(field["type"], own_ns));
    }
  } else if (type == AvroType::enum_) {
    for (const auto& symbol : value["symbols"]) {
      node->symbols.push_back(symbol.asString());
    }
  } else if (!value["size"].isIntegral() || value["size"].asInt64() < 0) {
    throw FormatError("fixed \""s + full_name + "\" without a valid size"s);
  } else {
    node->size = static_cast<std::size_t>(value["size"].asInt64());
  }

  return node;
}

void AvroReader::need(std::size_t n) const {
  if (n > m_data.size() - m_pos) {
    throw FormatError("unexpected end of block data");
  }
}

std::int64_t AvroReader::read_long() {
  std::uint64_t value{0};
  for (int shift{0}; shift < 64; shift += 7) {
    need(1);
    auto byte{static_cast<std::uint8_t>(m_data[m_pos++])};
    value |= static_cast<std::uint64_t>(byte & 0x7F) << shift;
    if ((byte & 0x80) == 0) {
      return static_cast<std::int64_t>(value >> 1) ^
             -static_cast<std::int64_t>(value & 1);
    }
  }
  throw FormatError("varint is too long");
}

bool AvroReader::read_boolean() {
  need(1);
  return m_data[m_pos++] != 0;
}

float AvroReader::read_float() {
  need(4);
  std::uint32_t bits{0};
  for (std::size_t i{0}; i < 4; ++i) {
    bits |= static_cast<std::uint32_t>(
                static_cast<std::uint8_t>(m_data[m_pos + i]))
            << (8 * i);
  }
  m_pos += 4;
  float rv{};
  std::memcpy(&rv, &bits, sizeof(rv));
  return rv;
}

double AvroReader::read_double() {
  need(8);
  std::uint64_t bits{0};
  for (std::size_t i{0}; i < 8; ++i) {
    bits |= static_cast<std::uint64_t>(
                static_cast<std::uint8_t>(m_data[m_pos + i]))
            << (8 * i);
  }
  m_pos += 8;
  double rv{};
  std::memcpy(&rv, &bits, sizeof(rv));
  return rv;
}

std::string AvroReader::read_bytes() {
  return read_fixed(to_size(read_long(), "length"));
}

std::string AvroReader::read_fixed(std::size_t size) {
  need(size);
  std::string rv{m_data.substr(m_pos, size)};
  m_pos += size;
  return rv;
}

Document AvroReader::read_datum(const AvroNode& node) {
  switch (node.type) {
  case AvroType::null_:
    return Document{};
  case AvroType::boolean:
    return read_boolean();
  case AvroType::int_:
  case AvroType::long_:
    return read_long();
  case AvroType::float_:
    return static_cast<double>(read_float());
  case AvroType::double_:
    return read_double();
  case AvroType::bytes:
  case AvroType::string:
    return read_bytes();
  case AvroType::fixed:
    return read_fixed(node.size);
  case AvroType::enum_: {
    auto index{read_long()};
    if (index < 0 || static_cast<std::size_t>(index) >= node.symbols.size()) {
      throw FormatError("enum index "s + std::to_string(index) +
                        " out of range for "s + node.name);
    }
    return node.symbols[static_cast<std::size_t>(index)];
  }
  case AvroType::union_: {
    auto index{read_long()};
    if (index < 0 || static_cast<std::size_t>(index) >= node.branches.size()) {
      throw FormatError(
          "union index "s + std::to_string(index) + " out of range"s);
    }
    return read_datum(*node.branches[static_cast<std::size_t>(index)]);
  }
  case AvroType::record: {
    Mapping rv{};
    for (const auto& [name, field] : node.fields) {
      rv.insert_or_assign(name, read_datum(*field));
    }
    return rv;
  }
  case AvroType::array: {
    Sequence rv{};
    for (auto count{read_long()}; count != 0; count = read_long()) {
      if (count < 0) {
        count = -count;
        read_long(); // block size in bytes
      }
      for (std::int64_t i{0}; i < count; ++i) {
        rv.push_back(read_datum(*node.items));
      }
    }
    return rv;
  }
  case AvroType::map: {
    Mapping rv{};
    for (auto count{read_long()}; count != 0; count = read_long()) {
      if (count < 0) {
        count = -count;
        read_long();
      }
      for (std::int64_t i{0}; i < count; ++i) {
        auto key{read_bytes()};
        rv.insert_or_assign(std::move(key), read_datum(*node.items));
      }
    }
    return rv;
  }
  default:
    throw FormatError(
        "unsupported schema type "s + avro_type_to_string(node.type));
  }
}

AvroDecoder::AvroDecoder(std::istream& in) : m_in{in} { read_header(); }

void AvroDecoder::read_header() {
  if (read_exact(m_in, AVRO_MAGIC.size()) != AVRO_MAGIC) {
    throw FormatError("not an avro object container file");
  }

  std::map<std::string, std::string> metadata{};
  for (auto count{read_stream_long(m_in)}; count != 0;
       count = read_stream_long(m_in)) {
    if (count < 0) {
      count = -count;
      read_stream_long(m_in);
    }
    for (std::int64_t i{0}; i < count; ++i) {
      auto key{read_exact(m_in, to_size(read_stream_long(m_in), "length"))};
      auto value{read_exact(m_in, to_size(read_stream_long(m_in), "length"))};
      metadata.insert_or_assign(std::move(key), std::move(value));
    }
  }

  m_sync = read_exact(m_in, AVRO_SYNC_SIZE);

  auto schema{metadata.find("avro.schema")};
  if (schema == metadata.end()) {
    throw FormatError("missing avro.schema in file header");
  }
  m_schema = std::make_unique<AvroSchema>(schema->second);

  auto codec{metadata.find("avro.codec")};
  if (codec != metadata.end() && !codec->second.empty()) {
    m_codec = codec->second;
  }
  if (m_codec != "null" && m_codec != "deflate" && m_codec != "snappy") {
    throw FormatError("unsupported codec \""s + m_codec + "\""s);
  }
}

bool AvroDecoder::has_next() {
  if (m_remaining > 0) {
    return true;
  }
  if (m_error) {
    return false;
  }

  try {
    while (m_remaining == 0) {
      if (m_in.peek() == std::char_traits<char>::eof()) {
        return false;
      }
      read_block();
    }
  } catch (const FormatError& e) {
    m_error = e.what();
    return false;
  }
  return true;
}

void AvroDecoder::read_block() {
  auto count{read_stream_long(m_in)};
  if (count < 0) {
    throw FormatError("negative block count " + std::to_string(count));
  }
  auto size{to_size(read_stream_long(m_in), "block size")};
  auto data{read_exact(m_in, size)};
  if (read_exact(m_in, AVRO_SYNC_SIZE) != m_sync) {
    throw FormatError("sync marker mismatch");
  }

  m_block = decompress(std::move(data));
  m_reader = std::make_unique<AvroReader>(m_block);
  m_remaining = count;
}

std::string AvroDecoder::decompress(std::string data) const {
  if (m_codec == "deflate") {
    return inflate_raw(data);
  }
  if (m_codec == "snappy") {
    if (data.size() < 4) {
      throw FormatError("snappy block is missing its checksum");
    }
    auto body{std::string_view{data}.substr(0, data.size() - 4)};
    auto rv{snappy_uncompress(body)};

    std::uint32_t expected{0};
    for (std::size_t i{data.size() - 4}; i < data.size(); ++i) {
      expected = (expected << 8) | static_cast<std::uint8_t>(data[i]);
    }
    if (crc32(rv) != expected) {
      throw FormatError("snappy block checksum mismatch");
    }
    return rv;
  }
  return data;
}

Document AvroDecoder::decode() {
  if (m_remaining <= 0 || !m_reader) {
    throw FormatError("no record available");
  }
  auto rv{m_reader->read_datum(m_schema->root())};
  --m_remaining;
  return rv;
}

int AvroDetector::detect(std::string_view prefix) const {
  return prefix.substr(0, AVRO_MAGIC.size()) == AVRO_MAGIC ? 100 : 0;
}

void AvroParser::for_each(const DocumentCallback& callback) {
  while (m_decoder.has_next()) {
    Document document{};
    try {
      document = m_decoder.decode();
    } catch (const FormatError& e) {
      throw FormatError("failed to decode avro record: "s + e.what());
    }
    callback(std::move(document));
  }

  if (m_decoder.error()) {
    throw FormatError("avro decoder error: "s + *m_decoder.error());
  }
}

std::unique_ptr<DocumentParser> AvroFormat::new_parser(std::istream& in) const {
  try {
    return std::make_unique<AvroParser>(in);
  } catch (const FormatError& e) {
    throw FormatError("failed to create avro decoder: "s + e.what());
  }
}

std::unique_ptr<Formatter> AvroFormat::new_formatter(
    std::ostream&, const FormatterOptions&) const {
  throw UnsupportedError("avro format does not support writing");
}

} // namespace libflow
