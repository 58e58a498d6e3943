#ifndef LIBFLOW_FORMATS_AVRO_H
#define LIBFLOW_FORMATS_AVRO_H

#include "libflow/formats/format.hpp"
#include <cstddef>     // std::size_t
#include <cstdint>     // std::int64_t
#include <json/json.h> // Json::Value
#include <map>         // std::map
#include <memory>      // std::unique_ptr
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view
#include <utility>     // std::pair
#include <vector>      // std::vector

namespace libflow {

// Object container files start with these four bytes.
inline constexpr std::string_view AVRO_MAGIC{"Obj\x01", 4};
inline constexpr std::size_t AVRO_SYNC_SIZE{16};

enum class AvroType {
  null_,
  boolean,
  int_,
  long_,
  float_,
  double_,
  bytes,
  string,
  record,
  enum_,
  array,
  map,
  union_,
  fixed,
};

// Return a string representation of AvroType _type_.
std::string avro_type_to_string(AvroType type);

// One node of a parsed Avro schema. Child nodes are owned by the
// AvroSchema they were parsed into.
struct AvroNode {
  AvroType type{};
  std::string name{};
  std::vector<std::pair<std::string, const AvroNode*>> fields{};
  std::vector<std::string> symbols{};
  std::vector<const AvroNode*> branches{};
  const AvroNode* items{nullptr};
  std::size_t size{0};
};

// A parsed Avro schema, as embedded in a container file header.
class AvroSchema {
public:
  // Parse the JSON text of a schema. Throws a FormatError if the schema is
  // malformed or refers to an undefined named type.
  explicit AvroSchema(std::string_view json);

  AvroSchema(const AvroSchema&) = delete;
  AvroSchema& operator=(const AvroSchema&) = delete;

  const AvroNode& root() const noexcept { return *m_root; };

private:
  std::vector<std::unique_ptr<AvroNode>> m_nodes{};
  std::map<std::string, const AvroNode*> m_named{};
  const AvroNode* m_root{nullptr};

  const AvroNode* parse_node(
      const Json::Value& value, const std::string& enclosing_namespace);
  const AvroNode* parse_named(
      const Json::Value& value, AvroType type, const std::string& ns);
  const AvroNode* lookup(const std::string& name, const std::string& ns) const;
  AvroNode* make_node(AvroType type);
};

// Decodes binary encoded Avro data from a byte buffer.
class AvroReader {
public:
  explicit AvroReader(std::string_view data) : m_data{data} {};

  std::int64_t read_long();
  bool read_boolean();
  float read_float();
  double read_double();
  std::string read_bytes();
  std::string read_fixed(std::size_t size);

  // Decode one datum described by _node_.
  Document read_datum(const AvroNode& node);

  std::size_t position() const noexcept { return m_pos; };
  bool at_end() const noexcept { return m_pos >= m_data.size(); };

private:
  std::string_view m_data{};
  std::size_t m_pos{0};

  void need(std::size_t n) const;
};

// Reads records from an object container file one block at a time.
//
// Errors reading a block are recorded rather than thrown. has_next()
// returns false once an error is recorded and error() describes it.
class AvroDecoder {
public:
  // Read the container header from _in_. Throws a FormatError if the header
  // is malformed or uses an unsupported codec.
  explicit AvroDecoder(std::istream& in);

  bool has_next();

  // Decode the next record. Throws a FormatError if the record can not be
  // decoded.
  Document decode();

  const std::optional<std::string>& error() const noexcept { return m_error; };
  const std::string& codec() const noexcept { return m_codec; };
  const AvroSchema& schema() const noexcept { return *m_schema; };

private:
  std::istream& m_in;
  std::unique_ptr<AvroSchema> m_schema{};
  std::string m_codec{"null"};
  std::string m_sync{};
  std::string m_block{};
  std::unique_ptr<AvroReader> m_reader{};
  std::int64_t m_remaining{0};
  std::optional<std::string> m_error{};

  void read_header();
  void read_block();
  std::string decompress(std::string data) const;
};

class AvroDetector : public Detector {
public:
  int detect(std::string_view prefix) const override;
};

class AvroParser : public DocumentParser {
public:
  explicit AvroParser(std::istream& in) : m_decoder{in} {};

  void for_each(const DocumentCallback& callback) override;

private:
  AvroDecoder m_decoder;
};

// Avro is read only. new_formatter() throws an UnsupportedError.
class AvroFormat : public Format {
public:
  std::string name() const override { return "avro"; };
  const Detector& detector() const override { return m_detector; };
  std::unique_ptr<DocumentParser> new_parser(std::istream& in) const override;
  std::unique_ptr<Formatter> new_formatter(
      std::ostream& out, const FormatterOptions& options) const override;

private:
  AvroDetector m_detector{};
};

} // namespace libflow

#endif // LIBFLOW_FORMATS_AVRO_H
