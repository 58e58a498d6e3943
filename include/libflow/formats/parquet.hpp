#ifndef LIBFLOW_FORMATS_PARQUET_H
#define LIBFLOW_FORMATS_PARQUET_H

#include "libflow/formats/format.hpp"
#include <cstddef>     // std::size_t
#include <cstdint>     // std::int16_t std::int32_t std::int64_t std::uint8_t
#include <memory>      // std::unique_ptr
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view
#include <utility>     // std::pair
#include <vector>      // std::vector

namespace libflow {

// Parquet files start and end with these four bytes.
inline constexpr std::string_view PARQUET_MAGIC{"PAR1"};

enum class PhysicalType : std::int32_t {
  boolean = 0,
  int32 = 1,
  int64 = 2,
  int96 = 3,
  float_ = 4,
  double_ = 5,
  byte_array = 6,
  fixed_len_byte_array = 7,
};

enum class Repetition : std::int32_t {
  required = 0,
  optional = 1,
  repeated = 2,
};

enum class Encoding : std::int32_t {
  plain = 0,
  plain_dictionary = 2,
  rle = 3,
  bit_packed = 4,
  rle_dictionary = 8,
};

enum class PageType : std::int32_t {
  data_page = 0,
  index_page = 1,
  dictionary_page = 2,
  data_page_v2 = 3,
};

enum class CompressionCodec : std::int32_t {
  uncompressed = 0,
  snappy = 1,
  gzip = 2,
};

struct SchemaElement {
  std::optional<PhysicalType> type{};
  std::int32_t type_length{0};
  Repetition repetition{Repetition::required};
  std::string name{};
  std::int32_t num_children{0};
  std::optional<std::int32_t> converted_type{};
};

struct ColumnMetaData {
  PhysicalType type{};
  std::vector<std::string> path_in_schema{};
  CompressionCodec codec{CompressionCodec::uncompressed};
  std::int64_t num_values{0};
  std::int64_t total_compressed_size{0};
  std::int64_t data_page_offset{0};
  std::optional<std::int64_t> dictionary_page_offset{};
};

struct ColumnChunk {
  std::optional<std::string> file_path{};
  ColumnMetaData meta_data{};
};

struct RowGroup {
  std::vector<ColumnChunk> columns{};
  std::int64_t num_rows{0};
};

struct FileMetaData {
  std::int32_t version{0};
  std::vector<SchemaElement> schema{};
  std::int64_t num_rows{0};
  std::vector<RowGroup> row_groups{};
};

struct DataPageHeader {
  std::int32_t num_values{0};
  Encoding encoding{Encoding::plain};
  Encoding definition_level_encoding{Encoding::rle};
  Encoding repetition_level_encoding{Encoding::rle};
};

struct DataPageHeaderV2 {
  std::int32_t num_values{0};
  std::int32_t num_nulls{0};
  std::int32_t num_rows{0};
  Encoding encoding{Encoding::plain};
  std::int32_t definition_levels_byte_length{0};
  std::int32_t repetition_levels_byte_length{0};
  bool is_compressed{true};
};

struct DictionaryPageHeader {
  std::int32_t num_values{0};
  Encoding encoding{Encoding::plain};
};

struct PageHeader {
  PageType type{};
  std::int32_t uncompressed_page_size{0};
  std::int32_t compressed_page_size{0};
  std::optional<DataPageHeader> data_page_header{};
  std::optional<DictionaryPageHeader> dictionary_page_header{};
  std::optional<DataPageHeaderV2> data_page_header_v2{};
};

// Thrift compact protocol field and element types.
enum class ThriftType : std::uint8_t {
  stop = 0x00,
  boolean_true = 0x01,
  boolean_false = 0x02,
  byte = 0x03,
  i16 = 0x04,
  i32 = 0x05,
  i64 = 0x06,
  double_ = 0x07,
  binary = 0x08,
  list = 0x09,
  set = 0x0A,
  map = 0x0B,
  struct_ = 0x0C,
};

struct ThriftField {
  std::int16_t id{0};
  ThriftType type{ThriftType::stop};
};

// Reads thrift compact protocol values from a byte buffer. Every read
// throws a FormatError if the buffer is exhausted.
class ThriftReader {
public:
  explicit ThriftReader(std::string_view data) : m_data{data} {};

  std::uint8_t read_byte();
  std::uint64_t read_varint();
  std::int32_t read_i32();
  std::int64_t read_i64();
  std::string read_binary();

  // Return the next _n_ raw bytes and move past them.
  std::string_view read_bytes(std::size_t n);

  // Read a field header. _last_id_ is the id of the previous field in the
  // same struct, and is updated.
  ThriftField read_field_header(std::int16_t& last_id);

  // Read a list or set header, returning the element count and type.
  std::pair<std::size_t, ThriftType> read_list_header();

  // Read a boolean struct field, whose value is carried by its type.
  bool read_bool(const ThriftField& field) const noexcept {
    return field.type == ThriftType::boolean_true;
  };

  void skip(ThriftType type);
  void skip_struct();

  std::size_t position() const noexcept { return m_pos; };

private:
  std::string_view m_data{};
  std::size_t m_pos{0};
};

FileMetaData parse_file_metadata(ThriftReader& reader);
PageHeader parse_page_header(ThriftReader& reader);

// One leaf column of a parquet schema.
struct ParquetColumn {
  std::vector<std::string> path{};
  PhysicalType type{};
  std::int32_t type_length{0};
  std::uint32_t max_definition_level{0};

  // The definition level at which each element of _path_ is present.
  std::vector<std::uint32_t> path_definition_levels{};
};

// Decode _count_ values from an RLE / bit-packed hybrid run of _bit_width_
// bit values. Returns the values and the number of bytes consumed.
std::pair<std::vector<std::uint32_t>, std::size_t> decode_rle_bit_packed(
    std::string_view data, unsigned bit_width, std::size_t count);

// Random access reader for a parquet file held in a seekable stream.
class ParquetFile {
public:
  // Read the footer from _in_. Throws a FormatError if _in_ can not seek,
  // is not a parquet file or uses repeated fields.
  explicit ParquetFile(std::istream& in);

  const FileMetaData& metadata() const noexcept { return m_metadata; };
  const std::vector<ParquetColumn>& columns() const noexcept {
    return m_columns;
  };

  // Return the rows of row group _index_ as mappings.
  std::vector<Document> read_row_group(std::size_t index);

private:
  std::istream& m_in;
  std::int64_t m_size{0};
  FileMetaData m_metadata{};
  std::vector<ParquetColumn> m_columns{};

  struct ColumnValues {
    std::vector<std::uint32_t> definition_levels{};
    std::vector<Document> values{};
  };

  std::string read_at(std::int64_t offset, std::int64_t size);
  ColumnValues read_column(
      const ParquetColumn& column, const ColumnMetaData& meta);
  void build_columns();
};

class ParquetDetector : public Detector {
public:
  int detect(std::string_view prefix) const override;
};

// Streams rows, one row group at a time. The constructor reads the footer
// and throws a FormatError for unusable input.
class ParquetParser : public DocumentParser {
public:
  explicit ParquetParser(std::istream& in) : m_file{in} {};

  void for_each(const DocumentCallback& callback) override;

private:
  ParquetFile m_file;
};

// Parquet is read only. new_formatter() throws an UnsupportedError.
class ParquetFormat : public Format {
public:
  std::string name() const override { return "parquet"; };
  const Detector& detector() const override { return m_detector; };
  std::unique_ptr<DocumentParser> new_parser(std::istream& in) const override;
  std::unique_ptr<Formatter> new_formatter(
      std::ostream& out, const FormatterOptions& options) const override;

private:
  ParquetDetector m_detector{};
};

} // namespace libflow

#endif // LIBFLOW_FORMATS_PARQUET_H
