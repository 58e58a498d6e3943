#include "libflow/formats/parquet.hpp"
#include "libflow/exceptions.hpp"          // libflow::FormatError
#include "libflow/formats/compression.hpp" // libflow::gunzip
#include <cstring>                         // std::memcpy
#include <string>                          // std::string std::to_string
#include <utility>                         // std::move

namespace libflow {

using namespace std::string_literals;

namespace {

// Days between the julian day epoch and 1970-01-01.
constexpr std::int64_t JULIAN_UNIX_EPOCH{2440588};
constexpr std::int64_t NANOS_PER_DAY{86400LL * 1000 * 1000 * 1000};

std::int64_t zigzag(std::uint64_t n) noexcept {
  return static_cast<std::int64_t>(n >> 1) ^ -static_cast<std::int64_t>(n & 1);
}

std::uint64_t read_le(std::string_view data, std::size_t offset, std::size_t width) {
  if (offset + width > data.size()) {
    throw FormatError("parquet page data is truncated");
  }
  std::uint64_t rv{0};
  for (std::size_t i{0}; i < width; ++i) {
    rv |= static_cast<std::uint64_t>(static_cast<unsigned char>(data[offset + i]))
          << (8 * i);
  }
  return rv;
}

unsigned bit_width(std::uint32_t max_value) noexcept {
  unsigned rv{0};
  while (max_value) {
    ++rv;
    max_value >>= 1;
  }
  return rv;
}

std::string join_path(const std::vector<std::string>& path) {
  std::string rv{};
  for (const auto& name : path) {
    if (!rv.empty()) {
      rv += ".";
    }
    rv += name;
  }
  return rv;
}

template <typename T, typename F>
std::vector<T> read_struct_list(ThriftReader& reader, F parse) {
  std::vector<T> rv{};
  auto [size, type] = reader.read_list_header();
  for (std::size_t i{0}; i < size; ++i) {
    if (type == ThriftType::struct_) {
      rv.push_back(parse(reader));
    } else {
      reader.skip(type);
    }
  }
  return rv;
}

bool is(const ThriftField& field, ThriftType type) noexcept {
  return field.type == type;
}

SchemaElement parse_schema_element(ThriftReader& reader) {
  SchemaElement rv{};
  std::int16_t last_id{0};
  for (auto field{reader.read_field_header(last_id)};
       field.type != ThriftType::stop;
       field = reader.read_field_header(last_id)) {
    if (field.id == 1 && is(field, ThriftType::i32)) {
      rv.type = static_cast<PhysicalType>(reader.read_i32());
    } else if (field.id == 2 && is(field, ThriftType::i32)) {
      rv.type_length = reader.read_i32();
    } else if (field.id == 3 && is(field, ThriftType::i32)) {
      rv.repetition = static_cast<Repetition>(reader.read_i32());
    } else if (field.id == 4 && is(field, ThriftType::binary)) {
      rv.name = reader.read_binary();
    } else if (field.id == 5 && is(field, ThriftType::i32)) {
      rv.num_children = reader.read_i32();
    } else if (field.id == 6 && is(field, ThriftType::i32)) {
      rv.converted_type = reader.read_i32();
    } else {
      reader.skip(field.type);
    }
  }
  return rv;
}

ColumnMetaData parse_column_meta_data(ThriftReader& reader) {
  ColumnMetaData rv{};
  std::int16_t last_id{0};
  for (auto field{reader.read_field_header(last_id)};
       field.type != ThriftType::stop;
       field = reader.read_field_header(last_id)) {
    if (field.id == 1 && is(field, ThriftType::i32)) {
      rv.type = static_cast<PhysicalType>(reader.read_i32());
    } else if (field.id == 3 && is(field, ThriftType::list)) {
      auto [size, type] = reader.read_list_header();
      for (std::size_t i{0}; i < size; ++i) {
        if (type == ThriftType::binary) {
          rv.path_in_schema.push_back(reader.read_binary());
        } else {
          reader.skip(type);
        }
      }
    } else if (field.id == 4 && is(field, ThriftType::i32)) {
      rv.codec = static_cast<CompressionCodec>(reader.read_i32());
    } else if (field.id == 5 && is(field, ThriftType::i64)) {
      rv.num_values = reader.read_i64();
    } else if (field.id == 7 && is(field, ThriftType::i64)) {
      rv.total_compressed_size = reader.read_i64();
    } else if (field.id == 9 && is(field, ThriftType::i64)) {
      rv.data_page_offset = reader.read_i64();
    } else if (field.id == 11 && is(field, ThriftType::i64)) {
      rv.dictionary_page_offset = reader.read_i64();
    } else {
      reader.skip(field.type);
    }
  }
  return rv;
}

ColumnChunk parse_column_chunk(ThriftReader& reader) {
  ColumnChunk rv{};
  std::int16_t last_id{0};
  for (auto field{reader.read_field_header(last_id)};
       field.type != ThriftType::stop;
       field = reader.read_field_header(last_id)) {
    if (field.id == 1 && is(field, ThriftType::binary)) {
      rv.file_path = reader.read_binary();
    } else if (field.id == 3 && is(field, ThriftType::struct_)) {
      rv.meta_data = parse_column_meta_data(reader);
    } else {
      reader.skip(field.type);
    }
  }
  return rv;
}

RowGroup parse_row_group(ThriftReader& reader) {
  RowGroup rv{};
  std::int16_t last_id{0};
  for (auto field{reader.read_field_header(last_id)};
       field.type != ThriftType::stop;
       field = reader.read_field_header(last_id)) {
    if (field.id == 1 && is(field, ThriftType::list)) {
      rv.columns = read_struct_list<ColumnChunk>(reader, parse_column_chunk);
    } else if (field.id == 3 && is(field, ThriftType::i64)) {
      rv.num_rows = reader.read_i64();
    } else {
      reader.skip(field.type);
    }
  }
  return rv;
}

DataPageHeader parse_data_page_header(ThriftReader& reader) {
  DataPageHeader rv{};
  std::int16_t last_id{0};
  for (auto field{reader.read_field_header(last_id)};
       field.type != ThriftType::stop;
       field = reader.read_field_header(last_id)) {
    if (field.id == 1 && is(field, ThriftType::i32)) {
      rv.num_values = reader.read_i32();
    } else if (field.id == 2 && is(field, ThriftType::i32)) {
      rv.encoding = static_cast<Encoding>(reader.read_i32());
    } else if (field.id == 3 && is(field, ThriftType::i32)) {
      rv.definition_level_encoding = static_cast<Encoding>(reader.read_i32());
    } else if (field.id == 4 && is(field, ThriftType::i32)) {
      rv.repetition_level_encoding = static_cast<Encoding>(reader.read_i32());
    } else {
      reader.skip(field.type);
    }
  }
  return rv;
}

DictionaryPageHeader parse_dictionary_page_header(ThriftReader& reader) {
  DictionaryPageHeader rv{};
  std::int16_t last_id{0};
  for (auto field{reader.read_field_header(last_id)};
       field.type != ThriftType::stop;
       field = reader.read_field_header(last_id)) {
    if (field.id == 1 && is(field, ThriftType::i32)) {
      rv.num_values = reader.read_i32();
    } else if (field.id == 2 && is(field, ThriftType::i32)) {
      rv.encoding = static_cast<Encoding>(reader.read_i32());
    } else {
      reader.skip(field.type);
    }
  }
  return rv;
}

DataPageHeaderV2 parse_data_page_header_v2(ThriftReader& reader) {
  DataPageHeaderV2 rv{};
  std::int16_t last_id{0};
  for (auto field{reader.read_field_header(last_id)};
       field.type != ThriftType::stop;
       field = reader.read_field_header(last_id)) {
    if (field.id == 1 && is(field, ThriftType::i32)) {
      rv.num_values = reader.read_i32();
    } else if (field.id == 2 && is(field, ThriftType::i32)) {
      rv.num_nulls = reader.read_i32();
    } else if (field.id == 3 && is(field, ThriftType::i32)) {
      rv.num_rows = reader.read_i32();
    } else if (field.id == 4 && is(field, ThriftType::i32)) {
      rv.encoding = static_cast<Encoding>(reader.read_i32());
    } else if (field.id == 5 && is(field, ThriftType::i32)) {
      rv.definition_levels_byte_length = reader.read_i32();
    } else if (field.id == 6 && is(field, ThriftType::i32)) {
      rv.repetition_levels_byte_length = reader.read_i32();
    } else if (field.id == 7 && (is(field, ThriftType::boolean_true) ||
                                    is(field, ThriftType::boolean_false))) {
      rv.is_compressed = reader.read_bool(field);
    } else {
      reader.skip(field.type);
    }
  }
  return rv;
}

std::string decompress(CompressionCodec codec, std::string_view data,
    std::int32_t uncompressed_size) {
  switch (codec) {
  case CompressionCodec::uncompressed:
    return std::string{data};
  case CompressionCodec::snappy:
    return snappy_uncompress(data);
  case CompressionCodec::gzip:
    return gunzip(data, uncompressed_size > 0
                            ? static_cast<std::size_t>(uncompressed_size)
                            : 0);
  default:
    throw FormatError("unsupported parquet compression codec "s +
                      std::to_string(static_cast<std::int32_t>(codec)));
  }
}

// Decode _count_ PLAIN encoded values of _column_'s physical type.
std::vector<Document> decode_plain(
    const ParquetColumn& column, std::string_view data, std::size_t count) {
  std::vector<Document> rv{};
  rv.reserve(count);

  switch (column.type) {
  case PhysicalType::boolean:
    if ((count + 7) / 8 > data.size()) {
      throw FormatError("parquet page data is truncated");
    }
    for (std::size_t i{0}; i < count; ++i) {
      rv.push_back(
          ((static_cast<unsigned char>(data[i / 8]) >> (i % 8)) & 1) != 0);
    }
    break;
  case PhysicalType::int32:
    for (std::size_t i{0}; i < count; ++i) {
      auto bits{static_cast<std::uint32_t>(read_le(data, i * 4, 4))};
      rv.push_back(static_cast<std::int64_t>(static_cast<std::int32_t>(bits)));
    }
    break;
  case PhysicalType::int64:
    for (std::size_t i{0}; i < count; ++i) {
      rv.push_back(static_cast<std::int64_t>(read_le(data, i * 8, 8)));
    }
    break;
  case PhysicalType::int96:
    // Nanoseconds within the day followed by the julian day number.
    for (std::size_t i{0}; i < count; ++i) {
      auto nanos{static_cast<std::int64_t>(read_le(data, i * 12, 8))};
      auto day{static_cast<std::int64_t>(
          static_cast<std::uint32_t>(read_le(data, i * 12 + 8, 4)))};
      rv.push_back((day - JULIAN_UNIX_EPOCH) * NANOS_PER_DAY + nanos);
    }
    break;
  case PhysicalType::float_:
    for (std::size_t i{0}; i < count; ++i) {
      auto bits{static_cast<std::uint32_t>(read_le(data, i * 4, 4))};
      float f{};
      std::memcpy(&f, &bits, sizeof(f));
      rv.push_back(static_cast<double>(f));
    }
    break;
  case PhysicalType::double_:
    for (std::size_t i{0}; i < count; ++i) {
      auto bits{read_le(data, i * 8, 8)};
      double d{};
      std::memcpy(&d, &bits, sizeof(d));
      rv.push_back(d);
    }
    break;
  case PhysicalType::byte_array: {
    std::size_t pos{0};
    for (std::size_t i{0}; i < count; ++i) {
      auto length{static_cast<std::size_t>(read_le(data, pos, 4))};
      pos += 4;
      if (pos + length > data.size()) {
        throw FormatError("parquet page data is truncated");
      }
      rv.push_back(std::string{data.substr(pos, length)});
      pos += length;
    }
    break;
  }
  case PhysicalType::fixed_len_byte_array: {
    if (column.type_length <= 0) {
      throw FormatError("parquet column "s + join_path(column.path) +
                        " has an invalid fixed length");
    }
    auto length{static_cast<std::size_t>(column.type_length)};
    if (length * count > data.size()) {
      throw FormatError("parquet page data is truncated");
    }
    for (std::size_t i{0}; i < count; ++i) {
      rv.push_back(std::string{data.substr(i * length, length)});
    }
    break;
  }
  default:
    throw FormatError("unsupported parquet physical type "s +
                      std::to_string(static_cast<std::int32_t>(column.type)));
  }

  return rv;
}

std::vector<Document> decode_values(const ParquetColumn& column,
    Encoding encoding, std::string_view data, std::size_t count,
    const std::optional<std::vector<Document>>& dictionary) {
  switch (encoding) {
  case Encoding::plain:
    return decode_plain(column, data, count);
  case Encoding::plain_dictionary:
  case Encoding::rle_dictionary: {
    if (!dictionary) {
      throw FormatError("parquet column "s + join_path(column.path) +
                        " uses a dictionary encoding without a dictionary page");
    }
    std::vector<Document> rv{};
    if (count == 0) {
      return rv;
    }
    if (data.empty()) {
      throw FormatError("parquet page data is truncated");
    }
    auto width{static_cast<unsigned>(static_cast<unsigned char>(data[0]))};
    auto ids{decode_rle_bit_packed(data.substr(1), width, count).first};
    rv.reserve(count);
    for (auto id : ids) {
      if (id >= dictionary->size()) {
        throw FormatError("parquet dictionary index "s + std::to_string(id) +
                          " out of range");
      }
      rv.push_back((*dictionary)[id]);
    }
    return rv;
  }
  case Encoding::rle: {
    if (column.type != PhysicalType::boolean) {
      throw FormatError("parquet RLE encoding is only supported for booleans");
    }
    auto length{static_cast<std::size_t>(read_le(data, 0, 4))};
    if (4 + length > data.size()) {
      throw FormatError("parquet page data is truncated");
    }
    std::vector<Document> rv{};
    rv.reserve(count);
    for (auto bit : decode_rle_bit_packed(data.substr(4, length), 1, count).first) {
      rv.push_back(bit != 0);
    }
    return rv;
  }
  default:
    throw FormatError("unsupported parquet encoding "s +
                      std::to_string(static_cast<std::int32_t>(encoding)));
  }
}

} // namespace

std::uint8_t ThriftReader::read_byte() {
  if (m_pos >= m_data.size()) {
    throw FormatError("parquet metadata is truncated");
  }
  return static_cast<std::uint8_t>(m_data[m_pos++]);
}

std::uint64_t ThriftReader::read_varint() {
  std::uint64_t value{0};
  for (int shift{0}; shift < 64; shift += 7) {
    auto b{read_byte()};
    value |= static_cast<std::uint64_t>(b & 0x7F) << shift;
    if ((b & 0x80) == 0) {
      return value;
    }
  }
  throw FormatError("parquet metadata varint is too long");
}

std::int32_t ThriftReader::read_i32() {
  return static_cast<std::int32_t>(zigzag(read_varint()));
}

std::int64_t ThriftReader::read_i64() { return zigzag(read_varint()); }

std::string_view ThriftReader::read_bytes(std::size_t n) {
  if (n > m_data.size() - m_pos) {
    throw FormatError("parquet metadata is truncated");
  }
  auto rv{m_data.substr(m_pos, n)};
  m_pos += n;
  return rv;
}

std::string ThriftReader::read_binary() {
  auto length{read_varint()};
  return std::string{read_bytes(static_cast<std::size_t>(length))};
}

ThriftField ThriftReader::read_field_header(std::int16_t& last_id) {
  auto b{read_byte()};
  ThriftField rv{0, static_cast<ThriftType>(b & 0x0F)};
  if (rv.type == ThriftType::stop) {
    return rv;
  }

  auto delta{static_cast<std::int16_t>(b >> 4)};
  if (delta != 0) {
    rv.id = static_cast<std::int16_t>(last_id + delta);
  } else {
    rv.id = static_cast<std::int16_t>(zigzag(read_varint()));
  }
  last_id = rv.id;
  return rv;
}

std::pair<std::size_t, ThriftType> ThriftReader::read_list_header() {
  auto b{read_byte()};
  std::size_t size{static_cast<std::size_t>(b >> 4)};
  if (size == 15) {
    size = static_cast<std::size_t>(read_varint());
  }
  return {size, static_cast<ThriftType>(b & 0x0F)};
}

void ThriftReader::skip(ThriftType type) {
  switch (type) {
  case ThriftType::boolean_true:
  case ThriftType::boolean_false:
    break;
  case ThriftType::byte:
    read_byte();
    break;
  case ThriftType::i16:
  case ThriftType::i32:
  case ThriftType::i64:
    read_varint();
    break;
  case ThriftType::double_:
    read_bytes(8);
    break;
  case ThriftType::binary:
    read_bytes(static_cast<std::size_t>(read_varint()));
    break;
  case ThriftType::list:
  case ThriftType::set: {
    auto [size, element_type] = read_list_header();
    for (std::size_t i{0}; i < size; ++i) {
      // Booleans inside collections take one byte each.
      if (element_type == ThriftType::boolean_true ||
          element_type == ThriftType::boolean_false) {
        read_byte();
      } else {
        skip(element_type);
      }
    }
    break;
  }
  case ThriftType::map: {
    auto size{static_cast<std::size_t>(read_varint())};
    if (size == 0) {
      break;
    }
    auto types{read_byte()};
    auto key_type{static_cast<ThriftType>(types >> 4)};
    auto value_type{static_cast<ThriftType>(types & 0x0F)};
    for (std::size_t i{0}; i < size; ++i) {
      skip(key_type);
      skip(value_type);
    }
    break;
  }
  case ThriftType::struct_:
    skip_struct();
    break;
  default:
    throw FormatError("unknown thrift type "s +
                      std::to_string(static_cast<int>(type)));
  }
}

void ThriftReader::skip_struct() {
  std::int16_t last_id{0};
  for (auto field{read_field_header(last_id)}; field.type != ThriftType::stop;
       field = read_field_header(last_id)) {
    skip(field.type);
  }
}

FileMetaData parse_file_metadata(ThriftReader& reader) {
  FileMetaData rv{};
  std::int16_t last_id{0};
  for (auto field{reader.read_field_header(last_id)};
       field.type != ThriftType::stop;
       field = reader.read_field_header(last_id)) {
    if (field.id == 1 && is(field, ThriftType::i32)) {
      rv.version = reader.read_i32();
    } else if (field.id == 2 && is(field, ThriftType::list)) {
      rv.schema = read_struct_list<SchemaElement>(reader, parse_schema_element);
    } else if (field.id == 3 && is(field, ThriftType::i64)) {
      rv.num_rows = reader.read_i64();
    } else if (field.id == 4 && is(field, ThriftType::list)) {
      rv.row_groups = read_struct_list<RowGroup>(reader, parse_row_group);
    } else {
      reader.skip(field.type);
    }
  }
  return rv;
}

PageHeader parse_page_header(ThriftReader& reader) {
  PageHeader rv{};
  std::int16_t last_id{0};
  for (auto field{reader.read_field_header(last_id)};
       field.type != ThriftType::stop;
       field = reader.read_field_header(last_id)) {
    if (field.id == 1 && is(field, ThriftType::i32)) {
      rv.type = static_cast<PageType>(reader.read_i32());
    } else if (field.id == 2 && is(field, ThriftType::i32)) {
      rv.uncompressed_page_size = reader.read_i32();
    } else if (field.id == 3 && is(field, ThriftType::i32)) {
      rv.compressed_page_size = reader.read_i32();
    } else if (field.id == 5 && is(field, ThriftType::struct_)) {
      rv.data_page_header = parse_data_page_header(reader);
    } else if (field.id == 7 && is(field, ThriftType::struct_)) {
      rv.dictionary_page_header = parse_dictionary_page_header(reader);
    } else if (field.id == 8 && is(field, ThriftType::struct_)) {
      rv.data_page_header_v2 = parse_data_page_header_v2(reader);
    } else {
      reader.skip(field.type);
    }
  }
  return rv;
}

std::pair<std::vector<std::uint32_t>, std::size_t> decode_rle_bit_packed(
    std::string_view data, unsigned bit_width, std::size_t count) {
  if (bit_width > 32) {
    throw FormatError("parquet bit width "s + std::to_string(bit_width) +
                      " is too large");
  }

  std::vector<std::uint32_t> values{};
  values.reserve(count);
  std::size_t pos{0};
  auto value_bytes{static_cast<std::size_t>((bit_width + 7) / 8)};

  while (values.size() < count) {
    if (pos >= data.size()) {
      throw FormatError("parquet RLE data is truncated");
    }

    std::uint64_t header{0};
    for (int shift{0};; shift += 7) {
      if (pos >= data.size() || shift >= 64) {
        throw FormatError("parquet RLE data is truncated");
      }
      auto b{static_cast<unsigned char>(data[pos++])};
      header |= static_cast<std::uint64_t>(b & 0x7F) << shift;
      if ((b & 0x80) == 0) {
        break;
      }
    }

    if (header & 1) {
      // Bit-packed groups of eight values, least significant bit first.
      auto groups{static_cast<std::size_t>(header >> 1)};
      auto byte_count{groups * bit_width};
      if (pos + byte_count > data.size()) {
        throw FormatError("parquet RLE data is truncated");
      }
      auto packed{data.substr(pos, byte_count)};
      for (std::size_t i{0}; i < groups * 8 && values.size() < count; ++i) {
        std::uint32_t value{0};
        for (unsigned b{0}; b < bit_width; ++b) {
          auto bit{i * bit_width + b};
          if ((static_cast<unsigned char>(packed[bit / 8]) >> (bit % 8)) & 1) {
            value |= std::uint32_t{1} << b;
          }
        }
        values.push_back(value);
      }
      pos += byte_count;
    } else {
      auto run{static_cast<std::size_t>(header >> 1)};
      auto value{static_cast<std::uint32_t>(read_le(data, pos, value_bytes))};
      pos += value_bytes;
      for (std::size_t i{0}; i < run && values.size() < count; ++i) {
        values.push_back(value);
      }
    }
  }

  return {std::move(values), pos};
}

ParquetFile::ParquetFile(std::istream& in) : m_in{in} {
  m_in.clear();
  m_in.seekg(0, std::ios::end);
  auto end{m_in.tellg()};
  if (!m_in || end < 0) {
    m_in.clear();
    throw FormatError(
        "parquet format requires seekable file input (not stdin or pipe)");
  }
  m_size = static_cast<std::int64_t>(end);

  auto size{static_cast<std::int64_t>(PARQUET_MAGIC.size())};
  if (m_size < size * 2 + 4) {
    throw FormatError("failed to open parquet file: file is too small");
  }
  if (read_at(0, size) != PARQUET_MAGIC) {
    throw FormatError("failed to open parquet file: missing leading magic");
  }

  auto tail{read_at(m_size - size - 4, size + 4)};
  if (std::string_view{tail}.substr(4) != PARQUET_MAGIC) {
    throw FormatError("failed to open parquet file: missing trailing magic");
  }

  auto footer_length{static_cast<std::int64_t>(read_le(tail, 0, 4))};
  if (footer_length > m_size - size * 2 - 4) {
    throw FormatError("failed to open parquet file: invalid footer length");
  }

  auto footer{read_at(m_size - size - 4 - footer_length, footer_length)};
  try {
    ThriftReader reader{footer};
    m_metadata = parse_file_metadata(reader);
    build_columns();
  } catch (const FormatError& e) {
    throw FormatError("failed to open parquet file: "s + e.what());
  }
}

std::string ParquetFile::read_at(std::int64_t offset, std::int64_t size) {
  if (offset < 0 || size < 0 || offset + size > m_size) {
    throw FormatError("parquet read out of range at offset "s +
                      std::to_string(offset));
  }
  m_in.clear();
  m_in.seekg(offset);
  std::string rv(static_cast<std::size_t>(size), '\0');
  m_in.read(rv.data(), size);
  if (m_in.gcount() != size) {
    throw FormatError("unexpected end of input");
  }
  return rv;
}

void ParquetFile::build_columns() {
  const auto& schema{m_metadata.schema};
  if (schema.empty()) {
    throw FormatError("schema is empty");
  }

  struct Frame {
    std::size_t remaining;
    std::vector<std::string> path;
    std::vector<std::uint32_t> levels;
  };

  // Schema elements are a depth first flattening of the tree. The first
  // element is the root.
  std::vector<Frame> stack{};
  stack.push_back(
      Frame{static_cast<std::size_t>(schema[0].num_children), {}, {}});
  for (std::size_t i{1}; i < schema.size(); ++i) {
    while (!stack.empty() && stack.back().remaining == 0) {
      stack.pop_back();
    }
    if (stack.empty()) {
      throw FormatError("schema has more elements than the tree describes");
    }

    auto& parent{stack.back()};
    --parent.remaining;

    const auto& element{schema[i]};
    auto path{parent.path};
    path.push_back(element.name);

    if (element.repetition == Repetition::repeated) {
      throw FormatError("repeated field "s + join_path(path) +
                        " is not supported");
    }

    auto levels{parent.levels};
    auto level{levels.empty() ? std::uint32_t{0} : levels.back()};
    if (element.repetition == Repetition::optional) {
      ++level;
    }
    levels.push_back(level);

    if (element.num_children > 0) {
      stack.push_back(Frame{static_cast<std::size_t>(element.num_children),
          std::move(path), std::move(levels)});
    } else {
      if (!element.type) {
        throw FormatError("leaf field "s + join_path(path) + " has no type");
      }
      m_columns.push_back(ParquetColumn{std::move(path), *element.type,
          element.type_length, level, std::move(levels)});
    }
  }
}

ParquetFile::ColumnValues ParquetFile::read_column(
    const ParquetColumn& column, const ColumnMetaData& meta) {
  auto start{meta.data_page_offset};
  if (meta.dictionary_page_offset && *meta.dictionary_page_offset > 0 &&
      *meta.dictionary_page_offset < start) {
    start = *meta.dictionary_page_offset;
  }

  auto chunk{read_at(start, meta.total_compressed_size)};
  ThriftReader reader{chunk};

  ColumnValues rv{};
  std::optional<std::vector<Document>> dictionary{};
  auto level_width{bit_width(column.max_definition_level)};
  auto expected{static_cast<std::size_t>(meta.num_values)};

  while (rv.definition_levels.size() < expected &&
         reader.position() < chunk.size()) {
    auto header{parse_page_header(reader)};
    if (header.compressed_page_size < 0) {
      throw FormatError("negative parquet page size");
    }
    auto page{reader.read_bytes(
        static_cast<std::size_t>(header.compressed_page_size))};

    if (header.type == PageType::dictionary_page) {
      if (!header.dictionary_page_header) {
        throw FormatError("parquet dictionary page has no header");
      }
      auto data{decompress(meta.codec, page, header.uncompressed_page_size)};
      dictionary = decode_plain(column, data,
          static_cast<std::size_t>(header.dictionary_page_header->num_values));
      continue;
    }

    std::size_t num_values{0};
    Encoding encoding{};
    std::vector<std::uint32_t> levels{};
    std::string values_data{};

    if (header.type == PageType::data_page) {
      if (!header.data_page_header) {
        throw FormatError("parquet data page has no header");
      }
      num_values =
          static_cast<std::size_t>(header.data_page_header->num_values);
      encoding = header.data_page_header->encoding;

      auto data{decompress(meta.codec, page, header.uncompressed_page_size)};
      std::string_view body{data};
      if (column.max_definition_level > 0) {
        if (header.data_page_header->definition_level_encoding !=
            Encoding::rle) {
          throw FormatError("unsupported parquet definition level encoding");
        }
        auto length{static_cast<std::size_t>(read_le(body, 0, 4))};
        if (4 + length > body.size()) {
          throw FormatError("parquet page data is truncated");
        }
        levels = decode_rle_bit_packed(
            body.substr(4, length), level_width, num_values)
                     .first;
        body.remove_prefix(4 + length);
      } else {
        levels.assign(num_values, 0);
      }
      values_data = std::string{body};
    } else if (header.type == PageType::data_page_v2) {
      if (!header.data_page_header_v2) {
        throw FormatError("parquet data page v2 has no header");
      }
      const auto& v2{*header.data_page_header_v2};
      num_values = static_cast<std::size_t>(v2.num_values);
      encoding = v2.encoding;

      if (v2.repetition_levels_byte_length < 0 ||
          v2.definition_levels_byte_length < 0) {
        throw FormatError("negative parquet level length");
      }
      auto rep_length{static_cast<std::size_t>(v2.repetition_levels_byte_length)};
      auto def_length{static_cast<std::size_t>(v2.definition_levels_byte_length)};
      if (rep_length + def_length > page.size()) {
        throw FormatError("parquet page data is truncated");
      }
      if (column.max_definition_level > 0) {
        levels = decode_rle_bit_packed(
            page.substr(rep_length, def_length), level_width, num_values)
                     .first;
      } else {
        levels.assign(num_values, 0);
      }

      auto compressed{page.substr(rep_length + def_length)};
      if (v2.is_compressed) {
        auto uncompressed_size{header.uncompressed_page_size -
                               static_cast<std::int32_t>(rep_length + def_length)};
        values_data = decompress(meta.codec, compressed, uncompressed_size);
      } else {
        values_data = std::string{compressed};
      }
    } else {
      continue;
    }

    std::size_t present{0};
    for (auto level : levels) {
      if (level == column.max_definition_level) {
        ++present;
      }
    }

    auto values = decode_values(column, encoding, values_data, present, dictionary);
    if (values.size() != present) {
      throw FormatError("parquet page value count mismatch");
    }

    std::size_t next{0};
    for (auto level : levels) {
      rv.definition_levels.push_back(level);
      if (level == column.max_definition_level) {
        rv.values.push_back(std::move(values[next++]));
      } else {
        rv.values.emplace_back(nullptr);
      }
    }
  }

  if (rv.definition_levels.size() != expected) {
    throw FormatError("parquet column "s + join_path(column.path) + " has " +
                      std::to_string(rv.definition_levels.size()) +
                      " values, expected " + std::to_string(expected));
  }

  return rv;
}

std::vector<Document> ParquetFile::read_row_group(std::size_t index) {
  const auto& group{m_metadata.row_groups.at(index)};
  if (group.columns.size() != m_columns.size()) {
    throw FormatError("row group "s + std::to_string(index) + " has " +
                      std::to_string(group.columns.size()) +
                      " columns, schema has " +
                      std::to_string(m_columns.size()));
  }

  auto num_rows{static_cast<std::size_t>(group.num_rows)};
  std::vector<Document> rows(num_rows, Document{Mapping{}});

  for (std::size_t c{0}; c < m_columns.size(); ++c) {
    const auto& column{m_columns[c]};
    const auto& chunk{group.columns[c]};
    if (chunk.file_path) {
      throw FormatError("column "s + join_path(column.path) +
                        " is stored in an external file");
    }
    if (!chunk.meta_data.path_in_schema.empty() &&
        chunk.meta_data.path_in_schema != column.path) {
      throw FormatError("column chunk "s +
                        join_path(chunk.meta_data.path_in_schema) +
                        " does not match schema column " +
                        join_path(column.path));
    }

    auto values{read_column(column, chunk.meta_data)};
    if (values.values.size() != num_rows) {
      throw FormatError("column "s + join_path(column.path) + " has " +
                        std::to_string(values.values.size()) +
                        " values, row group has " + std::to_string(num_rows) +
                        " rows");
    }

    auto last{column.path.size() - 1};
    for (std::size_t r{0}; r < num_rows; ++r) {
      auto level{values.definition_levels[r]};
      auto* node{rows[r].mapping()};
      for (std::size_t d{0}; d < last; ++d) {
        const auto& name{column.path[d]};
        if (level < column.path_definition_levels[d]) {
          // A missing optional group.
          node->try_emplace(name, nullptr);
          node = nullptr;
          break;
        }
        auto& child{(*node)[name]};
        if (!child.is_mapping()) {
          child = Mapping{};
        }
        node = child.mapping();
      }
      if (node) {
        (*node)[column.path[last]] = std::move(values.values[r]);
      }
    }
  }

  return rows;
}

int ParquetDetector::detect(std::string_view prefix) const {
  return prefix.substr(0, PARQUET_MAGIC.size()) == PARQUET_MAGIC ? 100 : 0;
}

void ParquetParser::for_each(const DocumentCallback& callback) {
  const auto& groups{m_file.metadata().row_groups};
  for (std::size_t i{0}; i < groups.size(); ++i) {
    std::vector<Document> rows{};
    try {
      rows = m_file.read_row_group(i);
    } catch (const FormatError& e) {
      throw FormatError("failed to read parquet row: "s + e.what());
    }
    for (auto& row : rows) {
      callback(std::move(row));
    }
  }
}

std::unique_ptr<DocumentParser> ParquetFormat::new_parser(
    std::istream& in) const {
  return std::make_unique<ParquetParser>(in);
}

std::unique_ptr<Formatter> ParquetFormat::new_formatter(
    std::ostream&, const FormatterOptions&) const {
  throw UnsupportedError("parquet format does not support writing");
}

} // namespace libflow
