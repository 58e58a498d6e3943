#ifndef LIBFLOW_TESTS_FIXTURES_H
#define LIBFLOW_TESTS_FIXTURES_H

#include "libflow/formats/parquet.hpp" // libflow::SchemaElement libflow::ThriftType
#include <algorithm>                   // std::min
#include <cstdint>                     // std::int64_t std::uint32_t
#include <cstring>                     // std::memcpy
#include <functional>                  // std::function
#include <optional>                    // std::optional
#include <stdexcept>                   // std::runtime_error
#include <string>                      // std::string
#include <string_view>                 // std::string_view
#include <vector>                      // std::vector
#include <zlib.h>                      // deflateInit2 deflate deflateEnd

// Builders for binary inputs used by the Avro and Parquet tests.
namespace fixtures {

inline std::string varint(std::uint64_t n) {
  std::string rv{};
  while (n >= 0x80) {
    rv.push_back(static_cast<char>((n & 0x7F) | 0x80));
    n >>= 7;
  }
  rv.push_back(static_cast<char>(n));
  return rv;
}

inline std::uint64_t zigzag(std::int64_t n) {
  return (static_cast<std::uint64_t>(n) << 1) ^
         static_cast<std::uint64_t>(n >> 63);
}

inline std::string little_endian(std::uint64_t n, std::size_t width) {
  std::string rv{};
  for (std::size_t i{0}; i < width; ++i) {
    rv.push_back(static_cast<char>((n >> (8 * i)) & 0xFF));
  }
  return rv;
}

inline std::string deflate_with(std::string_view data, int window_bits) {
  z_stream stream{};
  if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, window_bits, 8,
          Z_DEFAULT_STRATEGY) != Z_OK) {
    throw std::runtime_error("deflateInit2 failed");
  }

  std::string rv(deflateBound(&stream, static_cast<uLong>(data.size())) + 64, '\0');
  stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  stream.avail_in = static_cast<uInt>(data.size());
  stream.next_out = reinterpret_cast<Bytef*>(rv.data());
  stream.avail_out = static_cast<uInt>(rv.size());

  auto ret{deflate(&stream, Z_FINISH)};
  deflateEnd(&stream);
  if (ret != Z_STREAM_END) {
    throw std::runtime_error("deflate failed");
  }
  rv.resize(stream.total_out);
  return rv;
}

inline std::string raw_deflate(std::string_view data) {
  return deflate_with(data, -MAX_WBITS);
}

inline std::string gzip(std::string_view data) {
  return deflate_with(data, 16 + MAX_WBITS);
}

// A valid snappy block made of literal elements only.
inline std::string snappy_literal(std::string_view data) {
  auto rv{varint(data.size())};
  std::size_t pos{0};
  while (pos < data.size()) {
    auto n{std::min<std::size_t>(data.size() - pos, 65536)};
    auto length{n - 1};
    if (length < 60) {
      rv.push_back(static_cast<char>(length << 2));
    } else if (length < 256) {
      rv.push_back(static_cast<char>(60 << 2));
      rv.push_back(static_cast<char>(length));
    } else {
      rv.push_back(static_cast<char>(61 << 2));
      rv += little_endian(length, 2);
    }
    rv.append(data.substr(pos, n));
    pos += n;
  }
  return rv;
}

inline std::uint32_t checksum(std::string_view data) {
  auto rv{::crc32(0L, Z_NULL, 0)};
  rv = ::crc32(rv, reinterpret_cast<const Bytef*>(data.data()),
      static_cast<uInt>(data.size()));
  return static_cast<std::uint32_t>(rv);
}

// Avro binary encoding.

inline std::string avro_long(std::int64_t n) { return varint(zigzag(n)); }

inline std::string avro_string(std::string_view s) {
  return avro_long(static_cast<std::int64_t>(s.size())) + std::string{s};
}

inline std::string avro_boolean(bool b) { return std::string(1, b ? '\x01' : '\x00'); }

inline std::string avro_double(double d) {
  std::uint64_t bits{0};
  std::memcpy(&bits, &d, sizeof(d));
  return little_endian(bits, 8);
}

inline std::string avro_float(float f) {
  std::uint32_t bits{0};
  std::memcpy(&bits, &f, sizeof(f));
  return little_endian(bits, 4);
}

inline const std::string AVRO_SYNC{"0123456789abcdef"};

struct AvroBlock {
  std::int64_t count{0};
  std::string data{};
};

// Return an object container file holding _blocks_, each compressed with
// _codec_ ("null", "deflate" or "snappy").
inline std::string avro_container(std::string_view schema,
    const std::vector<AvroBlock>& blocks, std::string_view codec = "null") {
  std::string rv{"Obj\x01", 4};
  rv += avro_long(2);
  rv += avro_string("avro.schema") + avro_string(schema);
  rv += avro_string("avro.codec") + avro_string(codec);
  rv += avro_long(0);
  rv += AVRO_SYNC;

  for (const auto& block : blocks) {
    std::string data{};
    if (codec == "deflate") {
      data = raw_deflate(block.data);
    } else if (codec == "snappy") {
      data = snappy_literal(block.data);
      auto crc{checksum(block.data)};
      for (int shift{24}; shift >= 0; shift -= 8) {
        data.push_back(static_cast<char>((crc >> shift) & 0xFF));
      }
    } else {
      data = block.data;
    }
    rv += avro_long(block.count);
    rv += avro_long(static_cast<std::int64_t>(data.size()));
    rv += data;
    rv += AVRO_SYNC;
  }

  return rv;
}

// Thrift compact protocol, the subset needed for parquet metadata.
class ThriftWriter {
public:
  void field(std::int16_t id, libflow::ThriftType type) {
    auto delta{id - m_last_id};
    if (delta > 0 && delta <= 15) {
      byte((delta << 4) | static_cast<int>(type));
    } else {
      byte(static_cast<int>(type));
      m_out += varint(zigzag(id));
    }
    m_last_id = id;
  }

  void i32(std::int16_t id, std::int32_t value) {
    field(id, libflow::ThriftType::i32);
    m_out += varint(zigzag(value));
  }

  void i64(std::int16_t id, std::int64_t value) {
    field(id, libflow::ThriftType::i64);
    m_out += varint(zigzag(value));
  }

  void binary(std::int16_t id, std::string_view value) {
    field(id, libflow::ThriftType::binary);
    raw_binary(value);
  }

  void boolean(std::int16_t id, bool value) {
    field(id, value ? libflow::ThriftType::boolean_true
                    : libflow::ThriftType::boolean_false);
  }

  void begin_struct(std::int16_t id) {
    field(id, libflow::ThriftType::struct_);
    begin_element();
  }

  void list(std::int16_t id, libflow::ThriftType type, std::size_t size) {
    field(id, libflow::ThriftType::list);
    if (size < 15) {
      byte(static_cast<int>((size << 4) | static_cast<std::size_t>(type)));
    } else {
      byte(0xF0 | static_cast<int>(type));
      m_out += varint(size);
    }
  }

  // Start a struct that is a list element.
  void begin_element() {
    m_stack.push_back(m_last_id);
    m_last_id = 0;
  }

  void end_struct() {
    byte(0);
    m_last_id = m_stack.back();
    m_stack.pop_back();
  }

  void raw_i32(std::int32_t value) { m_out += varint(zigzag(value)); }

  void raw_binary(std::string_view value) {
    m_out += varint(value.size());
    m_out += std::string{value};
  }

  void stop() { byte(0); }

  const std::string& str() const noexcept { return m_out; }

private:
  std::string m_out{};
  std::int16_t m_last_id{0};
  std::vector<std::int16_t> m_stack{};

  void byte(int b) { m_out.push_back(static_cast<char>(b)); }
};

// Parquet value and level encodings.

inline std::string plain_int32(const std::vector<std::int32_t>& values) {
  std::string rv{};
  for (auto v : values) {
    rv += little_endian(static_cast<std::uint32_t>(v), 4);
  }
  return rv;
}

inline std::string plain_int64(const std::vector<std::int64_t>& values) {
  std::string rv{};
  for (auto v : values) {
    rv += little_endian(static_cast<std::uint64_t>(v), 8);
  }
  return rv;
}

inline std::string plain_double(const std::vector<double>& values) {
  std::string rv{};
  for (auto v : values) {
    rv += avro_double(v);
  }
  return rv;
}

inline std::string plain_float(const std::vector<float>& values) {
  std::string rv{};
  for (auto v : values) {
    rv += avro_float(v);
  }
  return rv;
}

inline std::string plain_byte_array(const std::vector<std::string>& values) {
  std::string rv{};
  for (const auto& v : values) {
    rv += little_endian(v.size(), 4);
    rv += v;
  }
  return rv;
}

inline std::string plain_boolean(const std::vector<bool>& values) {
  std::string rv((values.size() + 7) / 8, '\0');
  for (std::size_t i{0}; i < values.size(); ++i) {
    if (values[i]) {
      rv[i / 8] = static_cast<char>(rv[i / 8] | (1 << (i % 8)));
    }
  }
  return rv;
}

// A single bit-packed run holding _values_.
inline std::string bit_packed(
    const std::vector<std::uint32_t>& values, unsigned bit_width) {
  auto groups{(values.size() + 7) / 8};
  auto rv{varint((groups << 1) | 1)};
  std::string packed(groups * bit_width, '\0');
  for (std::size_t i{0}; i < values.size(); ++i) {
    for (unsigned b{0}; b < bit_width; ++b) {
      if ((values[i] >> b) & 1) {
        auto bit{i * bit_width + b};
        packed[bit / 8] = static_cast<char>(packed[bit / 8] | (1 << (bit % 8)));
      }
    }
  }
  return rv + packed;
}

// A single RLE run of _count_ copies of _value_.
inline std::string rle_run(
    std::uint32_t value, std::size_t count, unsigned bit_width) {
  return varint(count << 1) + little_endian(value, (bit_width + 7) / 8);
}

// Dictionary indices as written in a data page: the bit width followed by
// a bit-packed run.
inline std::string dictionary_indices(
    const std::vector<std::uint32_t>& ids, unsigned bit_width) {
  return std::string(1, static_cast<char>(bit_width)) + bit_packed(ids, bit_width);
}

// One column chunk with a single data page and an optional dictionary page.
struct ParquetChunk {
  std::vector<std::string> path{};
  libflow::PhysicalType type{};
  std::uint32_t max_definition_level{0};
  std::vector<std::uint32_t> definition_levels{};
  std::string values{};
  libflow::Encoding encoding{libflow::Encoding::plain};
  std::optional<std::string> dictionary{};
  std::int32_t dictionary_size{0};
  bool v2{false};
  libflow::CompressionCodec codec{libflow::CompressionCodec::uncompressed};
};

inline std::string compress(libflow::CompressionCodec codec, std::string_view data) {
  switch (codec) {
  case libflow::CompressionCodec::gzip:
    return gzip(data);
  case libflow::CompressionCodec::snappy:
    return snappy_literal(data);
  default:
    return std::string{data};
  }
}

inline unsigned level_width(std::uint32_t max_level) {
  unsigned rv{0};
  while (max_level) {
    ++rv;
    max_level >>= 1;
  }
  return rv;
}

inline std::string page_header(libflow::PageType type,
    std::size_t uncompressed_size, std::size_t compressed_size,
    const std::function<void(ThriftWriter&)>& write_body) {
  ThriftWriter w{};
  w.i32(1, static_cast<std::int32_t>(type));
  w.i32(2, static_cast<std::int32_t>(uncompressed_size));
  w.i32(3, static_cast<std::int32_t>(compressed_size));
  write_body(w);
  w.stop();
  return w.str();
}

// Return the bytes of a column chunk, with the offsets of its pages
// relative to the chunk start.
inline std::string column_chunk(const ParquetChunk& chunk,
    std::size_t num_rows, std::optional<std::size_t>& dictionary_offset,
    std::size_t& data_offset) {
  std::string rv{};
  dictionary_offset.reset();

  if (chunk.dictionary) {
    dictionary_offset = rv.size();
    auto compressed{compress(chunk.codec, *chunk.dictionary)};
    rv += page_header(libflow::PageType::dictionary_page,
        chunk.dictionary->size(), compressed.size(), [&](ThriftWriter& w) {
          w.begin_struct(7);
          w.i32(1, chunk.dictionary_size);
          w.i32(2, static_cast<std::int32_t>(libflow::Encoding::plain));
          w.end_struct();
        });
    rv += compressed;
  }

  data_offset = rv.size();
  auto width{level_width(chunk.max_definition_level)};
  std::string levels{};
  if (chunk.max_definition_level > 0) {
    levels = bit_packed(chunk.definition_levels, width);
  }

  std::size_t num_nulls{0};
  for (auto level : chunk.definition_levels) {
    if (level < chunk.max_definition_level) {
      ++num_nulls;
    }
  }

  if (chunk.v2) {
    auto compressed{compress(chunk.codec, chunk.values)};
    rv += page_header(libflow::PageType::data_page_v2,
        levels.size() + chunk.values.size(), levels.size() + compressed.size(),
        [&](ThriftWriter& w) {
          w.begin_struct(8);
          w.i32(1, static_cast<std::int32_t>(num_rows));
          w.i32(2, static_cast<std::int32_t>(num_nulls));
          w.i32(3, static_cast<std::int32_t>(num_rows));
          w.i32(4, static_cast<std::int32_t>(chunk.encoding));
          w.i32(5, static_cast<std::int32_t>(levels.size()));
          w.i32(6, 0);
          w.boolean(7, chunk.codec != libflow::CompressionCodec::uncompressed);
          w.end_struct();
        });
    rv += levels;
    rv += compressed;
  } else {
    std::string page{};
    if (chunk.max_definition_level > 0) {
      page += little_endian(levels.size(), 4);
      page += levels;
    }
    page += chunk.values;
    auto compressed{compress(chunk.codec, page)};
    rv += page_header(libflow::PageType::data_page, page.size(),
        compressed.size(), [&](ThriftWriter& w) {
          w.begin_struct(5);
          w.i32(1, static_cast<std::int32_t>(num_rows));
          w.i32(2, static_cast<std::int32_t>(chunk.encoding));
          w.i32(3, static_cast<std::int32_t>(libflow::Encoding::rle));
          w.i32(4, static_cast<std::int32_t>(libflow::Encoding::rle));
          w.end_struct();
        });
    rv += compressed;
  }

  return rv;
}

inline void schema_element(ThriftWriter& w, const libflow::SchemaElement& e,
    bool root) {
  w.begin_element();
  if (e.type) {
    w.i32(1, static_cast<std::int32_t>(*e.type));
  }
  if (e.type_length > 0) {
    w.i32(2, e.type_length);
  }
  if (!root) {
    w.i32(3, static_cast<std::int32_t>(e.repetition));
  }
  w.binary(4, e.name);
  if (e.num_children > 0) {
    w.i32(5, e.num_children);
  }
  if (e.converted_type) {
    w.i32(6, *e.converted_type);
  }
  w.end_struct();
}

// Return a parquet file with one row group of _num_rows_ rows. _schema_
// lists the schema elements depth first, starting with the root, and
// _chunks_ holds one chunk per leaf column in schema order.
inline std::string parquet_file(const std::vector<libflow::SchemaElement>& schema,
    const std::vector<ParquetChunk>& chunks, std::size_t num_rows) {
  std::string rv{"PAR1"};

  struct Placed {
    std::size_t start;
    std::size_t size;
    std::optional<std::size_t> dictionary_offset;
    std::size_t data_offset;
  };
  std::vector<Placed> placed{};

  for (const auto& chunk : chunks) {
    std::optional<std::size_t> dictionary_offset{};
    std::size_t data_offset{0};
    auto bytes{column_chunk(chunk, num_rows, dictionary_offset, data_offset)};
    placed.push_back(Placed{rv.size(), bytes.size(),
        dictionary_offset
            ? std::optional<std::size_t>{rv.size() + *dictionary_offset}
            : std::nullopt,
        rv.size() + data_offset});
    rv += bytes;
  }

  ThriftWriter w{};
  w.i32(1, 1);
  w.list(2, libflow::ThriftType::struct_, schema.size());
  for (std::size_t i{0}; i < schema.size(); ++i) {
    schema_element(w, schema[i], i == 0);
  }
  w.i64(3, static_cast<std::int64_t>(num_rows));

  w.list(4, libflow::ThriftType::struct_, 1);
  w.begin_element();
  w.list(1, libflow::ThriftType::struct_, chunks.size());
  for (std::size_t i{0}; i < chunks.size(); ++i) {
    const auto& chunk{chunks[i]};
    const auto& at{placed[i]};
    w.begin_element();
    w.i64(2, static_cast<std::int64_t>(at.start));
    w.begin_struct(3);
    w.i32(1, static_cast<std::int32_t>(chunk.type));
    w.list(2, libflow::ThriftType::i32, 1);
    w.raw_i32(static_cast<std::int32_t>(chunk.encoding));
    w.list(3, libflow::ThriftType::binary, chunk.path.size());
    for (const auto& name : chunk.path) {
      w.raw_binary(name);
    }
    w.i32(4, static_cast<std::int32_t>(chunk.codec));
    w.i64(5, static_cast<std::int64_t>(num_rows));
    w.i64(6, static_cast<std::int64_t>(at.size));
    w.i64(7, static_cast<std::int64_t>(at.size));
    w.i64(9, static_cast<std::int64_t>(at.data_offset));
    if (at.dictionary_offset) {
      w.i64(11, static_cast<std::int64_t>(*at.dictionary_offset));
    }
    w.end_struct();
    w.end_struct();
  }
  w.i64(2, 0);
  w.i64(3, static_cast<std::int64_t>(num_rows));
  w.end_struct();
  w.stop();

  rv += w.str();
  rv += little_endian(w.str().size(), 4);
  rv += "PAR1";
  return rv;
}

} // namespace fixtures

#endif // LIBFLOW_TESTS_FIXTURES_H
