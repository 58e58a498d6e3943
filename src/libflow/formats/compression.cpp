#include "libflow/formats/compression.hpp"
#include "libflow/exceptions.hpp" // libflow::FormatError
#include <algorithm>              // std::max
#include <string>                 // std::string
#include <zlib.h> // inflateInit2 inflate inflateEnd crc32 z_stream

namespace libflow {

using namespace std::string_literals;

namespace {

constexpr std::size_t MAX_INFLATED_SIZE{std::size_t{1} << 30};

std::string inflate_with(
    std::string_view compressed, std::size_t size_hint, int window_bits) {
  z_stream stream{};
  stream.next_in =
      reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
  stream.avail_in = static_cast<uInt>(compressed.size());

  if (inflateInit2(&stream, window_bits) != Z_OK) {
    throw FormatError("inflateInit2 failed");
  }

  std::string rv(std::max<std::size_t>(
                     size_hint, std::max<std::size_t>(compressed.size() * 3, 1024)),
      '\0');

  for (;;) {
    if (stream.total_out == rv.size()) {
      if (rv.size() > MAX_INFLATED_SIZE) {
        inflateEnd(&stream);
        throw FormatError("inflated data is too large");
      }
      rv.resize(rv.size() * 2);
    }

    stream.next_out = reinterpret_cast<Bytef*>(rv.data() + stream.total_out);
    stream.avail_out = static_cast<uInt>(rv.size() - stream.total_out);

    auto ret{inflate(&stream, Z_NO_FLUSH)};
    if (ret == Z_STREAM_END) {
      break;
    }
    if (ret != Z_OK) {
      std::string message{stream.msg ? stream.msg : "inflate failed"};
      inflateEnd(&stream);
      throw FormatError(message);
    }
  }

  rv.resize(stream.total_out);
  inflateEnd(&stream);
  return rv;
}

std::uint64_t read_varint(std::string_view data, std::size_t& pos) {
  std::uint64_t rv{0};
  for (int shift{0}; shift < 64; shift += 7) {
    if (pos >= data.size()) {
      throw FormatError("truncated varint");
    }
    auto byte{static_cast<std::uint8_t>(data[pos++])};
    rv |= static_cast<std::uint64_t>(byte & 0x7F) << shift;
    if ((byte & 0x80) == 0) {
      return rv;
    }
  }
  throw FormatError("varint is too long");
}

} // namespace

std::string inflate_raw(std::string_view compressed, std::size_t size_hint) {
  return inflate_with(compressed, size_hint, -MAX_WBITS);
}

std::string gunzip(std::string_view compressed, std::size_t size_hint) {
  return inflate_with(compressed, size_hint, 16 + MAX_WBITS);
}

std::string snappy_uncompress(std::string_view compressed) {
  std::size_t pos{0};
  auto length{read_varint(compressed, pos)};
  if (length > MAX_INFLATED_SIZE) {
    throw FormatError("snappy: uncompressed length is too large");
  }

  std::string rv{};
  rv.reserve(static_cast<std::size_t>(length));

  while (pos < compressed.size()) {
    auto tag{static_cast<std::uint8_t>(compressed[pos++])};
    auto element{tag & 0x03};

    if (element == 0) {
      std::size_t literal_length{static_cast<std::size_t>(tag >> 2)};
      if (literal_length >= 60) {
        auto n{literal_length - 59};
        if (pos + n > compressed.size()) {
          throw FormatError("snappy: truncated literal length");
        }
        literal_length = 0;
        for (std::size_t i{0}; i < n; ++i) {
          literal_length |=
              static_cast<std::size_t>(
                  static_cast<std::uint8_t>(compressed[pos + i]))
              << (8 * i);
        }
        pos += n;
      }
      literal_length += 1;

      if (pos + literal_length > compressed.size()) {
        throw FormatError("snappy: truncated literal");
      }
      rv.append(compressed.substr(pos, literal_length));
      pos += literal_length;
      continue;
    }

    std::size_t copy_length{0};
    std::size_t offset{0};
    if (element == 1) {
      if (pos >= compressed.size()) {
        throw FormatError("snappy: truncated copy");
      }
      copy_length = 4 + ((tag >> 2) & 0x07);
      offset = (static_cast<std::size_t>(tag & 0xE0) << 3) |
               static_cast<std::uint8_t>(compressed[pos++]);
    } else {
      std::size_t width{element == 2 ? std::size_t{2} : std::size_t{4}};
      if (pos + width > compressed.size()) {
        throw FormatError("snappy: truncated copy");
      }
      copy_length = 1 + (tag >> 2);
      for (std::size_t i{0}; i < width; ++i) {
        offset |= static_cast<std::size_t>(
                      static_cast<std::uint8_t>(compressed[pos + i]))
                  << (8 * i);
      }
      pos += width;
    }

    if (offset == 0 || offset > rv.size()) {
      throw FormatError("snappy: invalid copy offset");
    }

    // Copies may overlap the bytes they produce.
    auto start{rv.size() - offset};
    for (std::size_t i{0}; i < copy_length; ++i) {
      rv.push_back(rv[start + i]);
    }
  }

  if (rv.size() != length) {
    throw FormatError("snappy: uncompressed length mismatch");
  }
  return rv;
}

std::uint32_t crc32(std::string_view data) noexcept {
  auto rv{::crc32(0L, Z_NULL, 0)};
  rv = ::crc32(rv, reinterpret_cast<const Bytef*>(data.data()),
      static_cast<uInt>(data.size()));
  return static_cast<std::uint32_t>(rv);
}

} // namespace libflow
