#ifndef LIBFLOW_FORMATS_COMPRESSION_H
#define LIBFLOW_FORMATS_COMPRESSION_H

#include <cstddef>     // std::size_t
#include <cstdint>     // std::uint32_t
#include <string>      // std::string
#include <string_view> // std::string_view

namespace libflow {

// Decompress a raw deflate stream (no zlib or gzip header). Throws a
// FormatError on corrupt input.
std::string inflate_raw(std::string_view compressed, std::size_t size_hint = 0);

// Decompress a gzip stream. Throws a FormatError on corrupt input.
std::string gunzip(std::string_view compressed, std::size_t size_hint = 0);

// Decompress a snappy block (varint length preamble followed by literal and
// copy elements). Throws a FormatError on corrupt input.
std::string snappy_uncompress(std::string_view compressed);

std::uint32_t crc32(std::string_view data) noexcept;

} // namespace libflow

#endif // LIBFLOW_FORMATS_COMPRESSION_H
