/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Chunked transfer coding - Size-line parsing and chunk encoding
 */

#ifndef PORTICO_HTTP_CHUNKED_HPP
#define PORTICO_HTTP_CHUNKED_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace portico::http {

/**
 * Terminating zero-size chunk with an empty trailer section
 */
inline constexpr std::string_view last_chunk = "0\r\n\r\n";

/**
 * Parse a chunk-size line ("1a;ext=v\r\n")
 *
 * Extensions after ';' are ignored. The size must be plain hexadecimal
 * with no sign or prefix and fit in 64 bits.
 * @return The size, or nullopt if the line is malformed
 */
std::optional<std::uint64_t> parse_chunk_size(std::string_view line);

/**
 * Frame `data` as one chunk. Empty input yields an empty string, never
 * the last-chunk marker.
 */
std::string encode_chunk(std::string_view data);

} // namespace portico::http

#endif // PORTICO_HTTP_CHUNKED_HPP
