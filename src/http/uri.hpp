/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Request target - Validation and decoding of the request-line target
 */

#ifndef PORTICO_HTTP_URI_HPP
#define PORTICO_HTTP_URI_HPP

#include <string>
#include <string_view>

namespace portico::http {

/**
 * Decoded origin-form target
 */
struct RequestTarget {
    std::string path;   // Percent-decoded, with "%2F" kept encoded
    std::string query;  // Raw, without the '?'
};

/**
 * Validate a request target for a non-proxy server and split it
 *
 * @throws HttpError 405 for CONNECT
 * @throws BadRequest for absolute-form targets, fragments, or paths not
 *         starting with '/' (except "OPTIONS *")
 */
RequestTarget parse_target(std::string_view method, std::string_view target);

/**
 * Percent-decode a path, leaving "%2F" encoded so that path segments
 * keep their boundaries. Malformed escapes are copied through.
 */
std::string decode_path(std::string_view path);

} // namespace portico::http

#endif // PORTICO_HTTP_URI_HPP
