/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Headers - Ordered header multimap with case-insensitive lookup
 */

#ifndef PORTICO_HTTP_HEADERS_HPP
#define PORTICO_HTTP_HEADERS_HPP

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace portico::http {

/**
 * Header fields in arrival order.
 *
 * Names keep the spelling they were added with; every lookup compares
 * names case-insensitively. Repeated fields are kept as separate entries.
 */
class Headers {
public:
    using Field = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Field>::const_iterator;

    Headers() = default;
    Headers(std::initializer_list<Field> fields);

    /**
     * Append a field, keeping any existing field with the same name
     */
    void add(std::string name, std::string value);

    /**
     * Replace every field named `name` with a single one
     */
    void set(std::string_view name, std::string value);

    /**
     * Remove every field named `name`
     * @return Number of removed fields
     */
    std::size_t remove(std::string_view name);

    /**
     * First value for `name`
     */
    std::optional<std::string_view> get(std::string_view name) const;

    /**
     * All values for `name`, in arrival order
     */
    std::vector<std::string_view> get_all(std::string_view name) const;

    /**
     * All values for `name` joined with ", " (list-valued header semantics)
     */
    std::optional<std::string> get_combined(std::string_view name) const;

    bool contains(std::string_view name) const;

    /**
     * Check a comma-separated header for a token, case-insensitively.
     * `Connection: keep-alive, Upgrade` has the tokens "keep-alive" and "upgrade".
     */
    bool has_token(std::string_view name, std::string_view token) const;

    /**
     * Append a value to the most recent field (obsolete line folding)
     * @return false if there is no field to extend
     */
    bool extend_last(std::string_view continuation);

    std::size_t size() const noexcept { return fields_.size(); }
    bool empty() const noexcept { return fields_.empty(); }
    void clear() noexcept { fields_.clear(); }

    const_iterator begin() const noexcept { return fields_.begin(); }
    const_iterator end() const noexcept { return fields_.end(); }

private:
    std::vector<Field> fields_;
};

/**
 * Strip leading and trailing spaces and horizontal tabs
 */
std::string_view trim_ows(std::string_view value) noexcept;

/**
 * Convert a header name to its canonical form ("content-length" -> "Content-Length")
 */
std::string title_case(std::string_view name);

} // namespace portico::http

#endif // PORTICO_HTTP_HEADERS_HPP
