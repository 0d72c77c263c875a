/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Headers implementation
 */

#include "http/headers.hpp"

#include <boost/beast/core/string.hpp>

#include <algorithm>
#include <cctype>

namespace portico::http {

namespace beast = boost::beast;

Headers::Headers(std::initializer_list<Field> fields)
    : fields_(fields)
{
}

void Headers::add(std::string name, std::string value) {
    fields_.emplace_back(std::move(name), std::move(value));
}

void Headers::set(std::string_view name, std::string value) {
    auto it = std::find_if(fields_.begin(), fields_.end(), [name](const Field& f) {
        return beast::iequals(f.first, name);
    });
    if (it == fields_.end()) {
        fields_.emplace_back(std::string(name), std::move(value));
        return;
    }
    it->second = std::move(value);

    // Drop any later duplicates, keeping the position of the first one
    auto rest = std::remove_if(std::next(it), fields_.end(), [name](const Field& f) {
        return beast::iequals(f.first, name);
    });
    fields_.erase(rest, fields_.end());
}

std::size_t Headers::remove(std::string_view name) {
    auto before = fields_.size();
    std::erase_if(fields_, [name](const Field& f) {
        return beast::iequals(f.first, name);
    });
    return before - fields_.size();
}

std::optional<std::string_view> Headers::get(std::string_view name) const {
    for (const auto& [key, value] : fields_) {
        if (beast::iequals(key, name)) {
            return std::string_view(value);
        }
    }
    return std::nullopt;
}

std::vector<std::string_view> Headers::get_all(std::string_view name) const {
    std::vector<std::string_view> values;
    for (const auto& [key, value] : fields_) {
        if (beast::iequals(key, name)) {
            values.emplace_back(value);
        }
    }
    return values;
}

std::optional<std::string> Headers::get_combined(std::string_view name) const {
    std::optional<std::string> combined;
    for (const auto& [key, value] : fields_) {
        if (!beast::iequals(key, name)) {
            continue;
        }
        if (combined) {
            combined->append(", ");
            combined->append(value);
        } else {
            combined = value;
        }
    }
    return combined;
}

bool Headers::contains(std::string_view name) const {
    return get(name).has_value();
}

bool Headers::has_token(std::string_view name, std::string_view token) const {
    for (auto value : get_all(name)) {
        while (!value.empty()) {
            auto comma = value.find(',');
            auto item = trim_ows(value.substr(0, comma));
            if (beast::iequals(item, token)) {
                return true;
            }
            if (comma == std::string_view::npos) {
                break;
            }
            value.remove_prefix(comma + 1);
        }
    }
    return false;
}

bool Headers::extend_last(std::string_view continuation) {
    if (fields_.empty()) {
        return false;
    }
    auto& value = fields_.back().second;
    if (!value.empty()) {
        value.push_back(' ');
    }
    value.append(continuation);
    return true;
}

std::string_view trim_ows(std::string_view value) noexcept {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
        value.remove_suffix(1);
    }
    return value;
}

std::string title_case(std::string_view name) {
    std::string result;
    result.reserve(name.size());
    bool upper = true;
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        result.push_back(static_cast<char>(upper ? std::toupper(uc) : std::tolower(uc)));
        upper = (c == '-');
    }
    return result;
}

} // namespace portico::http
