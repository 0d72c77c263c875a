/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Path dispatcher implementation
 */

#include "http/dispatcher.hpp"

#include <algorithm>
#include <stdexcept>

namespace portico::http {

void PathDispatcher::mount(std::string prefix, std::shared_ptr<Gateway> gateway) {
    if (!gateway) {
        throw std::invalid_argument("Cannot mount a null gateway at '" + prefix + "'");
    }
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }
    if (!prefix.empty() && prefix.front() != '/') {
        prefix.insert(prefix.begin(), '/');
    }

    auto existing = std::find_if(mounts_.begin(), mounts_.end(),
                                 [&prefix](const auto& m) { return m.first == prefix; });
    if (existing != mounts_.end()) {
        existing->second = std::move(gateway);
        return;
    }

    mounts_.emplace_back(std::move(prefix), std::move(gateway));
    std::stable_sort(mounts_.begin(), mounts_.end(), [](const auto& a, const auto& b) {
        return a.first.size() > b.first.size();
    });
}

Body PathDispatcher::handle(Request& request, StartResponse& start_response) {
    const std::string& path = request.path;
    for (const auto& [prefix, gateway] : mounts_) {
        bool matches = path == prefix ||
                       (path.size() > prefix.size() && path.compare(0, prefix.size(), prefix) == 0 &&
                        path[prefix.size()] == '/');
        if (!matches) {
            continue;
        }
        request.script_name += prefix;
        request.path = path.substr(prefix.size());
        return gateway->handle(request, start_response);
    }

    start_response(Status(status::not_found),
                   Headers{{"Content-Type", "text/plain"}, {"Content-Length", "0"}});
    return Body(std::string());
}

} // namespace portico::http
