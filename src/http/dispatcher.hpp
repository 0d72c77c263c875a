/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Path dispatcher - Mounts gateways on path prefixes
 */

#ifndef PORTICO_HTTP_DISPATCHER_HPP
#define PORTICO_HTTP_DISPATCHER_HPP

#include "http/gateway.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace portico::http {

/**
 * Routes each request to the gateway mounted on the longest matching
 * prefix. The prefix moves from `path` to the end of `script_name`.
 * A prefix matches the path itself or anything below it ("/app" matches
 * "/app" and "/app/x", never "/apple"). Unmatched requests get 404.
 */
class PathDispatcher final : public Gateway {
public:
    /**
     * Mount `gateway` at `prefix`. "/" and "" mount at the root;
     * a trailing '/' is ignored. Remounting a prefix replaces it.
     */
    void mount(std::string prefix, std::shared_ptr<Gateway> gateway);

    Body handle(Request& request, StartResponse& start_response) override;

    std::size_t size() const noexcept { return mounts_.size(); }

private:
    std::vector<std::pair<std::string, std::shared_ptr<Gateway>>> mounts_;  // Longest prefix first
};

} // namespace portico::http

#endif // PORTICO_HTTP_DISPATCHER_HPP
