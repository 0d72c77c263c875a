/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Test support - server on an ephemeral port
 */

#ifndef PORTICO_TESTS_TEST_SERVER_HPP
#define PORTICO_TESTS_TEST_SERVER_HPP

#include "http/gateway.hpp"
#include "server/http_server.hpp"
#include "server/server_config.hpp"

#include <chrono>
#include <functional>
#include <memory>

namespace portico::test {

using namespace std::chrono_literals;

inline server::ServerConfig test_config() {
    server::ServerConfig config;
    config.bind = net::BindAddress::tcp("127.0.0.1", 0);
    config.min_workers = 4;
    config.max_workers = 4;
    config.timeout = 2s;
    config.keep_alive_timeout = 2s;
    config.header_timeout = 2s;
    config.shutdown_timeout = 1s;
    config.server_name = "test";
    return config;
}

/**
 * HttpServer started on construction, stopped on destruction
 */
struct TestServer {
    using Mutator = std::function<void(server::ServerConfig&)>;

    static server::ServerConfig make_config(const Mutator& mutate) {
        auto config = test_config();
        if (mutate) {
            mutate(config);
        }
        return config;
    }

    explicit TestServer(std::shared_ptr<http::Gateway> gateway, const Mutator& mutate = nullptr)
        : server(make_config(mutate), std::move(gateway))
    {
        server.start();
    }

    explicit TestServer(http::HandlerGateway::Handler handler, const Mutator& mutate = nullptr)
        : TestServer(std::make_shared<http::HandlerGateway>(std::move(handler)), mutate)
    {
    }

    std::uint16_t port() const noexcept { return server.port(); }

    server::HttpServer server;
};

} // namespace portico::test

#endif // PORTICO_TESTS_TEST_SERVER_HPP
