/**
 * PORTICO - Embedded HTTP/1.x Server Core
 *
 * Demo server: a greeting at "/", a streaming echo at "/echo" and the
 * live server statistics at "/stats".
 */

#include "config/config.hpp"
#include "http/dispatcher.hpp"
#include "http/gateway.hpp"
#include "server/http_server.hpp"
#include "server/server_config.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>

namespace {

using namespace portico;

/**
 * Streams the request body straight back, chunked
 */
class EchoGateway final : public http::Gateway {
public:
    http::Body handle(http::Request& request, http::StartResponse& start_response) override {
        http::Headers headers;
        auto content_type = request.headers.get("Content-Type");
        headers.add("Content-Type", content_type ? std::string(*content_type) : "application/octet-stream");
        start_response(http::status::ok, std::move(headers));

        http::BodyReader* body = request.body.get();
        return http::Body([body]() -> std::optional<std::string> {
            auto piece = body->read();
            if (piece.empty()) {
                return std::nullopt;
            }
            return piece;
        });
    }
};

} // anonymous namespace

int main(int argc, char* argv[]) {
    util::Logger::init_default();

    try {
        config::ConfigManager config_manager;
        if (!config_manager.load(argc, argv)) {
            // --help was requested
            return 0;
        }

        auto config = config_manager.get_config();
        util::Logger::init(config.logging.to_log_config());
        PORTICO_LOG_INFO(util::log_component::Server, "{} starting", config.server.server_software);

        auto server_config = server::make_server_config(config);

        // Set once the server exists; /stats is only served after start()
        std::atomic<server::HttpServer*> server_ref{nullptr};

        auto dispatcher = std::make_shared<http::PathDispatcher>();
        dispatcher->mount("/", std::make_shared<http::HandlerGateway>([](http::Request& request) {
            return http::Response::text(http::status::ok,
                                        "Hello from Portico! You asked for " + request.path + "\n");
        }));
        dispatcher->mount("/echo", std::make_shared<EchoGateway>());
        dispatcher->mount("/stats", std::make_shared<http::HandlerGateway>([&server_ref](http::Request&) {
            nlohmann::json body = nlohmann::json::object();
            if (auto* server = server_ref.load()) {
                body = server->stats();
            }
            std::string text = body.dump(2);
            http::Response response;
            response.headers.add("Content-Type", "application/json");
            response.headers.add("Content-Length", std::to_string(text.size()));
            response.body = std::move(text);
            return response;
        }));

        server::HttpServer server(server_config, dispatcher);
        server_ref = &server;

        server.enable_signal_handling();
        server.start();

        PORTICO_LOG_INFO(util::log_component::Server, "Press Ctrl+C to shutdown");
        server.wait();

        server_ref = nullptr;
    } catch (const std::exception& e) {
        PORTICO_LOG_CRITICAL(util::log_component::Server, "Fatal error: {}", e.what());
        util::Logger::instance().shutdown();
        return 1;
    }

    PORTICO_LOG_INFO(util::log_component::Server, "Server stopped");
    util::Logger::instance().shutdown();
    return 0;
}
