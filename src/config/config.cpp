/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Configuration System Implementation
 */

#include "config/config.hpp"

#include "net/bind_address.hpp"
#include "net/tls_adapter.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string_view>

namespace portico::config {

namespace {

std::uint64_t parse_unsigned(const std::string& value, std::string_view what) {
    try {
        if (value.empty() || value.front() == '-') {
            throw std::invalid_argument(value);
        }
        std::size_t pos = 0;
        auto parsed = std::stoull(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid " + std::string(what) + " value: " + value);
    }
}

double parse_seconds(const std::string& value, std::string_view what) {
    try {
        std::size_t pos = 0;
        auto parsed = std::stod(value, &pos);
        if (pos != value.size() || parsed < 0.0) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid " + std::string(what) + " value: " + value);
    }
}

bool parse_bool(const std::string& value, std::string_view what) {
    if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
    if (value == "false" || value == "0" || value == "no" || value == "off") return false;
    throw std::runtime_error("Invalid " + std::string(what) + " value: " + value);
}

/**
 * Value of "NAME VALUE" or "NAME=VALUE"; nullopt if `arg` is a different option
 */
std::optional<std::string> option_value(const std::string& arg, std::string_view name,
                                        int& i, int argc, char* argv[]) {
    if (arg == name) {
        if (i + 1 >= argc) {
            throw std::runtime_error("Missing value for " + std::string(name));
        }
        return std::string(argv[++i]);
    }
    if (arg.size() > name.size() && arg.starts_with(name) && arg[name.size()] == '=') {
        return arg.substr(name.size() + 1);
    }
    return std::nullopt;
}

} // anonymous namespace

// JSON serialization implementations
void to_json(nlohmann::json& j, const ServerSettings& s) {
    j = nlohmann::json{
        {"bind", s.bind},
        {"threads", s.threads},
        {"max_threads", s.max_threads},
        {"timeout", s.timeout},
        {"keep_alive_timeout", s.keep_alive_timeout},
        {"header_timeout", s.header_timeout},
        {"shutdown_timeout", s.shutdown_timeout},
        {"idle_worker_timeout", s.idle_worker_timeout},
        {"request_queue_size", s.request_queue_size},
        {"accepted_queue_size", s.accepted_queue_size},
        {"accepted_queue_timeout", s.accepted_queue_timeout},
        {"server_name", s.server_name},
        {"server_software", s.server_software},
        {"max_header_size", s.max_header_size},
        {"max_body_size", s.max_body_size},
        {"nodelay", s.nodelay},
        {"reuse_port", s.reuse_port},
        {"strict_mode", s.strict_mode},
        {"peercreds_enabled", s.peercreds_enabled},
        {"peercreds_resolve_enabled", s.peercreds_resolve_enabled}
    };
}

void from_json(const nlohmann::json& j, ServerSettings& s) {
    if (j.contains("bind")) j.at("bind").get_to(s.bind);
    if (j.contains("threads")) j.at("threads").get_to(s.threads);
    if (j.contains("max_threads")) j.at("max_threads").get_to(s.max_threads);
    if (j.contains("timeout")) j.at("timeout").get_to(s.timeout);
    if (j.contains("keep_alive_timeout")) j.at("keep_alive_timeout").get_to(s.keep_alive_timeout);
    if (j.contains("header_timeout")) j.at("header_timeout").get_to(s.header_timeout);
    if (j.contains("shutdown_timeout")) j.at("shutdown_timeout").get_to(s.shutdown_timeout);
    if (j.contains("idle_worker_timeout")) j.at("idle_worker_timeout").get_to(s.idle_worker_timeout);
    if (j.contains("request_queue_size")) j.at("request_queue_size").get_to(s.request_queue_size);
    if (j.contains("accepted_queue_size")) j.at("accepted_queue_size").get_to(s.accepted_queue_size);
    if (j.contains("accepted_queue_timeout")) j.at("accepted_queue_timeout").get_to(s.accepted_queue_timeout);
    if (j.contains("server_name")) j.at("server_name").get_to(s.server_name);
    if (j.contains("server_software")) j.at("server_software").get_to(s.server_software);
    if (j.contains("max_header_size")) j.at("max_header_size").get_to(s.max_header_size);
    if (j.contains("max_body_size")) j.at("max_body_size").get_to(s.max_body_size);
    if (j.contains("nodelay")) j.at("nodelay").get_to(s.nodelay);
    if (j.contains("reuse_port")) j.at("reuse_port").get_to(s.reuse_port);
    if (j.contains("strict_mode")) j.at("strict_mode").get_to(s.strict_mode);
    if (j.contains("peercreds_enabled")) j.at("peercreds_enabled").get_to(s.peercreds_enabled);
    if (j.contains("peercreds_resolve_enabled")) j.at("peercreds_resolve_enabled").get_to(s.peercreds_resolve_enabled);
}

void to_json(nlohmann::json& j, const SslSettings& s) {
    // key_password is read but never written back
    j = nlohmann::json{
        {"enabled", s.enabled},
        {"cert_file", s.cert_file},
        {"key_file", s.key_file},
        {"chain_file", s.chain_file},
        {"enable_tls_1_2", s.enable_tls_1_2},
        {"enable_tls_1_3", s.enable_tls_1_3},
        {"cipher_list", s.cipher_list},
        {"ciphersuites", s.ciphersuites},
        {"enable_session_cache", s.enable_session_cache},
        {"session_cache_size", s.session_cache_size},
        {"verify_client", s.verify_client}
    };
}

void from_json(const nlohmann::json& j, SslSettings& s) {
    if (j.contains("enabled")) j.at("enabled").get_to(s.enabled);
    if (j.contains("cert_file")) j.at("cert_file").get_to(s.cert_file);
    if (j.contains("key_file")) j.at("key_file").get_to(s.key_file);
    if (j.contains("chain_file")) j.at("chain_file").get_to(s.chain_file);
    if (j.contains("key_password")) j.at("key_password").get_to(s.key_password);
    if (j.contains("enable_tls_1_2")) j.at("enable_tls_1_2").get_to(s.enable_tls_1_2);
    if (j.contains("enable_tls_1_3")) j.at("enable_tls_1_3").get_to(s.enable_tls_1_3);
    if (j.contains("cipher_list")) j.at("cipher_list").get_to(s.cipher_list);
    if (j.contains("ciphersuites")) j.at("ciphersuites").get_to(s.ciphersuites);
    if (j.contains("enable_session_cache")) j.at("enable_session_cache").get_to(s.enable_session_cache);
    if (j.contains("session_cache_size")) j.at("session_cache_size").get_to(s.session_cache_size);
    if (j.contains("verify_client")) j.at("verify_client").get_to(s.verify_client);
}

void to_json(nlohmann::json& j, const LogSettings& l) {
    j = nlohmann::json{
        {"level", l.level},
        {"file", l.file},
        {"max_file_size_mb", l.max_file_size_mb},
        {"max_files", l.max_files},
        {"enable_console", l.enable_console},
        {"enable_colors", l.enable_colors},
        {"access_log", l.access_log}
    };
}

void from_json(const nlohmann::json& j, LogSettings& l) {
    if (j.contains("level")) j.at("level").get_to(l.level);
    if (j.contains("file")) j.at("file").get_to(l.file);
    if (j.contains("max_file_size_mb")) j.at("max_file_size_mb").get_to(l.max_file_size_mb);
    if (j.contains("max_files")) j.at("max_files").get_to(l.max_files);
    if (j.contains("enable_console")) j.at("enable_console").get_to(l.enable_console);
    if (j.contains("enable_colors")) j.at("enable_colors").get_to(l.enable_colors);
    if (j.contains("access_log")) j.at("access_log").get_to(l.access_log);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"server", c.server},
        {"ssl", c.ssl},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("server")) j.at("server").get_to(c.server);
    if (j.contains("ssl")) j.at("ssl").get_to(c.ssl);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

util::LogConfig LogSettings::to_log_config() const {
    auto parsed = util::Logger::parse_level(level);
    if (!parsed) {
        throw std::runtime_error("Configuration error: unknown logging.level '" + level + "'");
    }

    util::LogConfig config;
    config.level = *parsed;
    config.file_path = file;
    config.max_file_size_mb = max_file_size_mb;
    config.max_files = max_files;
    config.enable_console = enable_console;
    config.enable_colors = enable_colors;
    config.access_log = access_log;
    return config;
}

// Config validation
void Config::validate() const {
    try {
        net::BindAddress::parse(server.bind);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Configuration error: server.bind: " + std::string(e.what()));
    }

    if (server.threads == 0) {
        throw std::runtime_error("Configuration error: server.threads must be non-zero");
    }
    if (server.max_threads < server.threads) {
        throw std::runtime_error("Configuration error: server.max_threads must be at least server.threads");
    }
    if (server.timeout <= 0.0) {
        throw std::runtime_error("Configuration error: server.timeout must be positive");
    }
    if (server.keep_alive_timeout <= 0.0) {
        throw std::runtime_error("Configuration error: server.keep_alive_timeout must be positive");
    }
    if (server.header_timeout <= 0.0) {
        throw std::runtime_error("Configuration error: server.header_timeout must be positive");
    }
    if (server.shutdown_timeout < 0.0) {
        throw std::runtime_error("Configuration error: server.shutdown_timeout cannot be negative");
    }
    if (server.idle_worker_timeout <= 0.0) {
        throw std::runtime_error("Configuration error: server.idle_worker_timeout must be positive");
    }
    if (server.accepted_queue_timeout < 0.0) {
        throw std::runtime_error("Configuration error: server.accepted_queue_timeout cannot be negative");
    }
    if (server.request_queue_size == 0) {
        throw std::runtime_error("Configuration error: server.request_queue_size must be non-zero");
    }
    if (server.server_software.empty()) {
        throw std::runtime_error("Configuration error: server.server_software cannot be empty");
    }

    if (ssl.enabled) {
        if (ssl.cert_file.empty()) {
            throw std::runtime_error("Configuration error: ssl.cert_file cannot be empty when SSL is enabled");
        }
        if (ssl.key_file.empty()) {
            throw std::runtime_error("Configuration error: ssl.key_file cannot be empty when SSL is enabled");
        }
        if (!ssl.enable_tls_1_2 && !ssl.enable_tls_1_3) {
            throw std::runtime_error("Configuration error: at least one of TLS 1.2 and TLS 1.3 must be enabled");
        }
        if (!net::parse_client_verify(ssl.verify_client)) {
            throw std::runtime_error("Configuration error: ssl.verify_client must be none, optional or required");
        }
    }

    logging.to_log_config();

    spdlog::debug("Configuration validated successfully");
}

// ConfigManager implementation
bool ConfigManager::load(int argc, char* argv[]) {
    std::lock_guard<std::mutex> lock(config_mutex_);

    config_ = Config{};
    config_path_.clear();

    // First pass: look for --help or --config
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "--help" || arg == "-h") {
            print_help(argv[0]);
            return false;
        }
        if (auto value = option_value(arg, "--config", i, argc, argv)) {
            config_path_ = *value;
        } else if (auto short_value = option_value(arg, "-c", i, argc, argv)) {
            config_path_ = *short_value;
        }
    }

    if (!config_path_.empty()) {
        load_from_file(config_path_);
    }

    apply_environment_overrides();
    apply_cli_overrides(argc, argv);

    config_.validate();

    spdlog::debug("Configuration loaded successfully");
    return true;
}

Config ConfigManager::get_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

std::filesystem::path ConfigManager::get_config_path() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_path_;
}

void ConfigManager::print_help(const char* program_name) {
    std::cout << "PORTICO - Embedded HTTP/1.x Server\n"
              << "\n"
              << "Usage: " << program_name << " [OPTIONS]\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help                      Show this help message and exit\n"
              << "  -c, --config FILE               Path to JSON configuration file\n"
              << "  -b, --bind ADDRESS              host:port, [v6]:port, socket path or @name\n"
              << "                                  (default: 127.0.0.1:8080)\n"
              << "  -t, --threads NUM               Minimum worker threads (default: 10)\n"
              << "  --max-threads NUM               Maximum worker threads (default: 10)\n"
              << "  --timeout SECONDS               Socket timeout (default: 10)\n"
              << "  --keep-alive-timeout SECONDS    Idle time between requests (default: 10)\n"
              << "  --shutdown-timeout SECONDS      Grace period on stop (default: 5)\n"
              << "  --request-queue-size NUM        listen() backlog (default: 128)\n"
              << "  --accepted-queue-size NUM       Hand-off queue bound, 0 = unbounded (default: 0)\n"
              << "  --accepted-queue-timeout SEC    Wait for queue space (default: 10)\n"
              << "  --server-name NAME              SERVER_NAME seen by the application\n"
              << "  --max-header-size BYTES         Request head limit, 0 = unlimited (default: 65536)\n"
              << "  --max-body-size BYTES           Request body limit, 0 = unlimited (default: 0)\n"
              << "  --ssl-cert FILE                 Certificate chain (enables TLS)\n"
              << "  --ssl-key FILE                  Private key\n"
              << "  --ssl-chain FILE                CA bundle for client certificates\n"
              << "  --log-level LEVEL               trace/debug/info/warn/error/critical/off\n"
              << "\n"
              << "Environment Variables:\n"
              << "  PORTICO_CONFIG                  Path to configuration file\n"
              << "  PORTICO_BIND                    Bind address\n"
              << "  PORTICO_THREADS                 Minimum worker threads\n"
              << "  PORTICO_MAX_THREADS             Maximum worker threads\n"
              << "  PORTICO_TIMEOUT                 Socket timeout in seconds\n"
              << "  PORTICO_KEEP_ALIVE_TIMEOUT      Keep-alive timeout in seconds\n"
              << "  PORTICO_SHUTDOWN_TIMEOUT        Shutdown grace period in seconds\n"
              << "  PORTICO_SERVER_NAME             Server name\n"
              << "  PORTICO_MAX_HEADER_SIZE         Request head limit\n"
              << "  PORTICO_MAX_BODY_SIZE           Request body limit\n"
              << "  PORTICO_ACCEPTED_QUEUE_SIZE     Hand-off queue bound\n"
              << "  PORTICO_SSL_CERT                Certificate chain (enables TLS)\n"
              << "  PORTICO_SSL_KEY                 Private key\n"
              << "  PORTICO_SSL_CHAIN               CA bundle\n"
              << "  PORTICO_LOG_LEVEL               Log level\n"
              << "  PORTICO_LOG_FILE                Log file path (stdout if not set)\n"
              << "  PORTICO_ACCESS_LOG              Enable/disable the access log (true/false)\n"
              << "\n"
              << "Configuration Precedence (highest to lowest):\n"
              << "  1. Command-line arguments\n"
              << "  2. Environment variables\n"
              << "  3. Configuration file\n"
              << "  4. Default values\n"
              << "\n"
              << "Configuration File Format (JSON):\n"
              << "  {\n"
              << "    \"server\": {\n"
              << "      \"bind\": \"0.0.0.0:8080\",\n"
              << "      \"threads\": 10,\n"
              << "      \"max_threads\": 32,\n"
              << "      \"timeout\": 10,\n"
              << "      \"max_body_size\": 1048576\n"
              << "    },\n"
              << "    \"ssl\": {\n"
              << "      \"enabled\": false,\n"
              << "      \"cert_file\": \"server.crt\",\n"
              << "      \"key_file\": \"server.key\",\n"
              << "      \"verify_client\": \"none\"\n"
              << "    },\n"
              << "    \"logging\": {\n"
              << "      \"level\": \"info\",\n"
              << "      \"file\": \"\",\n"
              << "      \"access_log\": true\n"
              << "    }\n"
              << "  }\n";
}

void ConfigManager::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Configuration file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open configuration file: " + path.string());
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config_ = j.get<Config>();
        spdlog::debug("Loaded configuration from {}", path.string());
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid JSON in configuration file: " + std::string(e.what()));
    }
}

void ConfigManager::apply_environment_overrides() {
    if (config_path_.empty()) {
        if (auto env = get_env("PORTICO_CONFIG")) {
            config_path_ = *env;
            if (!config_path_.empty()) {
                load_from_file(config_path_);
            }
        }
    }

    auto& server = config_.server;
    if (auto env = get_env("PORTICO_BIND")) {
        server.bind = *env;
    }
    if (auto env = get_env("PORTICO_THREADS")) {
        server.threads = parse_unsigned(*env, "PORTICO_THREADS");
    }
    if (auto env = get_env("PORTICO_MAX_THREADS")) {
        server.max_threads = parse_unsigned(*env, "PORTICO_MAX_THREADS");
    }
    if (auto env = get_env("PORTICO_TIMEOUT")) {
        server.timeout = parse_seconds(*env, "PORTICO_TIMEOUT");
    }
    if (auto env = get_env("PORTICO_KEEP_ALIVE_TIMEOUT")) {
        server.keep_alive_timeout = parse_seconds(*env, "PORTICO_KEEP_ALIVE_TIMEOUT");
    }
    if (auto env = get_env("PORTICO_SHUTDOWN_TIMEOUT")) {
        server.shutdown_timeout = parse_seconds(*env, "PORTICO_SHUTDOWN_TIMEOUT");
    }
    if (auto env = get_env("PORTICO_SERVER_NAME")) {
        server.server_name = *env;
    }
    if (auto env = get_env("PORTICO_MAX_HEADER_SIZE")) {
        server.max_header_size = parse_unsigned(*env, "PORTICO_MAX_HEADER_SIZE");
    }
    if (auto env = get_env("PORTICO_MAX_BODY_SIZE")) {
        server.max_body_size = parse_unsigned(*env, "PORTICO_MAX_BODY_SIZE");
    }
    if (auto env = get_env("PORTICO_ACCEPTED_QUEUE_SIZE")) {
        server.accepted_queue_size = parse_unsigned(*env, "PORTICO_ACCEPTED_QUEUE_SIZE");
    }

    if (auto env = get_env("PORTICO_SSL_CERT")) {
        config_.ssl.cert_file = *env;
        config_.ssl.enabled = !env->empty();
    }
    if (auto env = get_env("PORTICO_SSL_KEY")) {
        config_.ssl.key_file = *env;
    }
    if (auto env = get_env("PORTICO_SSL_CHAIN")) {
        config_.ssl.chain_file = *env;
    }

    if (auto env = get_env("PORTICO_LOG_LEVEL")) {
        config_.logging.level = *env;
    }
    if (auto env = get_env("PORTICO_LOG_FILE")) {
        config_.logging.file = *env;
    }
    if (auto env = get_env("PORTICO_ACCESS_LOG")) {
        config_.logging.access_log = parse_bool(*env, "PORTICO_ACCESS_LOG");
    }
}

void ConfigManager::apply_cli_overrides(int argc, char* argv[]) {
    auto& server = config_.server;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        // Handled in the first pass
        if (option_value(arg, "--config", i, argc, argv) || option_value(arg, "-c", i, argc, argv)) {
            continue;
        }

        if (auto v = option_value(arg, "--bind", i, argc, argv)) {
            server.bind = *v;
        } else if (auto v = option_value(arg, "-b", i, argc, argv)) {
            server.bind = *v;
        } else if (auto v = option_value(arg, "--threads", i, argc, argv)) {
            server.threads = parse_unsigned(*v, "--threads");
        } else if (auto v = option_value(arg, "-t", i, argc, argv)) {
            server.threads = parse_unsigned(*v, "-t");
        } else if (auto v = option_value(arg, "--max-threads", i, argc, argv)) {
            server.max_threads = parse_unsigned(*v, "--max-threads");
        } else if (auto v = option_value(arg, "--timeout", i, argc, argv)) {
            server.timeout = parse_seconds(*v, "--timeout");
        } else if (auto v = option_value(arg, "--keep-alive-timeout", i, argc, argv)) {
            server.keep_alive_timeout = parse_seconds(*v, "--keep-alive-timeout");
        } else if (auto v = option_value(arg, "--shutdown-timeout", i, argc, argv)) {
            server.shutdown_timeout = parse_seconds(*v, "--shutdown-timeout");
        } else if (auto v = option_value(arg, "--request-queue-size", i, argc, argv)) {
            server.request_queue_size = parse_unsigned(*v, "--request-queue-size");
        } else if (auto v = option_value(arg, "--accepted-queue-size", i, argc, argv)) {
            server.accepted_queue_size = parse_unsigned(*v, "--accepted-queue-size");
        } else if (auto v = option_value(arg, "--accepted-queue-timeout", i, argc, argv)) {
            server.accepted_queue_timeout = parse_seconds(*v, "--accepted-queue-timeout");
        } else if (auto v = option_value(arg, "--server-name", i, argc, argv)) {
            server.server_name = *v;
        } else if (auto v = option_value(arg, "--max-header-size", i, argc, argv)) {
            server.max_header_size = parse_unsigned(*v, "--max-header-size");
        } else if (auto v = option_value(arg, "--max-body-size", i, argc, argv)) {
            server.max_body_size = parse_unsigned(*v, "--max-body-size");
        } else if (auto v = option_value(arg, "--ssl-cert", i, argc, argv)) {
            config_.ssl.cert_file = *v;
            config_.ssl.enabled = true;
        } else if (auto v = option_value(arg, "--ssl-key", i, argc, argv)) {
            config_.ssl.key_file = *v;
        } else if (auto v = option_value(arg, "--ssl-chain", i, argc, argv)) {
            config_.ssl.chain_file = *v;
        } else if (auto v = option_value(arg, "--log-level", i, argc, argv)) {
            config_.logging.level = *v;
        } else {
            throw std::runtime_error("Unknown option: " + arg + " (see --help)");
        }
    }
}

std::optional<std::string> ConfigManager::get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value) {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace portico::config
