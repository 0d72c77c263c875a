/**
 * PORTICO - Embedded HTTP/1.x Server Core
 * Configuration System - Supports JSON file, environment variables, and CLI args
 *
 * Configuration hierarchy (highest precedence first):
 * 1. Command-line arguments
 * 2. Environment variables (PORTICO_*)
 * 3. Configuration file (JSON)
 * 4. Default values
 */

#ifndef PORTICO_CONFIG_CONFIG_HPP
#define PORTICO_CONFIG_CONFIG_HPP

#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace portico::config {

/**
 * Server configuration
 *
 * Durations are in seconds and may be fractional.
 */
struct ServerSettings {
    std::string bind{"127.0.0.1:8080"};     // host:port, [v6]:port, Unix path or @abstract
    std::size_t threads{10};                // Minimum worker threads
    std::size_t max_threads{10};            // Maximum worker threads
    double timeout{10.0};                   // Per-operation socket timeout
    double keep_alive_timeout{10.0};        // Idle time allowed between requests
    double header_timeout{10.0};            // Total time allowed for a request head
    double shutdown_timeout{5.0};           // Grace period for in-flight requests
    double idle_worker_timeout{60.0};       // Surplus idle workers exit after this
    std::size_t request_queue_size{128};    // listen() backlog
    std::size_t accepted_queue_size{0};     // 0 = unbounded hand-off queue
    double accepted_queue_timeout{10.0};    // Wait for queue space before refusing
    std::string server_name;                // Empty = host name
    std::string server_software{"Portico/0.1.0"};
    std::size_t max_header_size{65536};     // 0 = unlimited
    std::uint64_t max_body_size{0};         // 0 = unlimited
    bool nodelay{true};
    bool reuse_port{false};
    bool strict_mode{true};
    bool peercreds_enabled{false};
    bool peercreds_resolve_enabled{false};
};

/**
 * SSL/TLS configuration
 */
struct SslSettings {
    bool enabled{false};
    std::string cert_file;
    std::string key_file;
    std::string chain_file;                 // CA bundle used for client verification
    std::string key_password;
    bool enable_tls_1_2{true};
    bool enable_tls_1_3{true};
    std::string cipher_list;
    std::string ciphersuites;
    bool enable_session_cache{true};
    std::size_t session_cache_size{20480};
    std::string verify_client{"none"};      // none, optional, required
};

/**
 * Logging configuration
 */
struct LogSettings {
    std::string level{"info"};
    std::string file;
    std::size_t max_file_size_mb{100};
    std::size_t max_files{5};
    bool enable_console{true};
    bool enable_colors{true};
    bool access_log{true};

    /**
     * @throws std::runtime_error on an unknown level
     */
    util::LogConfig to_log_config() const;
};

/**
 * Complete application configuration
 */
struct Config {
    ServerSettings server;
    SslSettings ssl;
    LogSettings logging;

    /**
     * Validate configuration and throw if invalid
     */
    void validate() const;
};

/**
 * Configuration manager - handles loading and precedence
 */
class ConfigManager {
public:
    ConfigManager() = default;

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * Parse command-line arguments and load configuration
     *
     * @return true if configuration loaded successfully, false if --help was requested
     * @throws std::runtime_error on configuration errors
     */
    bool load(int argc, char* argv[]);

    /**
     * Get the current configuration (thread-safe)
     */
    Config get_config() const;

    std::filesystem::path get_config_path() const;

    /**
     * Print help message to stdout
     */
    static void print_help(const char* program_name);

private:
    void load_from_file(const std::filesystem::path& path);
    void apply_environment_overrides();
    void apply_cli_overrides(int argc, char* argv[]);

    static std::optional<std::string> get_env(const std::string& name);

    mutable std::mutex config_mutex_;
    Config config_;
    std::filesystem::path config_path_;
};

// JSON serialization support
void to_json(nlohmann::json& j, const ServerSettings& s);
void from_json(const nlohmann::json& j, ServerSettings& s);
void to_json(nlohmann::json& j, const SslSettings& s);
void from_json(const nlohmann::json& j, SslSettings& s);
void to_json(nlohmann::json& j, const LogSettings& l);
void from_json(const nlohmann::json& j, LogSettings& l);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace portico::config

#endif // PORTICO_CONFIG_CONFIG_HPP
