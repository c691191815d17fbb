#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <regex>
#include <sstream>
#include <string>

#include "../models/BackendUrlInfo.hpp"

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };

    static std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static std::string INFO_LOG_PREFIX = "[Info] ";
    static std::string WARN_LOG_PREFIX = "[Warning] ";
    static std::string CERROR_LOG_PREFIX = "[Error] ";
    static std::string SETUP_LOG_PREFIX = "[Setup] ";
}

namespace MetricsDefinitions {
    static std::string CODE_EXCEPTION = "rescache.code_exception";

    static std::string REQUEST_RECEIVED = "rescache.request";

    static std::string BACKEND_FETCH = "rescache.backend_fetch";

    static std::string BACKEND_ERROR = "rescache.backend_error";

    static std::string CIRCUIT_BREAKER_TRIPPED = "rescache.circuit_breaker_tripped";
}

namespace Constants {
    static constexpr auto CONFIG_FILE_NAME = "rescache.config";
    static constexpr auto RESOURCE_PATH_PREFIX = "/resource/";
    static constexpr auto STATUS_PATH = "/status";
    static const std::regex url_regex(R"(^(https?):\/\/([^:\/?#]+)(?::(\d+))?(?:[\/?#]|$))");
};

// --- Configuration Struct ---
class AppConfig {
public:
    std::map<std::string, BackendUrlInfo> backend_map; // Key: backend name

    // Cache configuration (milliseconds)
    int64_t cache_ttl_in_millis;
    std::size_t cache_max_evicted;
    int64_t cache_scan_interval_in_millis;

    // Server configuration
    int frontend_port;
    unsigned int num_io_threads;
    std::size_t max_response_queue_size;

    // Logging Level
    LogUtils::LogLevel log_level;

    // Backend servers
    int backend_timeout_in_millis;
    int circuit_breaker_cool_off_in_millis;

    // Metrics
    int metrics_batch_size;
    int metrics_send_interval_in_millis;

    AppConfig() {
        cache_ttl_in_millis = 60 * 1000;
        cache_max_evicted = 2;
        cache_scan_interval_in_millis = 60 * 1000;

        frontend_port = 9000;
        num_io_threads = 2;
        max_response_queue_size = 16;

        log_level = LogUtils::LogLevel::CERROR; // Default log level

        backend_timeout_in_millis = 2000;
        circuit_breaker_cool_off_in_millis = 1000;

        metrics_batch_size = 100;
        metrics_send_interval_in_millis = 1000;
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "frontend_port: " << frontend_port << std::endl
            << "num_io_threads: " << num_io_threads << std::endl
            << "max_response_queue_size: " << max_response_queue_size << std::endl
            << "// --- Cache Configuration --- //" << std::endl
            << "cache_ttl: " << cache_ttl_in_millis << std::endl
            << "cache_max_evicted: " << cache_max_evicted << std::endl
            << "cache_scan_interval: " << cache_scan_interval_in_millis << std::endl
            << "// --- Logging --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl
            << "--- Backend Servers --- " << std::endl
            << "backend_timeout: " << backend_timeout_in_millis << std::endl
            << "circuit_breaker_cool_off: " << circuit_breaker_cool_off_in_millis << std::endl
            << "// --- Metrics --- //" << std::endl
            << "metrics_batch_size: " << metrics_batch_size << std::endl
            << "metrics_send_interval: " << metrics_send_interval_in_millis << std::endl;

        ss << "--- Backend name : endpoint URL map ---" << std::endl;
        for (const auto& [name, backend] : backend_map) {
            ss << name << " : " << backend.url << std::endl;
        }
        ss << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // APPCONFIG_HPP
