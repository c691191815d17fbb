#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../config/AppConfig.hpp"

using namespace std;

// Backend name and upstream target extracted from /resource/<backend>/<path>.
struct ResourceTarget {
    string backend;
    string path;
};

class Utils {
public:
    // Converts a string to a LogLevel enum
    static LogUtils::LogLevel stringToLogLevel(const std::string& level) {
        if (level == "DEBUG") return LogUtils::LogLevel::DEBUG;
        if (level == "INFO") return LogUtils::LogLevel::INFO;
        if (level == "WARNING") return LogUtils::LogLevel::WARN;
        if (level == "CERROR") return LogUtils::LogLevel::CERROR;
        throw std::invalid_argument("Invalid log level: " + level);
    }

    // Helper to parse integer safely
    static optional<int> stringToInt(const std::string& str) {
        try {
            size_t pos;
            int val = std::stoi(str, &pos);
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
            // Not an integer
        } catch (const std::out_of_range&) {
            // Integer out of range
        }
        return std::nullopt;
    }

    static optional<int64_t> stringToInt64(const std::string& str) {
        try {
            size_t pos;
            long long val = std::stoll(str, &pos);
            if (pos == str.length()) {
                return static_cast<int64_t>(val);
            }
        } catch (const std::invalid_argument&) {
        } catch (const std::out_of_range&) {
        }
        return std::nullopt;
    }

    // Helper to trim whitespace from start and end of string
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    // Parses key=value command-line arguments
    static optional<map<string, string>> parseArguments(const vector<string>& args) {
        map<string, string> argMap;
        for (const string& arg : args) {
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != string::npos && delimiterPos > 0) {
                string key = arg.substr(0, delimiterPos);
                string value = arg.substr(delimiterPos + 1);
                argMap[key] = value;
            } else {
                cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << endl;
                return nullopt;
            }
        }
        return argMap;
    }

    // Applies one configuration setting. Returns false if key is not a known
    // setting. Invalid values are reported and leave the default in place;
    // an invalid log_level throws std::invalid_argument.
    static bool applySetting(AppConfig& config, const string& key, const string& value) {
        if (key == "cache_ttl") {
            if (auto val = stringToInt64(value)) {
                config.cache_ttl_in_millis = *val;
            } else {
                cerr << "Warning: Invalid integer for cache_ttl: " << value << endl;
            }
        } else if (key == "cache_max_evicted") {
            auto val = stringToInt(value);
            if (val && *val >= 0) {
                config.cache_max_evicted = static_cast<size_t>(*val);
            } else {
                cerr << "Warning: Invalid non-negative integer for cache_max_evicted: " << value << endl;
            }
        } else if (key == "cache_scan_interval") {
            if (auto val = stringToInt64(value)) {
                config.cache_scan_interval_in_millis = *val;
            } else {
                cerr << "Warning: Invalid integer for cache_scan_interval: " << value << endl;
            }
        } else if (key == "frontend_port") {
            auto val = stringToInt(value);
            if (val && *val > 0 && *val <= 65535) {
                config.frontend_port = *val;
            } else {
                cerr << "Warning: Invalid port for frontend_port: " << value << endl;
            }
        } else if (key == "num_io_threads") {
            auto val = stringToInt(value);
            if (val && *val > 0) {
                config.num_io_threads = static_cast<unsigned int>(*val);
            } else {
                cerr << "Warning: Invalid positive integer for num_io_threads: " << value << endl;
            }
        } else if (key == "max_response_queue_size") {
            auto val = stringToInt(value);
            if (val && *val > 0) {
                config.max_response_queue_size = static_cast<size_t>(*val);
            } else {
                cerr << "Warning: Invalid positive integer for max_response_queue_size: " << value << endl;
            }
        } else if (key == "log_level") {
            config.log_level = stringToLogLevel(value);
        } else if (key == "backend_timeout") {
            auto val = stringToInt(value);
            if (val && *val > 0) {
                // value provided in millis
                config.backend_timeout_in_millis = *val;
            } else {
                cerr << "Warning: Invalid positive integer for backend_timeout: " << value << endl;
            }
        } else if (key == "circuit_breaker_cool_off") {
            auto val = stringToInt(value);
            if (val && *val >= 0) {
                // value provided in millis
                config.circuit_breaker_cool_off_in_millis = *val;
            } else {
                cerr << "Warning: Invalid non-negative integer for circuit_breaker_cool_off: " << value << endl;
            }
        } else if (key == "metrics_batch_size") {
            auto val = stringToInt(value);
            if (val && *val >= 0) {
                config.metrics_batch_size = *val;
            } else {
                cerr << "Warning: Invalid non-negative integer for metrics_batch_size: " << value << endl;
            }
        } else if (key == "metrics_send_interval") {
            auto val = stringToInt(value);
            if (val && *val > 0) {
                config.metrics_send_interval_in_millis = *val;
            } else {
                cerr << "Warning: Invalid positive integer for metrics_send_interval: " << value << endl;
            }
        } else {
            return false;
        }
        return true;
    }

    static std::vector<std::string> defaultConfigPaths() {
        return {
            Constants::CONFIG_FILE_NAME,                        // Current directory
            std::string("../") + Constants::CONFIG_FILE_NAME,   // Parent directory
            std::string("/app/") + Constants::CONFIG_FILE_NAME, // Docker container path
            std::string("../../") + Constants::CONFIG_FILE_NAME // Development path
        };
    }

    // Reads the first config file found, then applies command-line arguments
    // on top. Arguments that are not settings and carry an http(s) URL
    // register a named backend.
    static AppConfig loadConfiguration(const map<string, string>& startupArguments,
                                       const std::vector<std::string>& config_paths = defaultConfigPaths()) {
        AppConfig config;

        bool config_found = false;
        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (!configFile.is_open()) {
                continue;
            }
            cout << "Reading configuration from " << config_path << "..." << endl;
            config_found = true;
            std::string line;
            while (getline(configFile, line)) {
                line = trim(line);
                if (line.empty() || line[0] == '#') { // Skip empty lines and comments
                    continue;
                }
                size_t delimiterPos = line.find('=');
                if (delimiterPos == string::npos || delimiterPos == 0) {
                    cerr << "Warning: Ignoring malformed config line: " << line << endl;
                    continue;
                }
                string key = trim(line.substr(0, delimiterPos));
                string value = trim(line.substr(delimiterPos + 1));
                if (!applySetting(config, key, value) && !addBackend(config, key, value)) {
                    cerr << "Warning: Unknown config key: " << key << endl;
                }
            }
            break;
        }

        if (!config_found) {
            cerr << "Warning: Configuration file not found in any standard location. Using defaults and command-line arguments." << endl;
        }

        for (const auto& [key, value] : startupArguments) {
            if (applySetting(config, key, value)) {
                continue;
            }
            if (!addBackend(config, key, value)) {
                cerr << "Warning: Ignoring unknown argument '" << key << "'" << endl;
            }
        }

        return config;
    }

    // Registers "name=http://host:port". Returns false if value is not an
    // http(s) URL or the name is not [A-Za-z0-9_-]+.
    static bool addBackend(AppConfig& config, const string& name, const string& url) {
        if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
            return false;
        }
        if (!isValidBackendName(name)) {
            cerr << "Warning: Invalid backend name '" << name << "'. Expected letters, digits, '_' or '-'." << endl;
            return false;
        }
        BackendUrlInfo urlInfo;
        urlInfo.name = toLower(name);
        urlInfo.url = url;
        if (!parseUrl(url, &urlInfo)) {
            cerr << "Error: Invalid backend URL format for '" << name << "': " << url << endl;
            return false;
        }
        config.backend_map[urlInfo.name] = std::move(urlInfo);
        return true;
    }

    static bool isValidBackendName(const std::string& name) {
        return !name.empty() && all_of(name.begin(), name.end(), [](unsigned char c) {
            return std::isalnum(c) || c == '_' || c == '-';
        });
    }

    static std::string toLower(std::string value) {
        transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });
        return value;
    }

    // Splits "/resource/<backend>/<path>" into its parts. The path keeps its
    // query string and defaults to "/". Returns nullopt if the target does
    // not start with the resource prefix or names no backend.
    static optional<ResourceTarget> parseResourceTarget(const std::string& target) {
        const std::string prefix = Constants::RESOURCE_PATH_PREFIX;
        if (target.rfind(prefix, 0) != 0) {
            return nullopt;
        }
        std::string rest = target.substr(prefix.size());
        size_t end = rest.find_first_of("/?");
        std::string backend = rest.substr(0, end);
        if (backend.empty()) {
            return nullopt;
        }

        ResourceTarget result;
        result.backend = toLower(backend);
        if (end == string::npos) {
            result.path = "/";
        } else if (rest[end] == '?') {
            result.path = "/" + rest.substr(end);
        } else {
            result.path = rest.substr(end);
        }
        return result;
    }

    static bool parseUrl(const std::string& url, BackendUrlInfo* urlInfo) {
        int port;
        std::smatch match;

        if (std::regex_search(url, match, Constants::url_regex)) {
            bool is_https = (match[1].str() == "https");

            if (match[3].matched) { // Port is specified
                try {
                    port = std::stoi(match[3].str());
                    if (port <= 0 || port > 65535) {
                        std::cerr << "Warning: Invalid port number " << port << " in URL " << url << std::endl;
                        return false;
                    }
                } catch (const std::exception& e) {
                    std::cerr << "Error parsing port in URL " << url << ": " << e.what() << std::endl;
                    return false;
                }
            } else {
                port = is_https ? 443 : 80;
            }
            urlInfo->backend_host = match[2].str();
            urlInfo->backend_port = port;
            urlInfo->is_https = is_https;
            return true;
        }
        std::cerr << "Error: URL format does not match expected pattern: " << url << std::endl;
        return false;
    }
};

#endif // UTILS_HPP
