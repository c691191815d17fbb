#pragma once

#include <string>

// A named upstream, parsed from "name=http://host:port".
struct BackendUrlInfo {
    std::string name;
    std::string url;
    std::string backend_host;
    int backend_port = 80;
    bool is_https = false;

    bool operator==(const BackendUrlInfo& other) const {
        return name == other.name && url == other.url;
    }
};
