#ifndef BACKENDRESPONSE_HPP
#define BACKENDRESPONSE_HPP

#include <string>

// What the facade caches per resource: a successful upstream reply.
struct BackendResponse {
    unsigned status = 200;
    std::string content_type;
    std::string body;
};

#endif // BACKENDRESPONSE_HPP
