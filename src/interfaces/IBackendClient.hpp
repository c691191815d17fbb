#ifndef IBACKENDCLIENT_HPP
#define IBACKENDCLIENT_HPP

#include <functional>
#include <string>

#include <boost/beast/core/error.hpp>
#include <boost/beast/http.hpp>

#include "../models/BackendUrlInfo.hpp"

// Issues GET requests against a configured backend. on_complete is called
// exactly once, possibly from an I/O thread.
class IBackendClient {
public:
    using Response = boost::beast::http::response<boost::beast::http::string_body>;
    using Callback = std::function<void(Response, boost::beast::error_code)>;

    virtual ~IBackendClient() = default;

    virtual void get(const BackendUrlInfo& backend, const std::string& target, Callback on_complete) = 0;

    // Aborts every request still in flight; their callbacks fire with an error.
    virtual void cancelAll() = 0;
};

#endif // IBACKENDCLIENT_HPP
