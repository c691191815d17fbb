#ifndef BEAST_HTTP_SERVER_HPP
#define BEAST_HTTP_SERVER_HPP

#include <boost/beast/core.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <memory>
#include <mutex>
#include <unordered_set>

#include "../interfaces/ILogger.hpp"
#include "../config/AppConfig.hpp"
#include "HttpServerSession.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class CachingFacade;

// Accepts connections on the frontend port and hands each one to an
// HttpServerSession. Tracks live sessions so stop() can close them.
class BeastHttpServer : public std::enable_shared_from_this<BeastHttpServer> {
public:
    // Opens, binds and listens right away. Throws std::runtime_error if the
    // endpoint cannot be used.
    BeastHttpServer(net::io_context& ioc,
                    tcp::endpoint endpoint,
                    std::shared_ptr<CachingFacade> facade,
                    std::shared_ptr<ILogger> logger,
                    const AppConfig& config);

    void run();
    // Stops accepting and closes every live session. Requests still waiting
    // on a backend are answered into closed sockets.
    void stop();

    tcp::endpoint localEndpoint() const;

private:
    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    std::shared_ptr<CachingFacade> facade_;
    std::shared_ptr<ILogger> logger_;
    const AppConfig& config_;
    std::mutex sessions_mutex_;
    std::unordered_set<std::shared_ptr<HttpServerSession>> active_sessions_;

    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);
    void on_session_finish(std::shared_ptr<HttpServerSession> session);
};

#endif // BEAST_HTTP_SERVER_HPP
