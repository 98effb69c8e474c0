#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <memory>
#include <string>

namespace automflow {
namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

class EventHub;
class RequestHandler;
class HttpSession;

/**
 * Serveur HTTP basé sur Boost.Beast
 *
 * Accepts connections and hands each one to an HttpSession sharing the same
 * RequestHandler and EventHub.
 */
class HttpServer {
public:
    HttpServer(net::io_context& ioc, const std::string& address, unsigned short port,
               RequestHandler& handler, EventHub& hub);

    void run();
    void stop();

    unsigned short port() const { return m_acceptor.local_endpoint().port(); }

private:
    void doAccept();

    net::io_context& m_ioc;
    tcp::acceptor m_acceptor;
    RequestHandler& m_handler;
    EventHub& m_hub;
    bool m_running;
};

} // namespace server
} // namespace automflow
