#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>

namespace automflow {
namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

class EventHub;
class RequestHandler;

/**
 * Session HTTP - gère une connexion client
 *
 * Plain requests are answered one at a time (keep-alive supported).
 * GET /api/events switches the connection to a Server-Sent Events stream fed
 * by the EventHub until the client disconnects.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, RequestHandler& handler, EventHub& hub);
    ~HttpSession();

    void run();

    /// Frames queued beyond this limit drop the SSE client
    static constexpr size_t kMaxPendingFrames = 1024;
    static constexpr int kHeartbeatSeconds = 15;

private:
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes_transferred);
    void sendResponse(http::response<http::string_body> response);
    void onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred);
    void doClose();

    // Traitement des requêtes
    http::response<http::string_body> handleRequest(
        http::request<http::string_body>&& req);

    // SSE event stream
    void startEventStream();
    void queueSseFrame(std::string frame);
    void writeNextSseFrame();
    void onSseWrite(beast::error_code ec, std::size_t bytes_transferred);
    void scheduleHeartbeat();
    void watchSseClient();
    void closeSseConnection();

    beast::tcp_stream m_stream;
    beast::flat_buffer m_buffer;
    std::optional<http::request_parser<http::string_body>> m_parser;
    RequestHandler& m_handler;
    EventHub& m_hub;

    bool m_sseMode = false;  // True when handling SSE stream
    bool m_sseWriting = false;
    std::optional<uint64_t> m_subscription;
    std::deque<std::string> m_sseQueue;
    net::steady_timer m_heartbeat;
    char m_probe[64];
};

} // namespace server
} // namespace automflow
