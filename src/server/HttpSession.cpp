#include "server/HttpSession.hpp"
#include "server/EventHub.hpp"
#include "server/Logger.hpp"
#include "server/RequestHandler.hpp"

namespace automflow {
namespace server {

namespace {

void setCorsHeaders(http::response<http::string_body>& res) {
    res.set(http::field::server, "AutomFlowServer/1.0");
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, POST, DELETE, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type");
}

// Création d'une réponse JSON
http::response<http::string_body> makeJsonResponse(
    unsigned status,
    const json& body,
    unsigned version,
    bool keepAlive,
    uint64_t requestId)
{
    http::response<http::string_body> res{static_cast<http::status>(status), version};
    setCorsHeaders(res);
    res.set(http::field::content_type, "application/json");
    res.set(http::field::cache_control, "no-store");
    res.keep_alive(keepAlive);
    res.body() = body.dump();
    res.prepare_payload();

    // Log response with request ID correlation
    Logger::instance().logResponse(requestId, static_cast<int>(status), res.body(), res.body().size());

    return res;
}

/**
 * "/api/batch/abc/stop" with prefix "/api/batch/" -> {"abc", "/stop"}
 */
std::pair<std::string, std::string> splitIdFromPath(const std::string& path, const std::string& prefix) {
    std::string remaining = path.substr(prefix.length());
    size_t slashPos = remaining.find('/');
    if (slashPos == std::string::npos) {
        return {remaining, ""};
    }
    return {remaining.substr(0, slashPos), remaining.substr(slashPos)};
}

} // anonymous namespace

HttpSession::HttpSession(tcp::socket socket, RequestHandler& handler, EventHub& hub)
    : m_stream(std::move(socket))
    , m_handler(handler)
    , m_hub(hub)
    , m_heartbeat(m_stream.get_executor())
{
}

HttpSession::~HttpSession() {
    if (m_subscription) {
        m_hub.unsubscribe(*m_subscription);
    }
}

void HttpSession::run() {
    net::dispatch(
        m_stream.get_executor(),
        beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
}

void HttpSession::doRead() {
    m_parser.emplace();
    m_parser->body_limit(50 * 1024 * 1024); // 50 MB
    m_stream.expires_after(std::chrono::seconds(30));

    http::async_read(
        m_stream,
        m_buffer,
        *m_parser,
        beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec == http::error::end_of_stream) {
        return doClose();
    }

    if (ec) {
        if (ec != beast::error::timeout) {
            LOG_ERROR("Read error: " + ec.message());
        }
        return;
    }

    auto response = handleRequest(m_parser->release());

    // In SSE mode the connection belongs to the event stream
    if (!m_sseMode) {
        sendResponse(std::move(response));
    }
}

void HttpSession::sendResponse(http::response<http::string_body> response) {
    auto sp = std::make_shared<http::response<http::string_body>>(std::move(response));
    bool needEof = sp->need_eof();

    http::async_write(
        m_stream,
        *sp,
        [self = shared_from_this(), sp, needEof](beast::error_code ec, std::size_t bytes) {
            self->onWrite(needEof, ec, bytes);
        });
}

void HttpSession::onWrite(bool close, beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        LOG_ERROR("Write error: " + ec.message());
        return;
    }

    if (close) {
        return doClose();
    }

    doRead();
}

void HttpSession::doClose() {
    beast::error_code ec;
    m_stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

http::response<http::string_body> HttpSession::handleRequest(
    http::request<http::string_body>&& req)
{
    auto& logger = Logger::instance();
    std::string target(req.target());
    std::string method(req.method_string());
    const unsigned version = req.version();
    const bool keepAlive = req.keep_alive();

    // Log request and get request ID for correlation
    uint64_t requestId = logger.logRequest(method, target, req.body());

    auto respond = [&](const RouteResult& result) {
        return makeJsonResponse(result.first, result.second, version, keepAlive, requestId);
    };

    // CORS preflight
    if (req.method() == http::verb::options) {
        http::response<http::string_body> res{http::status::no_content, version};
        setCorsHeaders(res);
        res.keep_alive(keepAlive);
        res.prepare_payload();
        logger.logResponse(requestId, 204, "", 0);
        return res;
    }

    QueryParams query;
    const std::string path = RequestHandler::splitTarget(target, query);
    const bool isGet = req.method() == http::verb::get;
    const bool isPost = req.method() == http::verb::post;

    // Body of POST routes, an empty body reads as {}
    json body = json::object();
    if (isPost && !req.body().empty()) {
        try {
            body = json::parse(req.body());
        } catch (const json::parse_error& e) {
            return respond(RequestHandler::error(400, "Invalid JSON: " + std::string(e.what())));
        }
    }

    try {
        // GET /api/health
        if (isGet && path == "/api/health") {
            return respond(m_handler.handleHealth());
        }

        // GET /api/nodes - List registered node types
        if (isGet && path == "/api/nodes") {
            return respond(m_handler.handleListNodes());
        }

        // GET /api/events - SSE stream of every engine event
        if (isGet && path == "/api/events") {
            logger.logResponse(requestId, 200, "text/event-stream", 0);
            startEventStream();
            // Placeholder, the stream writes its own headers
            return http::response<http::string_body>{http::status::ok, version};
        }

        // ============================================================
        // Single run
        // ============================================================

        // POST /api/execute
        if (isPost && path == "/api/execute") {
            return respond(m_handler.handleExecute(body));
        }

        // GET /api/execution/status - most recent execution
        if (isGet && path == "/api/execution/status") {
            return respond(m_handler.handleLatestExecutionStatus());
        }

        // GET /api/executions/active
        if (isGet && path == "/api/executions/active") {
            return respond(m_handler.handleActiveExecutions());
        }

        // Routes with :id parameter
        const std::string executionPrefix = "/api/execution/";
        if (path.rfind(executionPrefix, 0) == 0 && path.length() > executionPrefix.length()) {
            auto [executionId, subPath] = splitIdFromPath(path, executionPrefix);

            // GET /api/execution/:id/status
            if (isGet && subPath == "/status") {
                return respond(m_handler.handleExecutionStatus(executionId));
            }

            // POST /api/execution/:id/stop
            if (isPost && subPath == "/stop") {
                return respond(m_handler.handleStopExecution(executionId));
            }

            // POST /api/execution/:id/pause-control
            if (isPost && subPath == "/pause-control") {
                return respond(m_handler.handlePauseControl(executionId, body));
            }
        }

        // ============================================================
        // Batches
        // ============================================================

        // POST /api/batch/execute
        if (isPost && path == "/api/batch/execute") {
            return respond(m_handler.handleBatchExecute(body));
        }

        // POST /api/batches/stop-all
        if (isPost && path == "/api/batches/stop-all") {
            return respond(m_handler.handleStopAll());
        }

        // GET /api/batches?status=&limit=&offset=
        if (isGet && path == "/api/batches") {
            return respond(m_handler.handleListBatches(query));
        }

        const std::string batchPrefix = "/api/batch/";
        if (path.rfind(batchPrefix, 0) == 0 && path.length() > batchPrefix.length()) {
            auto [batchId, subPath] = splitIdFromPath(path, batchPrefix);

            // GET /api/batch/:id
            if (isGet && subPath.empty()) {
                return respond(m_handler.handleBatchStatus(batchId));
            }

            // GET /api/batch/:id/executions
            if (isGet && subPath == "/executions") {
                return respond(m_handler.handleBatchExecutions(batchId));
            }

            // POST /api/batch/:id/stop
            if (isPost && subPath == "/stop") {
                return respond(m_handler.handleStopBatch(batchId));
            }
        }

        return respond(RequestHandler::error(404, "Not found: " + method + " " + path));

    } catch (const std::invalid_argument& e) {
        return respond(RequestHandler::error(400, e.what()));
    } catch (const std::exception& e) {
        LOG_ERROR("Request failed: " + method + " " + path + ": " + e.what());
        return respond(RequestHandler::error(500, e.what()));
    }
}

// ============================================================
// SSE event stream
// ============================================================

void HttpSession::startEventStream() {
    m_sseMode = true;

    // Disable timeout for streaming
    m_stream.expires_never();

    queueSseFrame(
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/event-stream\r\n"
        "Cache-Control: no-cache\r\n"
        "Connection: keep-alive\r\n"
        "Access-Control-Allow-Origin: *\r\n"
        "\r\n");
    queueSseFrame(EventHub::formatFrame("connected", json{{"subscribers", m_hub.subscriberCount() + 1}}.dump()));

    // The hub calls from engine threads: hop onto this session's strand.
    // Only a weak reference is held, the hub never keeps a session alive.
    std::weak_ptr<HttpSession> weak = shared_from_this();
    auto executor = m_stream.get_executor();
    m_subscription = m_hub.subscribe([weak, executor](const std::string& frame) {
        net::post(executor, [weak, frame]() {
            if (auto self = weak.lock()) {
                self->queueSseFrame(frame);
            }
        });
    });

    LOG_INFO("SSE client subscribed (" + std::to_string(m_hub.subscriberCount()) + " active)");
    watchSseClient();
    scheduleHeartbeat();
}

void HttpSession::queueSseFrame(std::string frame) {
    if (!m_sseMode) return;

    if (m_sseQueue.size() >= kMaxPendingFrames) {
        LOG_WARN("SSE client too slow, " + std::to_string(m_sseQueue.size()) + " frames pending: disconnecting");
        closeSseConnection();
        return;
    }

    m_sseQueue.push_back(std::move(frame));
    if (!m_sseWriting) {
        writeNextSseFrame();
    }
}

void HttpSession::writeNextSseFrame() {
    m_sseWriting = true;
    net::async_write(
        m_stream,
        net::buffer(m_sseQueue.front()),
        beast::bind_front_handler(&HttpSession::onSseWrite, shared_from_this()));
}

void HttpSession::onSseWrite(beast::error_code ec, std::size_t /*bytes_transferred*/) {
    m_sseWriting = false;
    if (!m_sseMode) return;

    if (ec) {
        LOG_DEBUG("SSE event write error: " + ec.message());
        closeSseConnection();
        return;
    }

    m_sseQueue.pop_front();
    if (!m_sseQueue.empty()) {
        writeNextSseFrame();
    }
}

void HttpSession::scheduleHeartbeat() {
    m_heartbeat.expires_after(std::chrono::seconds(kHeartbeatSeconds));
    m_heartbeat.async_wait([self = shared_from_this()](beast::error_code ec) {
        if (ec || !self->m_sseMode) return;
        self->queueSseFrame(": keepalive\n\n");
        self->scheduleHeartbeat();
    });
}

void HttpSession::watchSseClient() {
    // Clients never send on an event stream: any completion means hang-up
    m_stream.socket().async_read_some(
        net::buffer(m_probe),
        [self = shared_from_this()](beast::error_code ec, std::size_t /*bytes*/) {
            if (!self->m_sseMode) return;
            if (ec) {
                self->closeSseConnection();
                return;
            }
            self->watchSseClient();
        });
}

void HttpSession::closeSseConnection() {
    if (!m_sseMode) return;
    m_sseMode = false;

    if (m_subscription) {
        m_hub.unsubscribe(*m_subscription);
        m_subscription.reset();
    }
    m_heartbeat.cancel();
    LOG_INFO("SSE client disconnected");

    beast::error_code ec;
    m_stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    m_stream.socket().close(ec);
}

} // namespace server
} // namespace automflow
