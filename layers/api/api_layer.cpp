#include "api_layer.h"

#include <boost/beast/version.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>
#include <vector>

namespace api {

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;
using tcp = boost::asio::ip::tcp;

RemoteController::RemoteController(application::ApplicationCore& appCore, std::chrono::milliseconds maxAllocateWait)
    : appCore_(appCore), maxAllocateWait_(maxAllocateWait) {}

void RemoteController::setCloseHandler(std::function<void()> handler) {
    closeHandler_ = std::move(handler);
}

protocol::Response RemoteController::dispatch(const protocol::Request& request, const application::CancelToken* cancel) {
    spdlog::debug("Dispatching {}", protocol::operationToString(protocol::operationOf(request)));
    return std::visit([this, cancel](const auto& typed) { return handle(typed, cancel); }, request);
}

protocol::Response RemoteController::handle(const protocol::GetLastCommandResultRequest& request,
                                            const application::CancelToken*) {
    return protocol::GetLastCommandResultResponse{appCore_.ledger().lastResult(request.serial)};
}

protocol::Response RemoteController::handle(const protocol::AllocateDeviceRequest& request,
                                            const application::CancelToken* cancel) {
    const auto timeout = std::min(request.timeout, maxAllocateWait_);

    protocol::AllocateDeviceResponse response;
    const auto record = appCore_.pool().allocate(request.criteria, timeout, cancel);
    if (record) {
        response.device = protocol::summarize(*record);
    }
    return response;
}

protocol::Response RemoteController::handle(const protocol::FreeDeviceRequest& request,
                                            const application::CancelToken*) {
    const auto status = appCore_.pool().free(request.serial, request.freeDeviceState);
    return protocol::PoolStatusResponse{protocol::OperationType::FreeDevice, status};
}

protocol::Response RemoteController::handle(const protocol::ListDevicesRequest&, const application::CancelToken*) {
    protocol::ListDevicesResponse response;
    for (const auto& record : appCore_.pool().snapshot()) {
        response.devices.push_back(protocol::summarize(record));
    }
    return response;
}

protocol::Response RemoteController::handle(const protocol::MarkUnavailableRequest& request,
                                            const application::CancelToken*) {
    const auto status = appCore_.pool().markUnavailable(request.serial, request.reason);
    return protocol::PoolStatusResponse{protocol::OperationType::MarkUnavailable, status};
}

protocol::Response RemoteController::handle(const protocol::MarkIgnoredRequest& request,
                                            const application::CancelToken*) {
    const auto status = appCore_.pool().markIgnored(request.serial);
    return protocol::PoolStatusResponse{protocol::OperationType::MarkIgnored, status};
}

protocol::Response RemoteController::handle(const protocol::MarkAvailableRequest& request,
                                            const application::CancelToken*) {
    const auto status = appCore_.pool().markAvailable(request.serial);
    return protocol::PoolStatusResponse{protocol::OperationType::MarkAvailable, status};
}

protocol::Response RemoteController::handle(const protocol::IncludeDeviceRequest& request,
                                            const application::CancelToken*) {
    const auto status = appCore_.pool().include(request.serial);
    return protocol::PoolStatusResponse{protocol::OperationType::IncludeDevice, status};
}

protocol::Response RemoteController::handle(const protocol::CloseRequest&, const application::CancelToken*) {
    if (!closeHandler_) {
        return protocol::ErrorResponse{"Close is not supported on this endpoint"};
    }
    closeHandler_();
    return protocol::CloseResponse{};
}

RemoteServer::RemoteServer(application::ApplicationCore& appCore, ServerOptions options)
    : appCore_(appCore), options_(std::move(options)), controller_(appCore, options_.maxAllocateWait) {
    controller_.setCloseHandler([this]() { stopAccepting(); });
}

RemoteServer::~RemoteServer() {
    stop();
}

void RemoteServer::start() {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (started_) {
            return;
        }
    }

    acceptor_ = std::make_unique<tcp::acceptor>(
        ioContext_, tcp::endpoint{boost::asio::ip::make_address(options_.bindAddress), options_.port});
    boundPort_ = acceptor_->local_endpoint().port();

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        started_ = true;
        accepting_ = true;
    }

    doAccept();
    acceptThread_ = std::thread([this]() { ioContext_.run(); });
    spdlog::info("Remote manager listening on {}:{}", options_.bindAddress, boundPort_);
}

void RemoteServer::doAccept() {
    acceptor_->async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
        if (ec) {
            if (ec != boost::asio::error::operation_aborted) {
                spdlog::warn("Accept failed: {}", ec.message());
            }
            if (isAccepting() && acceptor_->is_open()) {
                doAccept();
            }
            return;
        }

        if (!isAccepting()) {
            boost::system::error_code ignored;
            socket.close(ignored);
            return;
        }

        reapFinished();

        auto connection = std::make_shared<Connection>();
        connection->channel =
            std::make_unique<transport::LineChannel>(std::move(socket), protocol::ProtocolCodec::kMaxLineLength);
        {
            std::lock_guard<std::mutex> lock(connectionsMutex_);
            connection->id = nextConnectionId_++;
            connection->worker = std::thread([this, connection]() {
                serveConnection(*connection);
                connection->finished = true;
            });
            connections_.push_back(connection);
        }

        doAccept();
    });
}

void RemoteServer::serveConnection(Connection& connection) {
    auto& channel = *connection.channel;
    spdlog::info("Connection {} opened from {}", connection.id, channel.peer());

    std::string line;
    while (true) {
        boost::system::error_code ec;
        if (!channel.readLine(line, ec)) {
            if (ec == boost::asio::error::not_found) {
                spdlog::warn("Connection {}: message exceeds {} bytes", connection.id,
                             protocol::ProtocolCodec::kMaxLineLength);
                if (!channel.writeLine(codec_.encodeResponse(protocol::ErrorResponse{"Message too long"}), ec)) {
                    spdlog::debug("Connection {}: could not report oversized message: {}", connection.id, ec.message());
                }
            } else if (ec != boost::asio::error::eof) {
                spdlog::debug("Connection {}: read ended: {}", connection.id, ec.message());
            }
            break;
        }
        if (line.empty()) {
            continue;
        }

        protocol::Request request;
        std::string error;
        if (!codec_.decodeRequest(line, request, error)) {
            spdlog::warn("Connection {}: rejected message: {}", connection.id, error);
            if (!channel.writeLine(codec_.encodeResponse(protocol::ErrorResponse{error}), ec)) {
                spdlog::debug("Connection {}: could not report rejection: {}", connection.id, ec.message());
            }
            break;
        }

        protocol::Response response;
        try {
            response = controller_.dispatch(request, &connection.cancel);
        } catch (const std::exception& e) {
            spdlog::error("Connection {}: {} failed: {}", connection.id,
                          protocol::operationToString(protocol::operationOf(request)), e.what());
            response = protocol::ErrorResponse{std::string("Internal error: ") + e.what()};
        }

        if (!channel.writeLine(codec_.encodeResponse(response), ec)) {
            spdlog::warn("Connection {}: write failed: {}", connection.id, ec.message());
            break;
        }
        if (std::holds_alternative<protocol::CloseRequest>(request)) {
            break;
        }
    }

    channel.close();
    spdlog::info("Connection {} closed", connection.id);
}

void RemoteServer::stopAccepting() {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (!accepting_) {
            return;
        }
        accepting_ = false;
    }
    spdlog::info("Remote manager stopped accepting connections");

    boost::asio::post(ioContext_, [this]() {
        boost::system::error_code ec;
        acceptor_->close(ec);
    });
    stateCv_.notify_all();
}

void RemoteServer::wait() {
    {
        std::unique_lock<std::mutex> lock(stateMutex_);
        stateCv_.wait(lock, [this]() { return !accepting_; });
    }
    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    joinAll();
}

void RemoteServer::stop() {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (!started_) {
            return;
        }
    }
    stopAccepting();
    // No connection can be added once the accept thread is gone.
    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        for (auto& connection : connections_) {
            appCore_.pool().cancel(connection->cancel);
            connection->channel->shutdown();
        }
    }
    joinAll();
}

void RemoteServer::reapFinished() {
    std::vector<std::shared_ptr<Connection>> finished;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            if ((*it)->finished) {
                finished.push_back(*it);
                it = connections_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& connection : finished) {
        if (connection->worker.joinable()) {
            connection->worker.join();
        }
    }
}

void RemoteServer::joinAll() {
    std::list<std::shared_ptr<Connection>> remaining;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        remaining.swap(connections_);
    }
    for (auto& connection : remaining) {
        if (connection->worker.joinable()) {
            connection->worker.join();
        }
    }
}

std::uint16_t RemoteServer::port() const {
    return boundPort_;
}

bool RemoteServer::isAccepting() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return accepting_;
}

std::size_t RemoteServer::openConnections() const {
    std::lock_guard<std::mutex> lock(connectionsMutex_);
    return static_cast<std::size_t>(std::count_if(connections_.begin(), connections_.end(),
                                                  [](const auto& connection) { return !connection->finished; }));
}

HttpJsonServer::HttpJsonServer(application::ApplicationCore& appCore, std::string bindAddress, std::uint16_t port,
                               std::chrono::milliseconds maxAllocateWait, std::chrono::milliseconds sessionTimeout)
    : appCore_(appCore), bindAddress_(std::move(bindAddress)), port_(port), sessionTimeout_(sessionTimeout),
      controller_(appCore, maxAllocateWait) {}

HttpJsonServer::~HttpJsonServer() {
    stop();
}

void HttpJsonServer::start() {
    if (running_) {
        return;
    }

    acceptor_ = std::make_unique<tcp::acceptor>(ioContext_, tcp::endpoint{boost::asio::ip::make_address(bindAddress_), port_});
    boundPort_ = acceptor_->local_endpoint().port();
    running_ = true;

    serverThread_ = std::thread([this]() { acceptLoop(); });
    spdlog::info("HTTP gateway listening on {}:{}", bindAddress_, boundPort_);
}

void HttpJsonServer::stop() {
    if (!running_) {
        return;
    }

    running_ = false;
    appCore_.pool().cancel(cancel_);

    // Abort a session that is waiting on its client.
    boost::asio::post(ioContext_, [this]() {
        if (activeStream_) {
            activeStream_->cancel();
        }
    });

    // A blocking accept is not interrupted by close on every platform, so poke it with a connection.
    boost::system::error_code ec;
    {
        boost::asio::io_context wakeContext;
        tcp::socket wake(wakeContext);
        wake.connect({acceptor_->local_endpoint(ec).address(), boundPort_}, ec);
    }

    if (serverThread_.joinable()) {
        serverThread_.join();
    }
    acceptor_->close(ec);
}

void HttpJsonServer::acceptLoop() {
    while (running_) {
        boost::system::error_code ec;
        tcp::socket socket(ioContext_);
        acceptor_->accept(socket, ec);
        if (ec) {
            continue;
        }
        if (!running_) {
            break;
        }
        handleSession(std::move(socket));
    }
}

// Drives the pending async operation of the active session to completion.
void HttpJsonServer::runSession() {
    ioContext_.restart();
    ioContext_.run();
}

void HttpJsonServer::handleSession(tcp::socket socket) {
    beast::tcp_stream stream(std::move(socket));
    beast::flat_buffer buffer;
    http::request<http::string_body> req;
    boost::system::error_code ec;

    activeStream_ = &stream;
    stream.expires_after(sessionTimeout_);
    http::async_read(stream, buffer, req, [&ec](const boost::system::error_code& readEc, std::size_t) {
        ec = readEc;
    });
    runSession();
    if (ec) {
        activeStream_ = nullptr;
        spdlog::debug("HTTP read failed: {}", ec.message());
        return;
    }

    http::response<http::string_body> res;
    res.version(req.version());
    res.keep_alive(false);
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.set(http::field::content_type, "application/json");

    auto reply = [&](http::status status, const protocol::Response& response) {
        res.result(status);
        res.body() = json::serialize(codec_.responseToJson(response));
        res.prepare_payload();
        stream.expires_after(sessionTimeout_);
        http::async_write(stream, res, [&ec](const boost::system::error_code& writeEc, std::size_t) {
            ec = writeEc;
        });
        runSession();
        activeStream_ = nullptr;
        if (ec) {
            spdlog::debug("HTTP write failed: {}", ec.message());
        }
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    };

    if (req.method() != http::verb::post) {
        reply(http::status::method_not_allowed, protocol::ErrorResponse{"Only POST is supported"});
        return;
    }

    json::value payload;
    payload = json::parse(req.body(), ec);
    if (ec) {
        reply(http::status::bad_request, protocol::ErrorResponse{"Malformed JSON: " + ec.message()});
        return;
    }

    protocol::Request request;
    std::string error;
    if (!codec_.jsonToRequest(payload, request, error)) {
        reply(http::status::bad_request, protocol::ErrorResponse{error});
        return;
    }

    protocol::Response response;
    try {
        response = controller_.dispatch(request, &cancel_);
    } catch (const std::exception& e) {
        spdlog::error("HTTP {} failed: {}", protocol::operationToString(protocol::operationOf(request)), e.what());
        reply(http::status::internal_server_error, protocol::ErrorResponse{std::string("Internal error: ") + e.what()});
        return;
    }

    const bool rejected = std::holds_alternative<protocol::ErrorResponse>(response);
    reply(rejected ? http::status::bad_request : http::status::ok, response);
}

} // namespace api
