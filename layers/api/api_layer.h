#pragma once

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "layers/application/application_layer.h"
#include "layers/protocol/protocol_layer.h"
#include "layers/transport/transport_layer.h"

namespace api {

struct ServerOptions {
    std::string bindAddress = "127.0.0.1";
    std::uint16_t port = 30103;
    // Upper bound for remote allocation waits.
    std::chrono::milliseconds maxAllocateWait{30000};
};

class RemoteController {
public:
    RemoteController(application::ApplicationCore& appCore, std::chrono::milliseconds maxAllocateWait);

    // Runs one operation against the pool or ledger. Each request type has exactly one handle() overload.
    protocol::Response dispatch(const protocol::Request& request, const application::CancelToken* cancel = nullptr);

    // Invoked for Close. Without a handler Close is answered with an Error response.
    void setCloseHandler(std::function<void()> handler);

private:
    protocol::Response handle(const protocol::GetLastCommandResultRequest& request, const application::CancelToken* cancel);
    protocol::Response handle(const protocol::AllocateDeviceRequest& request, const application::CancelToken* cancel);
    protocol::Response handle(const protocol::FreeDeviceRequest& request, const application::CancelToken* cancel);
    protocol::Response handle(const protocol::ListDevicesRequest& request, const application::CancelToken* cancel);
    protocol::Response handle(const protocol::MarkUnavailableRequest& request, const application::CancelToken* cancel);
    protocol::Response handle(const protocol::MarkIgnoredRequest& request, const application::CancelToken* cancel);
    protocol::Response handle(const protocol::MarkAvailableRequest& request, const application::CancelToken* cancel);
    protocol::Response handle(const protocol::IncludeDeviceRequest& request, const application::CancelToken* cancel);
    protocol::Response handle(const protocol::CloseRequest& request, const application::CancelToken* cancel);

    application::ApplicationCore& appCore_;
    std::chrono::milliseconds maxAllocateWait_;
    std::function<void()> closeHandler_;
};

// Line-framed control socket. One worker thread per connection.
class RemoteServer {
public:
    RemoteServer(application::ApplicationCore& appCore, ServerOptions options);
    ~RemoteServer();

    RemoteServer(const RemoteServer&) = delete;
    RemoteServer& operator=(const RemoteServer&) = delete;

    // Binds and starts accepting. Throws boost::system::system_error when the address is unusable.
    void start();
    // Stops accepting, cancels pending allocations, drops open connections and joins every worker.
    void stop();
    // Blocks until a Close operation (or stop) ends accepting, then until open connections finish.
    void wait();

    std::uint16_t port() const;
    bool isAccepting() const;
    std::size_t openConnections() const;

private:
    struct Connection {
        std::uint64_t id = 0;
        std::unique_ptr<transport::LineChannel> channel;
        application::CancelToken cancel;
        std::thread worker;
        std::atomic<bool> finished{false};
    };

    void doAccept();
    void stopAccepting();
    void serveConnection(Connection& connection);
    void reapFinished();
    void joinAll();

    application::ApplicationCore& appCore_;
    ServerOptions options_;
    RemoteController controller_;
    protocol::ProtocolCodec codec_;

    boost::asio::io_context ioContext_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    std::thread acceptThread_;
    std::uint16_t boundPort_ = 0;

    mutable std::mutex stateMutex_;
    std::condition_variable stateCv_;
    bool started_ = false;
    bool accepting_ = false;

    mutable std::mutex connectionsMutex_;
    std::list<std::shared_ptr<Connection>> connections_;
    std::uint64_t nextConnectionId_ = 1;
};

// Optional HTTP gateway: POST one request object, receive the response object.
// Sessions are served one at a time; each must finish its request and reply
// within sessionTimeout or the connection is dropped.
class HttpJsonServer {
public:
    HttpJsonServer(application::ApplicationCore& appCore, std::string bindAddress, std::uint16_t port,
                   std::chrono::milliseconds maxAllocateWait,
                   std::chrono::milliseconds sessionTimeout = std::chrono::seconds(5));
    ~HttpJsonServer();

    void start();
    void stop();

    std::uint16_t port() const noexcept { return boundPort_; }

private:
    void acceptLoop();
    void handleSession(boost::asio::ip::tcp::socket socket);
    void runSession();

    application::ApplicationCore& appCore_;
    std::string bindAddress_;
    std::uint16_t port_;
    std::uint16_t boundPort_ = 0;
    std::chrono::milliseconds sessionTimeout_;
    RemoteController controller_;
    protocol::ProtocolCodec codec_;
    application::CancelToken cancel_;

    boost::asio::io_context ioContext_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    std::atomic<bool> running_{false};
    std::thread serverThread_;
    // Only touched on serverThread_.
    boost::beast::tcp_stream* activeStream_ = nullptr;
};

} // namespace api
