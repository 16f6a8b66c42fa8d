#pragma once

#include <zmq.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "messaging/protocol.hpp"

namespace lotledger::messaging {

/// ROUTER socket speaking length-delimited protobuf LedgerMessages.
class ZmqServer {
public:
    explicit ZmqServer(const std::string& bind_address = "tcp://*:5555",
                       int poll_timeout_ms = 100);
    ~ZmqServer();

    ZmqServer(const ZmqServer&) = delete;
    ZmqServer& operator=(const ZmqServer&) = delete;

    using MessageHandler = std::function<std::vector<ledgerwire::LedgerMessage>(
        const std::string& client_id, const ledgerwire::LedgerMessage& msg)>;

    void set_handler(MessageHandler handler);

    /// Task run from the event loop every `interval`.
    void set_periodic(std::chrono::seconds interval, std::function<void()> task);

    /// Poll for one message, dispatch to handler, send responses.
    /// Returns true if a message was processed.
    bool poll_once(int timeout_ms);

    /// Run the event loop (blocking) until stop().
    void run();
    void stop();

private:
    zmq::context_t ctx_;
    zmq::socket_t socket_;
    MessageHandler handler_;
    std::function<void()> periodic_;
    std::chrono::seconds periodic_interval_{0};
    int poll_timeout_ms_;
    std::atomic<bool> running_{false};
};

}  // namespace lotledger::messaging
