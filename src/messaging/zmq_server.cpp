#include "messaging/zmq_server.hpp"

#include <spdlog/spdlog.h>

namespace lotledger::messaging {

ZmqServer::ZmqServer(const std::string& bind_address, int poll_timeout_ms)
    : ctx_(1), socket_(ctx_, zmq::socket_type::router), poll_timeout_ms_(poll_timeout_ms) {
    socket_.bind(bind_address);
}

ZmqServer::~ZmqServer() {
    socket_.close();
    ctx_.close();
}

void ZmqServer::set_handler(MessageHandler handler) {
    handler_ = std::move(handler);
}

void ZmqServer::set_periodic(std::chrono::seconds interval, std::function<void()> task) {
    periodic_interval_ = interval;
    periodic_ = std::move(task);
}

bool ZmqServer::poll_once(int timeout_ms) {
    zmq::pollitem_t items[] = {{socket_, 0, ZMQ_POLLIN, 0}};
    zmq::poll(items, 1, std::chrono::milliseconds(timeout_ms));

    if (!(items[0].revents & ZMQ_POLLIN)) {
        return false;
    }

    // Frames: identity, empty delimiter, protobuf payload
    zmq::message_t identity;
    (void)socket_.recv(identity, zmq::recv_flags::none);
    std::string client_id(static_cast<char*>(identity.data()), identity.size());

    zmq::message_t empty;
    (void)socket_.recv(empty, zmq::recv_flags::none);

    zmq::message_t data;
    (void)socket_.recv(data, zmq::recv_flags::none);

    if (!handler_) {
        spdlog::warn("[RECV] No handler installed, dropping message from {}", client_id);
        return true;
    }

    try {
        auto msg = deserialize(data.data(), data.size());
        for (const auto& response : handler_(client_id, msg)) {
            std::string resp_bytes = serialize(response);

            socket_.send(zmq::buffer(client_id), zmq::send_flags::sndmore);
            socket_.send(zmq::message_t{}, zmq::send_flags::sndmore);
            socket_.send(zmq::buffer(resp_bytes), zmq::send_flags::none);
        }
    } catch (const std::exception& e) {
        spdlog::error("Error processing message from {}: {}", client_id, e.what());
    }

    return true;
}

void ZmqServer::run() {
    running_ = true;
    spdlog::info("lotledger server running...");
    auto last_tick = std::chrono::steady_clock::now();
    while (running_) {
        poll_once(poll_timeout_ms_);

        if (periodic_ && periodic_interval_.count() > 0) {
            auto now = std::chrono::steady_clock::now();
            if (now - last_tick >= periodic_interval_) {
                periodic_();
                last_tick = now;
            }
        }
    }
}

void ZmqServer::stop() {
    running_ = false;
}

}  // namespace lotledger::messaging
