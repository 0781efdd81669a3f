#include "services/transport/zmq/zmq_transport.h"

#include <mutex>
#include <zmq.hpp>

namespace concmon {
namespace transport {

class ZmqTransport::Impl {
 public:
  explicit Impl(const std::string& endpoint)
      : endpoint_(endpoint), context_(1) {}

  ~Impl() { shutdown(); }

  bool start() {
    std::lock_guard<std::mutex> lock(pub_mutex_);
    if (pub_socket_) return true;
    try {
      auto socket =
          std::make_unique<zmq::socket_t>(context_, zmq::socket_type::pub);
      // Do not hold the process on exit for undelivered messages
      socket->set(zmq::sockopt::linger, 0);
      socket->bind(endpoint_);
      pub_socket_ = std::move(socket);
      last_error_.clear();
      return true;
    } catch (const zmq::error_t& e) {
      last_error_ = e.what();
      return false;
    }
  }

  void shutdown() {
    std::lock_guard<std::mutex> lock(pub_mutex_);
    if (pub_socket_) {
      pub_socket_->close();
      pub_socket_.reset();
    }
  }

  bool running() const {
    std::lock_guard<std::mutex> lock(pub_mutex_);
    return pub_socket_ != nullptr;
  }

  bool publish(const std::string& topic, const Payload& data) {
    // PUB sockets are not thread-safe
    std::lock_guard<std::mutex> lock(pub_mutex_);
    if (!pub_socket_) {
      last_error_ = "socket not open";
      return false;
    }
    try {
      pub_socket_->send(zmq::buffer(topic), zmq::send_flags::sndmore);
      pub_socket_->send(zmq::buffer(data), zmq::send_flags::none);
      return true;
    } catch (const zmq::error_t& e) {
      last_error_ = e.what();
      return false;
    }
  }

  std::string error() const {
    std::lock_guard<std::mutex> lock(pub_mutex_);
    return last_error_;
  }

 private:
  std::string endpoint_;
  zmq::context_t context_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  mutable std::mutex pub_mutex_;
  std::string last_error_;
};

ZmqTransport::ZmqTransport(const std::string& endpoint)
    : impl_(std::make_unique<Impl>(endpoint)) {}

ZmqTransport::~ZmqTransport() = default;

bool ZmqTransport::open() { return impl_->start(); }
void ZmqTransport::close() { impl_->shutdown(); }
bool ZmqTransport::isOpen() const { return impl_->running(); }
bool ZmqTransport::send(const std::string& t, const Payload& d) {
  return impl_->publish(t, d);
}
std::string ZmqTransport::lastError() const { return impl_->error(); }

}  // namespace transport
}  // namespace concmon
