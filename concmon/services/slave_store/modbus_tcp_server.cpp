#include "services/slave_store/modbus_tcp_server.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <vector>

namespace concmon {

namespace {
const char* TAG = "SERVER";
}

ModbusTcpServer::ModbusTcpServer(const ServerSettings& settings,
                                 SlaveDataStore& store, Logger& logger)
    : settings_(settings), store_(store), log_(logger) {}

ModbusTcpServer::~ModbusTcpServer() { stop(); }

bool ModbusTcpServer::start() {
  if (running_) return true;

  ctx_.reset(modbus_new_tcp(settings_.host.c_str(), settings_.port));
  if (!ctx_) {
    log_.error(TAG, std::string("Cannot create Modbus TCP context: ") +
                        modbus_strerror(errno));
    return false;
  }

  listen_socket_ = modbus_tcp_listen(ctx_.get(), settings_.backlog);
  if (listen_socket_ == -1) {
    log_.error(TAG, "Cannot listen on " + settings_.host + ":" +
                        std::to_string(settings_.port) + ": " +
                        modbus_strerror(errno));
    ctx_.reset();
    return false;
  }

  log_.info(TAG, "Modbus TCP server listening on " + settings_.host + ":" +
                     std::to_string(settings_.port) + " (unit " +
                     std::to_string(store_.unitId()) + ")");

  running_ = true;
  thread_ = std::thread(&ModbusTcpServer::serveLoop, this);
  return true;
}

void ModbusTcpServer::stop() {
  if (!running_.exchange(false)) return;

  if (thread_.joinable()) {
    thread_.join();
  }
  log_.info(TAG, "Modbus TCP server stopped");
}

void ModbusTcpServer::serveLoop() {
  fd_set refset;
  FD_ZERO(&refset);
  FD_SET(listen_socket_, &refset);
  int fdmax = listen_socket_;
  std::vector<int> clients;

  uint8_t query[MODBUS_TCP_MAX_ADU_LENGTH];

  while (running_) {
    fd_set rdset = refset;
    // Short timeout so stop() is observed
    struct timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 200000;

    int rc = select(fdmax + 1, &rdset, nullptr, nullptr, &tv);
    if (rc == -1) {
      if (errno == EINTR) continue;
      log_.error(TAG, std::string("select() failed: ") + std::strerror(errno));
      break;
    }
    if (rc == 0) continue;

    for (int fd = 0; fd <= fdmax; ++fd) {
      if (!FD_ISSET(fd, &rdset)) continue;

      if (fd == listen_socket_) {
        struct sockaddr_in client_addr;
        socklen_t addrlen = sizeof(client_addr);
        std::memset(&client_addr, 0, sizeof(client_addr));

        int newfd = accept(listen_socket_,
                           reinterpret_cast<struct sockaddr*>(&client_addr),
                           &addrlen);
        if (newfd == -1) {
          log_.warn(TAG, std::string("accept() failed: ") + std::strerror(errno));
          continue;
        }
        if (newfd >= FD_SETSIZE) {
          log_.warn(TAG, "Too many clients, rejecting connection");
          ::close(newfd);
          continue;
        }

        FD_SET(newfd, &refset);
        if (newfd > fdmax) fdmax = newfd;
        clients.push_back(newfd);

        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
        log_.info(TAG, "Client connected from " + std::string(ip) + ":" +
                           std::to_string(ntohs(client_addr.sin_port)));
        continue;
      }

      modbus_set_socket(ctx_.get(), fd);
      int length = modbus_receive(ctx_.get(), query);
      if (length > 0) {
        handleRequest(query, length);
      } else if (length == -1) {
        // Client closed the connection or sent garbage
        log_.debug(TAG, "Client on socket " + std::to_string(fd) +
                            " disconnected: " + modbus_strerror(errno));
        ::close(fd);
        FD_CLR(fd, &refset);
        for (std::size_t i = 0; i < clients.size(); ++i) {
          if (clients[i] == fd) {
            clients.erase(clients.begin() + i);
            break;
          }
        }
        if (fd == fdmax) {
          while (fdmax > listen_socket_ && !FD_ISSET(fdmax, &refset)) --fdmax;
        }
      }
    }
  }

  for (int fd : clients) {
    ::close(fd);
  }
  ::close(listen_socket_);
  listen_socket_ = -1;

  // The context still refers to the last client socket, already closed above
  modbus_set_socket(ctx_.get(), -1);
  ctx_.reset();
}

void ModbusTcpServer::handleRequest(const uint8_t* query, int length) {
  int header_length = modbus_get_header_length(ctx_.get());
  int unit = query[header_length - 1];

  // 0xFF and 0 are accepted as "this device" per the Modbus TCP convention
  if (unit != store_.unitId() && unit != 0xFF && unit != 0) {
    log_.debug(TAG, "Request for unknown unit " + std::to_string(unit));
    if (modbus_reply_exception(ctx_.get(), query,
                               MODBUS_EXCEPTION_GATEWAY_TARGET) == -1) {
      log_.warn(TAG, std::string("Exception reply failed: ") +
                         modbus_strerror(errno));
    }
    return;
  }

  if (store_.reply(ctx_.get(), query, length) == -1) {
    log_.warn(TAG, std::string("Reply failed: ") + modbus_strerror(errno));
  }
}

}  // namespace concmon
