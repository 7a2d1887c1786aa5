// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include "io/network/socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <utility>

#include "io/network/addrinfo.hpp"
#include "io/network/network_error.hpp"
#include "utils/logging.hpp"

namespace trellis::io::network {

namespace {

// Reads the numeric address and the port of a socket address.
Endpoint EndpointFromSockaddr(const sockaddr_storage &addr) {
  char host[INET6_ADDRSTRLEN] = {};
  if (addr.ss_family == AF_INET) {
    const auto *addr4 = reinterpret_cast<const sockaddr_in *>(&addr);
    inet_ntop(AF_INET, &addr4->sin_addr, host, sizeof(host));
    return {host, ntohs(addr4->sin_port)};
  }
  const auto *addr6 = reinterpret_cast<const sockaddr_in6 *>(&addr);
  inet_ntop(AF_INET6, &addr6->sin6_addr, host, sizeof(host));
  return {host, ntohs(addr6->sin6_port)};
}

}  // namespace

Socket::Socket(Socket &&other) noexcept
    : socket_(std::exchange(other.socket_, -1)),
      timeout_ms_(std::exchange(other.timeout_ms_, -1)),
      endpoint_(std::move(other.endpoint_)) {}

Socket &Socket::operator=(Socket &&other) noexcept {
  if (this != &other) {
    Close();
    socket_ = std::exchange(other.socket_, -1);
    timeout_ms_ = std::exchange(other.timeout_ms_, -1);
    endpoint_ = std::move(other.endpoint_);
  }
  return *this;
}

Socket::~Socket() { Close(); }

void Socket::Close() {
  if (socket_ == -1) return;
  close(socket_);
  socket_ = -1;
}

void Socket::Shutdown() {
  if (socket_ == -1) return;
  shutdown(socket_, SHUT_RDWR);
}

bool Socket::IsOpen() const { return socket_ != -1; }

bool Socket::Connect(const Endpoint &endpoint) {
  if (socket_ != -1) return false;

  try {
    for (const auto &it : AddrInfo::Get(endpoint, false)) {
      int sfd = socket(it.ai_family, it.ai_socktype | SOCK_CLOEXEC, it.ai_protocol);
      if (sfd == -1) continue;
      if (connect(sfd, it.ai_addr, it.ai_addrlen) == 0) {
        socket_ = sfd;
        endpoint_ = endpoint;
        break;
      }
      close(sfd);
    }
  } catch (const NetworkError &e) {
    spdlog::debug("Couldn't connect to {}: {}", endpoint, e.what());
    return false;
  }

  return socket_ != -1;
}

bool Socket::Bind(const Endpoint &endpoint) {
  if (socket_ != -1) return false;

  try {
    for (const auto &it : AddrInfo::Get(endpoint, true)) {
      int sfd = socket(it.ai_family, it.ai_socktype | SOCK_CLOEXEC, it.ai_protocol);
      if (sfd == -1) continue;

      int on = 1;
      if (setsockopt(sfd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) != 0) {
        close(sfd);
        continue;
      }

      if (bind(sfd, it.ai_addr, it.ai_addrlen) == 0) {
        socket_ = sfd;
        break;
      }
      close(sfd);
    }
  } catch (const NetworkError &e) {
    spdlog::error("Couldn't bind to {}: {}", endpoint, e.what());
    return false;
  }

  if (socket_ == -1) return false;

  // Get bound address and port, the port could have been chosen by the
  // kernel.
  sockaddr_storage addr{};
  socklen_t addr_len = sizeof(addr);
  if (getsockname(socket_, reinterpret_cast<sockaddr *>(&addr), &addr_len) != 0) {
    Close();
    return false;
  }
  endpoint_ = EndpointFromSockaddr(addr);
  return true;
}

bool Socket::Listen(int backlog) { return listen(socket_, backlog) == 0; }

std::optional<Socket> Socket::Accept() {
  sockaddr_storage addr{};
  socklen_t addr_len = sizeof(addr);
  int sfd = accept4(socket_, reinterpret_cast<sockaddr *>(&addr), &addr_len, SOCK_CLOEXEC);
  if (sfd == -1) return std::nullopt;
  return Socket(sfd, EndpointFromSockaddr(addr));
}

void Socket::SetNonBlocking() {
  int flags = fcntl(socket_, F_GETFL, 0);
  TR_ASSERT(flags != -1, "Can't get socket mode");
  flags |= O_NONBLOCK;
  TR_ASSERT(fcntl(socket_, F_SETFL, flags) != -1, "Can't set socket nonblocking");
}

void Socket::SetKeepAlive() {
  int optval = 1;
  socklen_t optlen = sizeof(optval);

  TR_ASSERT(!setsockopt(socket_, SOL_SOCKET, SO_KEEPALIVE, &optval, optlen), "Can't set socket keep alive");

  optval = 20;  // wait 20s before sending keep-alive packets
  TR_ASSERT(!setsockopt(socket_, SOL_TCP, TCP_KEEPIDLE, (void *)&optval, optlen),
            "Can't set socket keep alive idle time");

  optval = 4;  // 4 keep-alive packets must fail to close
  TR_ASSERT(!setsockopt(socket_, SOL_TCP, TCP_KEEPCNT, (void *)&optval, optlen),
            "Can't set socket keep alive packet count");

  optval = 15;  // send keep-alive packets every 15s
  TR_ASSERT(!setsockopt(socket_, SOL_TCP, TCP_KEEPINTVL, (void *)&optval, optlen),
            "Can't set socket keep alive interval");
}

void Socket::SetNoDelay() {
  int optval = 1;
  socklen_t optlen = sizeof(optval);

  TR_ASSERT(!setsockopt(socket_, SOL_TCP, TCP_NODELAY, (void *)&optval, optlen), "Can't set socket no delay");
}

void Socket::SetTimeout(long sec, long usec) {
  struct timeval tv;
  tv.tv_sec = sec;
  tv.tv_usec = usec;

  TR_ASSERT(!setsockopt(socket_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)), "Can't set socket timeout");

  TR_ASSERT(!setsockopt(socket_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)), "Can't set socket timeout");

  auto const timeout_ms = sec * 1000 + usec / 1000;
  timeout_ms_ = timeout_ms > 0 ? static_cast<int>(timeout_ms) : -1;
}

bool Socket::Write(const uint8_t *data, size_t len, bool have_more) {
  // MSG_NOSIGNAL is here to disable raising a SIGPIPE signal when a
  // connection dies mid-write, the socket will only return an EPIPE error.
  int flags = MSG_NOSIGNAL | (have_more ? MSG_MORE : 0);
  while (len > 0) {
    auto written = send(socket_, data, len, flags);
    if (written == -1) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        // Wait until the socket is ready for writing and retry.
        if (!WaitForReadyWrite()) return false;
        continue;
      }
      return false;
    }
    len -= written;
    data += written;
  }
  return true;
}

ssize_t Socket::Read(void *buffer, size_t len, bool nonblock) {
  return recv(socket_, buffer, len, nonblock ? MSG_DONTWAIT : 0);
}

bool Socket::WaitForReadyWrite() {
  pollfd p{.fd = socket_, .events = POLLOUT, .revents = 0};
  if (poll(&p, 1, timeout_ms_) < 1) return false;
  return (p.revents & POLLOUT) != 0;
}

}  // namespace trellis::io::network
