#include "seedscan/net_platform.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

namespace seedscan {

namespace {

bool set_blocking(int sock, bool blocking) {
  const int flags = fcntl(sock, F_GETFL, 0);
  if (flags < 0) {
    return false;
  }
  const int next = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
  return fcntl(sock, F_SETFL, next) == 0;
}

bool connect_with_timeout(int sock, const sockaddr* addr, socklen_t addr_len, uint32_t timeout_ms) {
  if (!set_blocking(sock, false)) {
    return false;
  }
  if (::connect(sock, addr, addr_len) != 0) {
    if (errno != EINPROGRESS) {
      return false;
    }
    pollfd pfd{};
    pfd.fd = sock;
    pfd.events = POLLOUT;
    const int rc = poll(&pfd, 1, static_cast<int>(timeout_ms));
    if (rc <= 0) {
      return false;
    }
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
      return false;
    }
  }
  return set_blocking(sock, true);
}

} // namespace

SocketHandle invalid_socket_handle() {
  return static_cast<SocketHandle>(-1);
}

void initialize_network_stack_once() {
}

SocketHandle connect_tcp_socket(const std::string& host, uint16_t port, uint32_t timeout_ms) {
  const std::string port_str = std::to_string(port);

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;

  addrinfo* result = nullptr;
  const int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result);
  if (gai != 0) {
    throw std::runtime_error("failed to resolve " + host + ": " + gai_strerror(gai));
  }

  int sock = -1;
  for (auto* ptr = result; ptr != nullptr; ptr = ptr->ai_next) {
    sock = socket(ptr->ai_family, ptr->ai_socktype | SOCK_CLOEXEC, ptr->ai_protocol);
    if (sock < 0) {
      continue;
    }
    if (connect_with_timeout(sock, ptr->ai_addr, static_cast<socklen_t>(ptr->ai_addrlen), timeout_ms)) {
      break;
    }
    close(sock);
    sock = -1;
  }

  freeaddrinfo(result);

  if (sock < 0) {
    throw std::runtime_error("failed to connect to " + host + ":" + port_str);
  }

  const int one = 1;
  (void)setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
  return static_cast<SocketHandle>(sock);
}

void interrupt_socket_handle(SocketHandle sock) {
  if (sock == invalid_socket_handle()) {
    return;
  }
  (void)shutdown(static_cast<int>(sock), SHUT_RDWR);
}

void close_socket_handle(SocketHandle sock) {
  if (sock == invalid_socket_handle()) {
    return;
  }
  (void)close(static_cast<int>(sock));
}

bool socket_wait_readable(SocketHandle sock, uint32_t timeout_ms) {
  if (sock == invalid_socket_handle()) {
    return false;
  }
  pollfd pfd{};
  pfd.fd = static_cast<int>(sock);
  pfd.events = POLLIN;
  int rc = 0;
  do {
    rc = poll(&pfd, 1, static_cast<int>(timeout_ms));
  } while (rc < 0 && errno == EINTR);
  return rc > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
}

size_t send_socket_data(SocketHandle sock, const uint8_t* data, size_t len) {
  const ssize_t n = send(static_cast<int>(sock), data, len, MSG_NOSIGNAL);
  if (n <= 0) {
    return 0;
  }
  return static_cast<size_t>(n);
}

size_t recv_socket_data(SocketHandle sock, uint8_t* data, size_t len) {
  const ssize_t n = recv(static_cast<int>(sock), data, len, 0);
  if (n <= 0) {
    return 0;
  }
  return static_cast<size_t>(n);
}

} // namespace seedscan
