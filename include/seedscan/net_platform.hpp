#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace seedscan {

using SocketHandle = std::intptr_t;

SocketHandle invalid_socket_handle();
void initialize_network_stack_once();

// Resolves `host` and connects to the first address that accepts within
// `timeout_ms`. Throws std::runtime_error when none does.
SocketHandle connect_tcp_socket(const std::string& host, uint16_t port, uint32_t timeout_ms);

// Wakes any thread blocked on `sock` without releasing the descriptor.
void interrupt_socket_handle(SocketHandle sock);
void close_socket_handle(SocketHandle sock);

bool socket_wait_readable(SocketHandle sock, uint32_t timeout_ms);
size_t send_socket_data(SocketHandle sock, const uint8_t* data, size_t len);
size_t recv_socket_data(SocketHandle sock, uint8_t* data, size_t len);

} // namespace seedscan
