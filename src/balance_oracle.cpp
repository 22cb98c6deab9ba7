#include "seedscan/balance_oracle.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <utility>

namespace seedscan {

namespace {

constexpr const char kClientAgent[] = "seedscan/" SEEDSCAN_VERSION;
constexpr const char kProtocolVersion[] = "1.4";
constexpr size_t kMaxLineBytes = 1U << 20;

std::string trim(std::string_view s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(" \t\r\n");
  return std::string(s.substr(first, last - first + 1));
}

bool response_id_matches(const JsonValue& message, uint64_t id) {
  if (!message.is_object()) {
    return false;
  }
  const JsonValue* v = message.find("id");
  if (v == nullptr) {
    return false;
  }
  if (v->is_uint64()) {
    return v->as_uint64() == id;
  }
  if (v->is_int64()) {
    return v->as_int64() >= 0 && static_cast<uint64_t>(v->as_int64()) == id;
  }
  if (v->is_double()) {
    const double d = v->as_double();
    return d >= 0.0 && d == static_cast<double>(id);
  }
  return false;
}

// Satoshi amount of a balance field. Servers report unconfirmed spends as
// negative values.
int64_t balance_field(const JsonValue& result, std::string_view key) {
  const JsonValue* v = result.find(key);
  if (v == nullptr || v->is_null()) {
    return 0;
  }
  if (v->is_uint64()) {
    const uint64_t raw = v->as_uint64();
    return raw > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())
      ? std::numeric_limits<int64_t>::max()
      : static_cast<int64_t>(raw);
  }
  return v->as_int64();
}

uint64_t clamped_balance(int64_t confirmed, int64_t unconfirmed) {
  constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
  if (unconfirmed > 0 && confirmed > kMax - unconfirmed) {
    return static_cast<uint64_t>(kMax);
  }
  if (unconfirmed < 0 && confirmed < std::numeric_limits<int64_t>::min() - unconfirmed) {
    return 0;
  }
  const int64_t total = confirmed + unconfirmed;
  return total > 0 ? static_cast<uint64_t>(total) : 0;
}

std::string describe_rpc_error(const JsonValue& error) {
  if (error.is_string()) {
    return error.as_string();
  }
  if (const JsonValue* message = error.find("message"); message != nullptr && message->is_string()) {
    return message->as_string();
  }
  return to_json(error, false);
}

} // namespace

std::string electrum_script_hash(const Bytes& script_pubkey) {
  Hash256 digest = sha256(script_pubkey);
  std::reverse(digest.begin(), digest.end());
  return to_hex(digest);
}

ElectrumOracle::ElectrumOracle(std::string host, uint16_t port, uint32_t timeout_ms, NetworkParams network)
  : host_(std::move(host)),
    port_(port),
    timeout_ms_(timeout_ms),
    network_(std::move(network)),
    socket_fd_(invalid_socket_handle()) {
}

ElectrumOracle::~ElectrumOracle() {
  disconnect();
}

void ElectrumOracle::connect() {
  if (interrupted_.load()) {
    throw OracleError("oracle interrupted");
  }
  if (socket_fd_.load() != invalid_socket_handle()) {
    return;
  }

  initialize_network_stack_once();
  try {
    socket_fd_.store(connect_tcp_socket(host_, port_, timeout_ms_));
  } catch (const std::runtime_error& ex) {
    throw OracleError(std::string("electrum connect failed: ") + ex.what());
  }
  // interrupt() may have fired before the handle was published.
  if (interrupted_.load()) {
    disconnect();
    throw OracleError("oracle interrupted");
  }

  try {
    const JsonValue result = request_response(
      "server.version", JsonValue::array{JsonValue(kClientAgent), JsonValue(kProtocolVersion)});
    if (result.is_array() && !result.as_array().empty() && result.as_array().front().is_string()) {
      server_version_ = result.as_array().front().as_string();
    } else {
      server_version_ = "unknown";
    }
  } catch (const OracleError&) {
    disconnect();
    throw;
  }
}

void ElectrumOracle::disconnect() {
  const SocketHandle fd = socket_fd_.exchange(invalid_socket_handle());
  if (fd != invalid_socket_handle()) {
    close_socket_handle(fd);
  }
  rx_buffer_.clear();
}

void ElectrumOracle::interrupt() {
  interrupted_.store(true);
  interrupt_socket_handle(socket_fd_.load());
}

void ElectrumOracle::send_json_line(const JsonValue& value) {
  const SocketHandle fd = socket_fd_.load();
  if (fd == invalid_socket_handle()) {
    throw OracleError("electrum not connected");
  }
  std::string line = to_json(value, false);
  line.push_back('\n');
  size_t written = 0;
  while (written < line.size()) {
    const size_t n = send_socket_data(
      fd,
      reinterpret_cast<const uint8_t*>(line.data() + written),
      line.size() - written);
    if (n == 0) {
      throw OracleError("failed to send electrum request");
    }
    written += n;
  }
}

JsonValue ElectrumOracle::read_json_line() {
  const SocketHandle fd = socket_fd_.load();
  if (fd == invalid_socket_handle()) {
    throw OracleError("electrum not connected");
  }

  while (true) {
    const size_t nl = rx_buffer_.find('\n');
    if (nl != std::string::npos) {
      const std::string line = trim(std::string_view(rx_buffer_).substr(0, nl));
      rx_buffer_.erase(0, nl + 1);
      if (line.empty()) {
        continue;
      }
      try {
        return parse_json(line);
      } catch (const JsonError& ex) {
        throw OracleError(std::string("invalid electrum JSON: ") + ex.what());
      }
    }

    if (rx_buffer_.size() > kMaxLineBytes) {
      throw OracleError("electrum line exceeds size limit");
    }
    if (!socket_wait_readable(fd, timeout_ms_)) {
      throw OracleError("timeout waiting for electrum response");
    }

    std::array<uint8_t, 4096> chunk{};
    const size_t n = recv_socket_data(fd, chunk.data(), chunk.size());
    if (n == 0) {
      throw OracleError(interrupted_.load() ? "oracle interrupted" : "electrum connection closed");
    }
    rx_buffer_.append(reinterpret_cast<const char*>(chunk.data()), n);
  }
}

JsonValue ElectrumOracle::request_response(const std::string& method, JsonValue::array params) {
  const uint64_t req_id = next_request_id_++;
  JsonValue::object request{
    {"jsonrpc", JsonValue("2.0")},
    {"id", JsonValue(req_id)},
    {"method", JsonValue(method)},
    {"params", JsonValue(std::move(params))},
  };
  send_json_line(JsonValue(std::move(request)));

  try {
    while (true) {
      JsonValue message = read_json_line();
      // Subscription notifications carry no id; skip them.
      if (!response_id_matches(message, req_id)) {
        continue;
      }
      if (const JsonValue* error = message.find("error"); error != nullptr && !error->is_null()) {
        throw OracleError(method + " failed: " + describe_rpc_error(*error));
      }
      const JsonValue* result = message.find("result");
      if (result == nullptr) {
        throw OracleError(method + " returned no result");
      }
      return *result;
    }
  } catch (const JsonError& ex) {
    throw OracleError(method + " response malformed: " + ex.what());
  }
}

uint64_t ElectrumOracle::check_balance(const std::string& address) {
  std::string script_hash;
  try {
    script_hash = electrum_script_hash(script_pubkey_for_address(address, network_));
  } catch (const AddressError& ex) {
    throw OracleError(std::string("cannot query ") + address + ": " + ex.what());
  }

  connect();
  try {
    const JsonValue result = request_response(
      "blockchain.scripthash.get_balance", JsonValue::array{JsonValue(script_hash)});
    if (!result.is_object()) {
      throw OracleError("get_balance result is not an object");
    }
    return clamped_balance(balance_field(result, "confirmed"), balance_field(result, "unconfirmed"));
  } catch (const JsonError& ex) {
    disconnect();
    throw OracleError(std::string("malformed get_balance result: ") + ex.what());
  } catch (const OracleError&) {
    disconnect();
    throw;
  }
}

} // namespace seedscan
