#pragma once

#include "seedscan/address.hpp"
#include "seedscan/json.hpp"
#include "seedscan/net_platform.hpp"

#include <atomic>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace seedscan {

class OracleError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class BalanceOracle {
public:
  virtual ~BalanceOracle() = default;

  // Confirmed plus unconfirmed satoshis held by `address`. Throws OracleError.
  virtual uint64_t check_balance(const std::string& address) = 0;

  // Unblocks a check_balance running on another thread. Safe to call anytime.
  virtual void interrupt() {}
};

// Electrum protocol client: newline-delimited JSON-RPC over plain TCP.
// One instance per thread; only interrupt() may be called concurrently.
class ElectrumOracle : public BalanceOracle {
public:
  ElectrumOracle(std::string host, uint16_t port, uint32_t timeout_ms, NetworkParams network);
  ~ElectrumOracle() override;

  ElectrumOracle(const ElectrumOracle&) = delete;
  ElectrumOracle& operator=(const ElectrumOracle&) = delete;

  uint64_t check_balance(const std::string& address) override;
  void interrupt() override;

  void connect();
  void disconnect();

  // Server software string reported during the handshake.
  const std::string& server_version() const { return server_version_; }

private:
  void send_json_line(const JsonValue& value);
  JsonValue read_json_line();
  JsonValue request_response(const std::string& method, JsonValue::array params);

  std::string host_;
  uint16_t port_ = 0;
  uint32_t timeout_ms_ = 0;
  NetworkParams network_;
  std::atomic<SocketHandle> socket_fd_;
  std::atomic<bool> interrupted_{false};
  uint64_t next_request_id_ = 1;
  std::string rx_buffer_;
  std::string server_version_;
};

// Electrum script hash: hex of the byte-reversed sha256 of the output script.
std::string electrum_script_hash(const Bytes& script_pubkey);

} // namespace seedscan
