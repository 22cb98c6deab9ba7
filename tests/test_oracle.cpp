#undef NDEBUG

#include "seedscan/balance_oracle.hpp"
#include "seedscan/json.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace seedscan;

namespace {

const std::string kLegacyAddress = "1LqBGSKuX5yYUonjxT5qGfpUsXKYYWeabA";
const std::string kLegacyScriptHash = "1e8750b8a4c0912d8b84f7eb53472cbdcb57f9e0cde263b2e51ecbe30853cd68";

template<typename Error, typename Fn>
bool throws(Fn&& fn, std::string* message = nullptr) {
  try {
    fn();
  } catch (const Error& ex) {
    if (message != nullptr) {
      *message = ex.what();
    }
    return true;
  }
  return false;
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

// Server side of one accepted connection.
class ServerSession {
public:
  explicit ServerSession(int fd) : fd_(fd) {}
  ~ServerSession() { ::close(fd_); }

  ServerSession(const ServerSession&) = delete;
  ServerSession& operator=(const ServerSession&) = delete;

  // Next request line, or nullopt once the client hung up.
  std::optional<JsonValue> read_request() {
    while (true) {
      const size_t nl = buffer_.find('\n');
      if (nl != std::string::npos) {
        const std::string line = buffer_.substr(0, nl);
        buffer_.erase(0, nl + 1);
        return parse_json(line);
      }
      char chunk[1024];
      const ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
      if (n <= 0) {
        return std::nullopt;
      }
      buffer_.append(chunk, static_cast<size_t>(n));
    }
  }

  void send_line(const std::string& line) {
    const std::string out = line + "\n";
    size_t offset = 0;
    while (offset < out.size()) {
      const ssize_t n = ::send(fd_, out.data() + offset, out.size() - offset, MSG_NOSIGNAL);
      if (n <= 0) {
        return;
      }
      offset += static_cast<size_t>(n);
    }
  }

  void reply(const JsonValue& request, const std::string& result_json) {
    send_line("{\"jsonrpc\":\"2.0\",\"id\":" + to_json(*request.find("id")) + ",\"result\":" + result_json + "}");
  }

  void drain() {
    while (read_request().has_value()) {
    }
  }

private:
  int fd_;
  std::string buffer_;
};

// Loopback listener that hands each accepted connection to the next handler.
class LoopbackServer {
public:
  using Handler = std::function<void(ServerSession&)>;

  explicit LoopbackServer(std::vector<Handler> handlers) {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(listen_fd_ >= 0);
    const int one = 1;
    (void)setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    assert(::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    assert(::listen(listen_fd_, 4) == 0);
    socklen_t len = sizeof(addr);
    assert(getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    port_ = ntohs(addr.sin_port);

    thread_ = std::thread([this, handlers = std::move(handlers)]() {
      for (const auto& handler : handlers) {
        const int fd = ::accept(listen_fd_, nullptr, nullptr);
        if (fd < 0) {
          return;
        }
        ++accepted_;
        ServerSession session(fd);
        handler(session);
      }
    });
  }

  ~LoopbackServer() {
    // Wakes a pending accept() when a test used fewer connections.
    (void)::shutdown(listen_fd_, SHUT_RDWR);
    thread_.join();
    ::close(listen_fd_);
  }

  LoopbackServer(const LoopbackServer&) = delete;
  LoopbackServer& operator=(const LoopbackServer&) = delete;

  uint16_t port() const { return port_; }
  int accepted() const { return accepted_.load(); }

private:
  int listen_fd_ = -1;
  uint16_t port_ = 0;
  std::atomic<int> accepted_{0};
  std::thread thread_;
};

std::string method_of(const JsonValue& request) {
  return request.find("method")->as_string();
}

void answer_handshake(ServerSession& session) {
  const auto request = session.read_request();
  assert(request.has_value());
  assert(method_of(*request) == "server.version");
  const auto& params = request->find("params")->as_array();
  assert(params.size() == 2);
  assert(params[0].as_string().rfind("seedscan/", 0) == 0);
  assert(params[1].as_string() == "1.4");
  session.reply(*request, R"(["ElectrumX 1.16.0", "1.4"])");
}

JsonValue expect_get_balance(ServerSession& session) {
  const auto request = session.read_request();
  assert(request.has_value());
  assert(method_of(*request) == "blockchain.scripthash.get_balance");
  const auto& params = request->find("params")->as_array();
  assert(params.size() == 1);
  assert(params[0].as_string() == kLegacyScriptHash);
  return *request;
}

uint16_t unused_port() {
  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  assert(fd >= 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  assert(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
  socklen_t len = sizeof(addr);
  assert(getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
  ::close(fd);
  return ntohs(addr.sin_port);
}

} // namespace

void test_handshake_and_balance() {
  std::cout << "Testing handshake and balance queries..." << std::endl;

  LoopbackServer server({[](ServerSession& session) {
    answer_handshake(session);

    const JsonValue first = expect_get_balance(session);
    const uint64_t id = first.find("id")->as_uint64();
    session.send_line(R"({"jsonrpc":"2.0","method":"blockchain.headers.subscribe","params":[{"height":840000}]})");
    session.send_line("{\"jsonrpc\":\"2.0\",\"id\":" + std::to_string(id + 7) + ",\"result\":{\"confirmed\":1,\"unconfirmed\":0}}");
    session.send_line("");
    session.reply(first, R"({"confirmed":70000,"unconfirmed":30000})");

    session.reply(expect_get_balance(session), R"({"confirmed":500,"unconfirmed":-800})");
    session.reply(expect_get_balance(session), R"({"confirmed":1200,"unconfirmed":null})");
    session.drain();
  }});

  ElectrumOracle oracle("127.0.0.1", server.port(), 2000, NetworkParams::mainnet());
  assert(oracle.check_balance(kLegacyAddress) == 100000);
  assert(oracle.server_version() == "ElectrumX 1.16.0");
  assert(oracle.check_balance(kLegacyAddress) == 0);
  assert(oracle.check_balance(kLegacyAddress) == 1200);
  oracle.disconnect();

  assert(server.accepted() == 1);

  std::cout << "  PASS" << std::endl;
}

void test_rpc_error_then_reconnect() {
  std::cout << "Testing RPC error and lazy reconnect..." << std::endl;

  LoopbackServer server({
    [](ServerSession& session) {
      answer_handshake(session);
      const JsonValue request = expect_get_balance(session);
      session.send_line("{\"jsonrpc\":\"2.0\",\"id\":" + to_json(*request.find("id")) +
                        ",\"error\":{\"code\":-32600,\"message\":\"history too large\"}}");
      session.drain();
    },
    [](ServerSession& session) {
      answer_handshake(session);
      session.reply(expect_get_balance(session), R"({"confirmed":42,"unconfirmed":0})");
      session.drain();
    },
  });

  ElectrumOracle oracle("127.0.0.1", server.port(), 2000, NetworkParams::mainnet());
  std::string message;
  assert(throws<OracleError>([&oracle] { (void)oracle.check_balance(kLegacyAddress); }, &message));
  assert(contains(message, "history too large"));

  assert(oracle.check_balance(kLegacyAddress) == 42);
  oracle.disconnect();
  assert(server.accepted() == 2);

  std::cout << "  PASS" << std::endl;
}

void test_malformed_replies() {
  std::cout << "Testing malformed and extreme replies..." << std::endl;

  LoopbackServer server({[](ServerSession& session) {
    const auto hello = session.read_request();
    assert(hello.has_value());
    // None of these can answer request 1.
    session.send_line(R"({"id":18446744073709551615,"result":null})");
    session.send_line(R"({"id":-3,"result":null})");
    session.send_line(R"({"id":"1","result":null})");
    session.send_line("[1, 2]");
    session.reply(*hello, R"(["Fulcrum 1.10", "1.4"])");

    session.reply(expect_get_balance(session), R"({"confirmed":9223372036854775807,"unconfirmed":9223372036854775807})");
    session.reply(expect_get_balance(session), R"({"confirmed":18446744073709551615,"unconfirmed":5})");
    session.reply(expect_get_balance(session), R"({"confirmed":-9223372036854775807,"unconfirmed":-9223372036854775807})");
    session.reply(expect_get_balance(session), R"({"confirmed":"lots","unconfirmed":0})");
    session.drain();
  }});

  constexpr uint64_t kMax = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
  ElectrumOracle oracle("127.0.0.1", server.port(), 2000, NetworkParams::mainnet());
  assert(oracle.check_balance(kLegacyAddress) == kMax);
  assert(oracle.server_version() == "Fulcrum 1.10");
  assert(oracle.check_balance(kLegacyAddress) == kMax);
  assert(oracle.check_balance(kLegacyAddress) == 0);

  std::string message;
  assert(throws<OracleError>([&oracle] { (void)oracle.check_balance(kLegacyAddress); }, &message));
  assert(contains(message, "malformed"));
  assert(server.accepted() == 1);

  std::cout << "  PASS" << std::endl;
}

void test_broken_server_raises_oracle_error() {
  std::cout << "Testing broken servers raise OracleError..." << std::endl;

  LoopbackServer server({
    [](ServerSession& session) {
      assert(session.read_request().has_value());
      session.send_line(R"({"id":18446744073709551615,"result":null})");
    },
    [](ServerSession& session) {
      assert(session.read_request().has_value());
      session.send_line("not json at all");
      session.drain();
    },
  });

  ElectrumOracle oracle("127.0.0.1", server.port(), 2000, NetworkParams::mainnet());
  std::string message;
  assert(throws<OracleError>([&oracle] { (void)oracle.check_balance(kLegacyAddress); }, &message));
  assert(contains(message, "closed"));

  assert(throws<OracleError>([&oracle] { (void)oracle.check_balance(kLegacyAddress); }, &message));
  assert(contains(message, "invalid electrum JSON"));
  assert(server.accepted() == 2);

  std::cout << "  PASS" << std::endl;
}

void test_interrupt_unblocks_pending_read() {
  std::cout << "Testing interrupt unblocks a pending read..." << std::endl;

  std::atomic<bool> request_seen{false};
  LoopbackServer server({[&request_seen](ServerSession& session) {
    answer_handshake(session);
    (void)expect_get_balance(session);
    request_seen = true;
    session.drain();
  }});

  ElectrumOracle oracle("127.0.0.1", server.port(), 10000, NetworkParams::mainnet());
  std::string message;
  bool threw = false;
  std::thread caller([&oracle, &message, &threw] {
    threw = throws<OracleError>([&oracle] { (void)oracle.check_balance(kLegacyAddress); }, &message);
  });

  while (!request_seen) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  const auto started = std::chrono::steady_clock::now();
  oracle.interrupt();
  caller.join();

  assert(threw);
  assert(contains(message, "interrupted"));
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
  assert(throws<OracleError>([&oracle] { oracle.connect(); }));

  std::cout << "  PASS" << std::endl;
}

void test_timeout_and_refused_connection() {
  std::cout << "Testing timeouts and refused connections..." << std::endl;

  {
    LoopbackServer silent({[](ServerSession& session) { session.drain(); }});
    ElectrumOracle oracle("127.0.0.1", silent.port(), 200, NetworkParams::mainnet());
    std::string message;
    assert(throws<OracleError>([&oracle] { oracle.connect(); }, &message));
    assert(contains(message, "timeout"));
  }

  ElectrumOracle refused("127.0.0.1", unused_port(), 500, NetworkParams::mainnet());
  std::string message;
  assert(throws<OracleError>([&refused] { (void)refused.check_balance(kLegacyAddress); }, &message));
  assert(contains(message, "connect failed"));

  assert(throws<OracleError>([&refused] { (void)refused.check_balance("not-an-address"); }, &message));
  assert(contains(message, "cannot query"));

  std::cout << "  PASS" << std::endl;
}

int main() {
  std::cout << "=== Electrum Oracle Tests ===" << std::endl;

  test_handshake_and_balance();
  test_rpc_error_then_reconnect();
  test_malformed_replies();
  test_broken_server_raises_oracle_error();
  test_interrupt_unblocks_pending_read();
  test_timeout_and_refused_connection();

  std::cout << std::endl << "All oracle tests passed" << std::endl;
  return 0;
}
