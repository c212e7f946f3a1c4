#pragma once

#include "discovery_client.hpp"
#include "log.hpp"
#include "loopback_signaling.hpp"
#include "registry_store.hpp"
#include "room_node.hpp"
#include "room_session.hpp"
#include "transfer_engine.hpp"

#include <asio.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace roomdrop::test {

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(make_listener(label));
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, nullptr, handle});
  }

  void attach(RoomNode& node, const std::string& label = std::string()) {
    auto handle = node.add_log_listener(make_listener(label));
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({nullptr, &node, handle});
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
      if(attachment.node && attachment.handle != 0) {
        attachment.node->remove_log_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

  bool wait_for_substring(const std::string& needle,
                          std::chrono::milliseconds timeout) {
    auto predicate = [&]{
      return std::any_of(lines_.begin(), lines_.end(),
        [&](const std::string& line){ return line.find(needle) != std::string::npos; });
    };
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while(!predicate()) {
      if(cv_.wait_until(lock, deadline) == std::cv_status::timeout) break;
    }
    return predicate();
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    RoomNode* node = nullptr;
    LogListenerHandle handle = 0;
  };

  Logger::Listener make_listener(const std::string& label) {
    return [this, label](const LogRecord& record) {
      std::lock_guard<std::mutex> lock(mutex_);
      const std::string prefix = label.empty() ? std::string(channel_name(record.channel)) : label;
      lines_.emplace_back(prefix + ": " + record.message);
      cv_.notify_all();
      return false;
    };
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

inline bool wait_for_condition(std::function<bool()> predicate,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(50)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(std::chrono::steady_clock::now() < deadline) {
    if(predicate()) return true;
    std::this_thread::sleep_for(interval);
  }
  return predicate();
}

// Drives io on the calling thread until predicate holds or timeout passes.
inline bool run_until(asio::io_context& io,
                      std::function<bool()> predicate,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(!predicate()) {
    if(std::chrono::steady_clock::now() >= deadline) return false;
    if(io.stopped()) io.restart();
    io.run_for(std::chrono::milliseconds(5));
  }
  return true;
}

// Runs whatever is ready without waiting on timers.
inline void drain(asio::io_context& io) {
  if(io.stopped()) io.restart();
  io.poll();
}

// Discovery backed directly by a registry store, answering asynchronously
// through the io_context like the HTTP client does.
class StoreDiscovery : public DiscoveryService {
public:
  StoreDiscovery(asio::io_context& io, std::shared_ptr<RegistryStore> store)
    : io_(io), store_(std::move(store)) {}

  void fetch_peers(const std::string& room, Callback cb) override {
    ++fetches;
    auto result = fail_next_ ? failure() : to_result(store_->get(room));
    fail_next_ = false;
    asio::post(io_, [cb, result](){ cb(result); });
  }

  void register_self(const std::string& room, const RoomUser& self, Callback cb) override {
    ++registrations;
    auto result = fail_next_ ? failure() : to_result(store_->put(room, self.peer_id, self.name));
    fail_next_ = false;
    asio::post(io_, [cb, result](){ cb(result); });
  }

  void remove_self(const std::string& room, const std::string& peer_id, Callback cb) override {
    ++removals;
    auto result = to_result(store_->remove(room, peer_id));
    asio::post(io_, [cb, result](){ cb(result); });
  }

  void fail_next() { fail_next_ = true; }

  std::size_t fetches = 0;
  std::size_t registrations = 0;
  std::size_t removals = 0;

private:
  static DiscoveryResult to_result(const std::vector<RegistryEntry>& entries) {
    DiscoveryResult result;
    result.ok = true;
    result.status = 200;
    for(const auto& entry : entries) {
      result.peers.push_back(RoomUser{entry.peer_id, entry.name});
    }
    return result;
  }

  static DiscoveryResult failure() {
    DiscoveryResult result;
    result.status = 503;
    result.error = "registry unavailable";
    return result;
  }

  asio::io_context& io_;
  std::shared_ptr<RegistryStore> store_;
  bool fail_next_ = false;
};

// Serves the first good_reads reads, then fails every read after.
class FailingByteSource : public ByteSource {
public:
  FailingByteSource(uint64_t size, std::size_t good_reads) : size_(size), good_reads_(good_reads) {}

  uint64_t size() const override { return size_; }

  bool read(uint64_t offset, std::size_t max_bytes, std::vector<std::uint8_t>& out, std::string& error) override {
    if(reads_++ >= good_reads_) {
      error = "simulated read failure";
      return false;
    }
    auto n = static_cast<std::size_t>(std::min<uint64_t>(max_bytes, size_ - offset));
    out.assign(n, static_cast<std::uint8_t>('x'));
    return true;
  }

private:
  uint64_t size_;
  std::size_t good_reads_;
  std::size_t reads_ = 0;
};

inline std::vector<std::uint8_t> patterned_bytes(std::size_t size) {
  std::vector<std::uint8_t> bytes(size);
  for(std::size_t i = 0; i < size; ++i) {
    bytes[i] = static_cast<std::uint8_t>((i * 31 + 7) & 0xff);
  }
  return bytes;
}

// Several room sessions in one process, wired through a loopback
// switchboard and a shared registry store, all on one io_context.
class LoopbackRoom {
public:
  struct Peer {
    std::string peer_id;
    std::shared_ptr<Logger> logger;
    std::shared_ptr<LoopbackSignaling> signaling;
    std::shared_ptr<RoomSession> session;
    std::vector<std::string> statuses;

    std::shared_ptr<MembershipEngine> membership() const { return session->membership(); }
    std::shared_ptr<TransferEngine> transfers() const { return session->transfers(); }
    std::shared_ptr<ChannelRegistry> channels() const { return session->channels(); }
    bool saw_status(const std::string& status) const {
      return std::find(statuses.begin(), statuses.end(), status) != statuses.end();
    }
  };

  LoopbackRoom()
    : board(io),
      store(std::make_shared<InMemoryRegistryStore>()),
      discovery(std::make_shared<StoreDiscovery>(io, store)) {}

  ~LoopbackRoom() {
    for(auto& peer : peers_) {
      peer->session->set_status_callback(nullptr);
    }
  }

  Peer& add(const std::string& peer_id, RoomSession::Options options = {}, LogCapture* logs = nullptr) {
    auto peer = std::make_unique<Peer>();
    peer->peer_id = peer_id;
    peer->logger = std::make_shared<Logger>(peer_id);
    if(logs) logs->attach(peer->logger, peer_id);
    peer->signaling = std::make_shared<LoopbackSignaling>(board, peer_id);
    peer->session = RoomSession::create(io, peer->signaling, discovery, options, peer->logger);
    Peer* raw = peer.get();
    peer->session->set_status_callback([raw](const std::string& status){
      raw->statuses.push_back(status);
    });
    peer->session->start();
    peers_.push_back(std::move(peer));
    return *raw;
  }

  // Joins and waits until the join completed.
  bool join(Peer& peer, const std::string& room, const std::string& name) {
    peer.session->join(room, name);
    return run_until(io, [&]{ return peer.membership()->joined(); });
  }

  bool run(std::function<bool()> predicate,
           std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    return run_until(io, std::move(predicate), timeout);
  }

  void settle() {
    for(int i = 0; i < 20; ++i) drain(io);
  }

  static bool roster_has(const Peer& peer, const std::string& peer_id) {
    return peer.membership()->find_member(peer_id).has_value();
  }

  asio::io_context io;
  LoopbackSwitchboard board;
  std::shared_ptr<InMemoryRegistryStore> store;
  std::shared_ptr<StoreDiscovery> discovery;

private:
  std::vector<std::unique_ptr<Peer>> peers_;
};

struct TestContext {
  LogCapture& logs;
  bool verbose = false;
};

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

#define ROOMDROP_CHECK(cond)                                                     \
  do {                                                                           \
    if(!(cond)) {                                                                \
      std::cerr << "    check failed: " #cond " (" << __FILE__ << ":" << __LINE__ \
                << ")\n";                                                        \
      return false;                                                              \
    }                                                                            \
  } while(0)

inline int run_test_cases(const std::string& suite, std::vector<TestCase> tests, int argc, char** argv) {
  bool verbose = (std::getenv("ROOMDROP_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("ROOMDROP_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  if(suppress_logs) {
    set_log_passthrough(false);
  }
  LogCapture logs;
  TestContext ctx{logs, verbose};

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    logs.detach_all();
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}

} // namespace roomdrop::test
