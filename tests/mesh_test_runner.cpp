#include "log.hpp"
#include "registry_server.hpp"
#include "registry_store.hpp"
#include "room_node.hpp"
#include "settings_manager.hpp"
#include "tcp_signaling.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <array>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace roomdrop::test;

namespace {

struct RunnerConfig {
  std::filesystem::path root;
  std::filesystem::path peer_a_root;
  std::filesystem::path peer_b_root;
};

RunnerConfig prepare_workspace() {
  RunnerConfig cfg;
  cfg.root = std::filesystem::temp_directory_path() / "roomdrop_mesh_runner";
  cfg.peer_a_root = cfg.root / "peerA";
  cfg.peer_b_root = cfg.root / "peerB";
  std::error_code ec;
  std::filesystem::remove_all(cfg.root, ec);
  std::filesystem::create_directories(cfg.peer_a_root, ec);
  std::filesystem::create_directories(cfg.peer_b_root, ec);
  return cfg;
}

// A registry server on its own io thread, bound to an ephemeral port.
class RegistryFixture {
public:
  RegistryFixture()
    : store(std::make_shared<InMemoryRegistryStore>()) {
    RegistryServer::Options options;
    options.listen_ip = "127.0.0.1";
    options.listen_port = 0;
    server = std::make_shared<RegistryServer>(io, store, options, std::make_shared<Logger>("registry"));
    server->start();
    thread = std::thread([this]{ io.run(); });
  }

  ~RegistryFixture() {
    shutdown();
  }

  void shutdown() {
    if(!thread.joinable()) return;
    asio::post(io, [this]{ server->stop(); });
    thread.join();
  }

  std::string url() const {
    return "http://127.0.0.1:" + std::to_string(server->listen_port());
  }

  asio::io_context io;
  std::shared_ptr<InMemoryRegistryStore> store;
  std::shared_ptr<RegistryServer> server;
  std::thread thread;
};

std::shared_ptr<SettingsManager> node_settings(const std::filesystem::path& workspace,
                                               const std::string& name,
                                               const std::string& registry_url) {
  auto settings = std::make_shared<SettingsManager>();
  auto configure = [&](const std::string& key, const nlohmann::json& value){
    std::string error;
    if(!settings->set_from_json(key, value, error)) {
      throw std::runtime_error("Failed to set setting " + key + ": " + error);
    }
  };
  configure("listen_ip", "127.0.0.1");
  configure("listen_port", 0);
  configure("room", "lobby");
  configure("name", name);
  configure("auto_join", true);
  configure("discovery_url", registry_url);
  configure("download_dir", (workspace / "downloads").string());
  configure("transfer_debug", true);
  return settings;
}

bool wait_for_connection(RoomNode& a, RoomNode& b, bool verbose) {
  using namespace std::chrono_literals;
  const auto timeout = 5s;
  auto start = std::chrono::steady_clock::now();
  auto next_report = start;

  while(std::chrono::steady_clock::now() - start < timeout) {
    auto stats_a = a.stats();
    auto stats_b = b.stats();
    if(stats_a.open_channels >= 1 && stats_b.open_channels >= 1) {
      return true;
    }
    if(verbose && std::chrono::steady_clock::now() >= next_report) {
      std::cout << "    waiting... "
                << "A(" << stats_a.state << ", roster=" << stats_a.roster.size()
                << ", open=" << stats_a.open_channels << ") "
                << "B(" << stats_b.state << ", roster=" << stats_b.roster.size()
                << ", open=" << stats_b.open_channels << ")\n";
      next_report = std::chrono::steady_clock::now() + 500ms;
    }
    std::this_thread::sleep_for(50ms);
  }

  if(verbose) {
    auto stats_a = a.stats();
    auto stats_b = b.stats();
    std::cout << "    timeout waiting for connection. "
              << "A(" << stats_a.status << ") B(" << stats_b.status << ")\n";
  }
  return false;
}

bool test_two_nodes_share_a_file(TestContext& ctx) {
  using namespace std::chrono_literals;
  auto cfg = prepare_workspace();
  RegistryFixture registry;

  RoomNode::Options opt_a;
  opt_a.workspace_root = cfg.peer_a_root;
  opt_a.shutdown_grace = 2000ms;
  RoomNode node_a(node_settings(cfg.peer_a_root, "Alice", registry.url()), opt_a);
  ctx.logs.attach(node_a, "Alice");
  node_a.start();
  node_a.start_background();
  ROOMDROP_CHECK(wait_for_condition([&]{ return node_a.stats().state == "joined"; }, 3s));

  RoomNode::Options opt_b;
  opt_b.workspace_root = cfg.peer_b_root;
  opt_b.shutdown_grace = 2000ms;
  RoomNode node_b(node_settings(cfg.peer_b_root, "Bob", registry.url()), opt_b);
  ctx.logs.attach(node_b, "Bob");
  node_b.start();
  node_b.start_background();
  if(ctx.verbose) {
    std::cout << "    A is " << node_a.peer_id() << ", B is " << node_b.peer_id() << "\n";
  }

  bool connected = wait_for_connection(node_a, node_b, ctx.verbose);
  ROOMDROP_CHECK(connected);
  ROOMDROP_CHECK(wait_for_condition([&]{
    auto roster = node_a.stats().roster;
    return roster.size() == 1 && roster[0].name == "Bob";
  }, 3s));

  auto payload = patterned_bytes(200000);
  auto source = cfg.peer_a_root / "holiday photos.bin";
  {
    std::ofstream out(source, std::ios::binary);
    out.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
  }
  node_a.execute_command("send \"" + source.string() + "\"");

  auto saved = cfg.peer_b_root / "downloads" / "holiday photos.bin";
  ROOMDROP_CHECK(wait_for_condition([&]{ return node_b.stats().received == 1; }, 5s));
  ROOMDROP_CHECK(wait_for_condition([&]{ return std::filesystem::exists(saved); }, 2s));
  ROOMDROP_CHECK(wait_for_condition([&]{ return node_a.stats().sent == 1; }, 2s));

  std::ifstream in(saved, std::ios::binary);
  std::vector<std::uint8_t> received((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  ROOMDROP_CHECK(sha256_hex(received) == sha256_hex(payload));
  ROOMDROP_CHECK(ctx.logs.wait_for_substring("sha256 " + sha256_hex(payload), 2s));

  // an orderly stop announces the departure and deregisters
  node_b.stop();
  ROOMDROP_CHECK(wait_for_condition([&]{ return node_a.stats().roster.empty(); }, 3s));
  ROOMDROP_CHECK(node_a.stats().open_channels == 0);

  node_a.stop();
  ctx.logs.detach_all();
  registry.shutdown();
  ROOMDROP_CHECK(registry.store->get("lobby").empty());
  ROOMDROP_CHECK(registry.server->requests_served() >= 6);

  std::error_code ec;
  std::filesystem::remove_all(cfg.root, ec);
  return true;
}

bool test_registry_down_reports_failure(TestContext& ctx) {
  using namespace std::chrono_literals;
  auto cfg = prepare_workspace();

  // nothing listens on this port once the acceptor is gone
  uint16_t dead_port = 0;
  {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io, {asio::ip::make_address("127.0.0.1"), 0});
    dead_port = acceptor.local_endpoint().port();
  }

  RoomNode::Options opt;
  opt.workspace_root = cfg.peer_a_root;
  opt.shutdown_grace = 1000ms;
  RoomNode node(node_settings(cfg.peer_a_root, "Alice", "http://127.0.0.1:" + std::to_string(dead_port)), opt);
  ctx.logs.attach(node, "Alice");
  node.start();
  node.start_background();

  ROOMDROP_CHECK(wait_for_condition([&]{ return node.stats().status == "Failed to join room"; }, 5s));
  ROOMDROP_CHECK(node.stats().state == "uninitialized");

  node.stop();
  ctx.logs.detach_all();
  std::error_code ec;
  std::filesystem::remove_all(cfg.root, ec);
  return true;
}

// Sends one length-prefixed msgpack control frame and waits for the listener
// to hang up.
bool hello_is_refused(asio::io_context& io, uint16_t port, const nlohmann::json& hello) {
  asio::ip::tcp::socket sock(io);
  sock.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
  auto body = nlohmann::json::to_msgpack(hello);
  auto n = static_cast<std::uint32_t>(body.size());
  std::array<std::uint8_t, 4> header{static_cast<std::uint8_t>(n >> 24), static_cast<std::uint8_t>(n >> 16),
                                     static_cast<std::uint8_t>(n >> 8), static_cast<std::uint8_t>(n)};
  asio::write(sock, asio::buffer(header));
  asio::write(sock, asio::buffer(body));

  bool closed = false;
  std::array<char, 64> buf{};
  sock.async_read_some(asio::buffer(buf), [&](std::error_code ec, std::size_t){ closed = static_cast<bool>(ec); });
  return run_until(io, [&]{ return closed; });
}

bool test_listener_survives_bad_hello(TestContext& ctx) {
  asio::io_context io;
  auto logger = std::make_shared<Logger>("signaling");
  ctx.logs.attach(logger, "signaling");
  TcpSignaling::Options options;
  options.listen_ip = "127.0.0.1";
  auto signaling = std::make_shared<TcpSignaling>(io, options, logger);
  signaling->start();
  ROOMDROP_CHECK(signaling->listen_port() != 0);

  ROOMDROP_CHECK(hello_is_refused(io, signaling->listen_port(), {{"type", "hello"}, {"peerId", 5}}));
  ROOMDROP_CHECK(hello_is_refused(io, signaling->listen_port(), {{"type", 1}, {"peerId", "x@127.0.0.1:1"}}));
  ROOMDROP_CHECK(hello_is_refused(io, signaling->listen_port(), nlohmann::json::array({"hello"})));
  ROOMDROP_CHECK(ctx.logs.contains("Dropping connection without a valid hello"));
  ROOMDROP_CHECK(signaling->ready());

  signaling->stop();
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"two_nodes_share_a_file", test_two_nodes_share_a_file},
    {"registry_down_reports_failure", test_registry_down_reports_failure},
    {"listener_survives_bad_hello", test_listener_survives_bad_hello},
  };
  return run_test_cases("mesh", std::move(tests), argc, argv);
}
