#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include "log.hpp"
#include "protocol.hpp"

class DiscoveryClient;
class RoomCli;
class RoomSession;
class SettingsManager;
class TcpSignaling;

// A complete participant process: TCP signaling, HTTP discovery, the room
// session and the command interface, all driven by one io_context.
class RoomNode {
public:
  struct Options {
    bool start_cli_thread = false;
    // Leave the room on SIGINT/SIGTERM.
    bool handle_signals = false;
    std::filesystem::path workspace_root = std::filesystem::current_path();
    // How long stop() keeps the io_context running to deliver user-left and
    // the registry removal.
    std::chrono::milliseconds shutdown_grace{6000};
  };

  RoomNode(std::shared_ptr<SettingsManager> settings, Options options);
  ~RoomNode();

  // Throws when the node cannot be configured or the listening socket cannot
  // be opened.
  void start();
  void run();
  void start_background();
  void stop();
  // Leaves the room and lets run() return once pending I/O has drained.
  void request_quit();

  void execute_command(const std::string& line);

  // Runs fn on the io thread and returns its result.
  template<typename Fn>
  auto call(Fn fn) -> decltype(fn());

  struct Stats {
    std::vector<RoomUser> roster;
    std::size_t open_channels = 0;
    std::size_t sent = 0;
    std::size_t received = 0;
    std::string state;
    std::string status;
  };

  Stats stats();

  LogListenerHandle add_log_listener(Logger::Listener listener);
  void remove_log_listener(LogListenerHandle handle);
  void clear_log_listeners();

  asio::io_context& io() { return io_; }
  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<RoomSession> session() const { return session_; }
  const std::string& peer_id() const { return peer_id_; }
  uint16_t listen_port() const { return listen_port_; }
  const std::filesystem::path& workspace_root() const { return options_.workspace_root; }

private:
  using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

  void ensure_workspace() const;
  void shutdown_session();
  bool io_thread_running() const { return io_thread_.joinable(); }

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::optional<WorkGuard> work_guard_;
  std::thread io_thread_;
  std::promise<void> io_exited_;
  std::future<void> io_done_;
  std::shared_ptr<TcpSignaling> signaling_;
  std::shared_ptr<DiscoveryClient> discovery_;
  std::shared_ptr<RoomSession> session_;
  std::unique_ptr<RoomCli> cli_;
  std::unique_ptr<asio::signal_set> signals_;
  bool started_ = false;
  std::string peer_id_;
  uint16_t listen_port_ = 0;
};

template<typename Fn>
auto RoomNode::call(Fn fn) -> decltype(fn()) {
  using Result = decltype(fn());
  if(!io_thread_running() || io_.get_executor().running_in_this_thread()) {
    return fn();
  }
  auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
  auto future = task->get_future();
  asio::post(io_, [task](){ (*task)(); });
  return future.get();
}
