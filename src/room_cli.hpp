#pragma once
#include <asio.hpp>

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "log.hpp"
#include "room_session.hpp"
#include "settings_manager.hpp"

// Interactive front end. The reader thread only posts command lines into the
// io_context; every command runs on the io thread.
class RoomCli {
public:
  using QuitHandler = std::function<void()>;

  RoomCli(asio::io_context& io,
          std::shared_ptr<RoomSession> session,
          std::shared_ptr<SettingsManager> settings,
          std::shared_ptr<Logger> logger,
          QuitHandler on_quit);
  ~RoomCli();

  void start();
  void stop();

  // Must be called on the io thread.
  void execute(const std::string& line);
  void apply_setting_side_effects(const std::string& key);

  std::filesystem::path download_dir() const;

private:
  void run_loop(std::shared_ptr<std::atomic<bool>> running);
  std::optional<std::string> read_command_line(const char* prompt);

  void subscribe();
  void join_command(const std::vector<std::string>& args);
  void list_users();
  void send_command(const std::vector<std::string>& paths);
  void list_files();
  void save_command(const std::vector<std::string>& args);
  void print_status();
  void handle_settings_command(const std::vector<std::string>& args);
  void list_settings();
  void print_help();

  asio::io_context& io_;
  std::shared_ptr<RoomSession> session_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  QuitHandler on_quit_;
  std::shared_ptr<std::atomic<bool>> running_;
  std::shared_ptr<std::atomic<bool>> finished_;
  std::thread cli_thread_;
};
