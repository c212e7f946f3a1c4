#include "room_cli.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <iomanip>
#include <sstream>

#ifdef HAVE_READLINE
#include <readline/readline.h>
#include <readline/history.h>
#endif

#include "utils.hpp"

namespace {

void trim(std::string& s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  s.erase(std::find_if(s.rbegin(), s.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), s.end());
}

std::vector<std::string> split_args(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream iss(text);
  std::string token;
  // double quotes keep paths with spaces together
  while(iss >> std::quoted(token)) out.push_back(token);
  return out;
}

std::string rest_of_line(std::istringstream& iss) {
  std::string rest;
  std::getline(iss, rest);
  trim(rest);
  return rest;
}

} // namespace

RoomCli::RoomCli(asio::io_context& io,
                 std::shared_ptr<RoomSession> session,
                 std::shared_ptr<SettingsManager> settings,
                 std::shared_ptr<Logger> logger,
                 QuitHandler on_quit)
: io_(io),
  session_(std::move(session)),
  settings_(std::move(settings)),
  logger_(std::move(logger)),
  on_quit_(std::move(on_quit)),
  running_(std::make_shared<std::atomic<bool>>(false)),
  finished_(std::make_shared<std::atomic<bool>>(false))
{
  subscribe();
}

RoomCli::~RoomCli() {
  stop();
  session_->set_status_callback(nullptr);
  session_->membership()->set_roster_callback(nullptr);
  session_->transfers()->set_incoming_complete_callback(nullptr);
  session_->transfers()->set_outgoing_finished_callback(nullptr);
}

void RoomCli::start() {
  if(running_->load()) return;
  running_->store(true);
  finished_->store(false);
  auto running = running_;
  cli_thread_ = std::thread([this, running](){ run_loop(running); });
}

void RoomCli::stop() {
  running_->store(false);
  if(!cli_thread_.joinable()) return;
  // A reader blocked on stdin cannot be interrupted; let it exit on its own.
  if(finished_->load()) {
    cli_thread_.join();
  } else {
    cli_thread_.detach();
  }
}

void RoomCli::run_loop(std::shared_ptr<std::atomic<bool>> running) {
  auto finished = finished_;
  while(running->load()) {
    auto input = read_command_line("> ");
    if(!input) {
      if(running->load()) {
        asio::post(io_, [this](){ if(on_quit_) on_quit_(); });
      }
      break;
    }
    if(!running->load()) break;
    trim(*input);
    if(input->empty()) continue;
    asio::post(io_, [this, running, line = *input](){
      if(running->load()) execute(line);
    });
  }
  finished->store(true);
}

std::optional<std::string> RoomCli::read_command_line(const char* prompt) {
#ifdef HAVE_READLINE
  char* line = readline(prompt);
  if(!line) return std::nullopt;
  std::string result(line);
  if(!result.empty()) add_history(result.c_str());
  free(line);
  return result;
#else
  std::cout << prompt;
  std::cout.flush();
  std::string line;
  if(!std::getline(std::cin, line)) return std::nullopt;
  return line;
#endif
}

void RoomCli::subscribe() {
  auto logger = logger_;
  session_->set_status_callback([logger](const std::string& status){
    print_out(logger.get(), "* {}", status);
  });

  auto membership = session_->membership();
  membership->set_roster_callback([logger](const std::vector<RoomUser>& roster){
    log_debug(logger.get(), "Roster now has {} member(s)", roster.size());
  });

  auto transfers = session_->transfers();
  transfers->set_incoming_complete_callback([this](const IncomingTransfer& transfer){
    std::filesystem::path written;
    std::string error;
    const auto& meta = transfer.metadata;
    if(!session_->transfers()->save_incoming(meta.file_id, download_dir(), written, error)) {
      print_err(logger_.get(), "Received {} from {} but could not save it: {}",
                meta.name, meta.sender_name, error);
      return;
    }
    print_out(logger_.get(), "Received {} ({}) from {} -> {} sha256={}",
              meta.name, format_bytes(meta.size), meta.sender_name,
              written.string(), sha256_hex(transfer.artifact));
  });
  transfers->set_outgoing_finished_callback([logger](const OutgoingTransfer& transfer){
    if(transfer.state == OutgoingState::Completed) {
      print_out(logger.get(), "Sent {} ({})", transfer.metadata.name, format_bytes(transfer.metadata.size));
    } else {
      print_err(logger.get(), "Sending {} was aborted", transfer.metadata.name);
    }
  });
}

std::filesystem::path RoomCli::download_dir() const {
  std::string dir = settings_ ? settings_->get<std::string>("download_dir") : std::string("downloads");
  if(dir.empty()) dir = "downloads";
  return std::filesystem::path(dir);
}

void RoomCli::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string cmd;
  iss >> cmd;
  cmd = SettingsManager::to_lower(cmd);

  if(cmd == "join" || cmd == "j") {
    join_command(split_args(rest_of_line(iss)));
  } else if(cmd == "leave") {
    session_->leave();
  } else if(cmd == "users" || cmd == "who") {
    list_users();
  } else if(cmd == "send") {
    send_command(split_args(rest_of_line(iss)));
  } else if(cmd == "resend") {
    auto args = split_args(rest_of_line(iss));
    if(args.empty()) {
      print_out(logger_.get(), "Usage: resend <fileId>");
      return;
    }
    if(!session_->resend(args.front())) {
      print_out(logger_.get(), "Cannot resend {}", args.front());
    }
  } else if(cmd == "files" || cmd == "history") {
    list_files();
  } else if(cmd == "save") {
    save_command(split_args(rest_of_line(iss)));
  } else if(cmd == "status") {
    print_status();
  } else if(cmd == "settings" || cmd == "s") {
    auto args = split_args(rest_of_line(iss));
    if(args.empty()) args.push_back("list");
    handle_settings_command(args);
  } else if(cmd == "set") {
    auto rest = rest_of_line(iss);
    if(rest.empty()) {
      list_settings();
    } else {
      std::istringstream set_iss(rest);
      std::string key;
      set_iss >> key;
      handle_settings_command({"set", key, rest_of_line(set_iss)});
    }
  } else if(cmd == "get") {
    auto args = split_args(rest_of_line(iss));
    args.insert(args.begin(), "get");
    handle_settings_command(args);
  } else if(cmd == "help" || cmd == "h" || cmd == "?") {
    print_help();
  } else if(cmd == "quit" || cmd == "exit") {
    print_out(logger_.get(), "Quitting...");
    if(on_quit_) on_quit_();
  } else {
    print_help();
    print_out(logger_.get(), "Unknown command: {}", cmd);
  }
}

void RoomCli::join_command(const std::vector<std::string>& args) {
  std::string room = settings_->get<std::string>("room");
  std::string name = settings_->get<std::string>("name");
  if(args.size() >= 1) room = args[0];
  if(args.size() >= 2) {
    name.clear();
    for(std::size_t i = 1; i < args.size(); ++i) {
      if(i > 1) name += ' ';
      name += args[i];
    }
  }
  if(room.empty()) {
    print_out(logger_.get(), "Usage: join <room> [name]");
    return;
  }
  std::string error;
  if(!settings_->set_from_string("room", room, error) ||
     !settings_->set_from_string("name", name, error)) {
    print_err(logger_.get(), "Invalid join arguments: {}", error);
    return;
  }
  session_->join(room, name);
}

void RoomCli::list_users() {
  auto membership = session_->membership();
  if(!membership->active()) {
    print_out(logger_.get(), "Not in a room.");
    return;
  }
  auto channels = session_->channels();
  print_out(logger_.get(), "Room {} ({} member(s) besides you)", membership->room(), membership->roster().size());
  print_out(logger_.get(), "  {} [you] {}", membership->self().name, membership->self().peer_id);
  for(const auto& user : membership->roster()) {
    auto state = channels->state(user.peer_id);
    print_out(logger_.get(), "  {} {} ({})", user.name, user.peer_id,
              state ? channel_state_name(*state) : "no channel");
  }
}

void RoomCli::send_command(const std::vector<std::string>& paths) {
  if(paths.empty()) {
    print_out(logger_.get(), "Usage: send <path> [path...]");
    return;
  }
  for(const auto& path : paths) {
    auto file_id = session_->send_file(path);
    if(file_id) {
      print_out(logger_.get(), "Queued {} as {}", path, *file_id);
    }
  }
}

void RoomCli::list_files() {
  auto entries = session_->transfers()->history();
  if(entries.empty()) {
    print_out(logger_.get(), "No transfers yet.");
    return;
  }
  for(const auto& entry : entries) {
    const bool sent = entry.direction == HistoryEntry::Direction::Sent;
    print_out(logger_.get(), "{} {} {} {} {} {} {}",
              sent ? "->" : "<-",
              entry.metadata.file_id,
              entry.metadata.name,
              format_bytes(entry.metadata.size),
              entry.state,
              format_percent(entry.percent),
              sent ? std::string() : "from " + entry.metadata.sender_name);
  }
}

void RoomCli::save_command(const std::vector<std::string>& args) {
  if(args.empty()) {
    print_out(logger_.get(), "Usage: save <fileId> [dir]");
    return;
  }
  std::filesystem::path dir = args.size() >= 2 ? std::filesystem::path(args[1]) : download_dir();
  std::filesystem::path written;
  std::string error;
  if(session_->transfers()->save_incoming(args[0], dir, written, error)) {
    print_out(logger_.get(), "Saved {}", written.string());
  } else {
    print_err(logger_.get(), "Cannot save {}: {}", args[0], error);
  }
}

void RoomCli::print_status() {
  auto membership = session_->membership();
  print_out(logger_.get(), "peer id: {}", session_->peer_id());
  print_out(logger_.get(), "signaling: {}", session_->signaling()->ready() ? "ready" : "not ready");
  print_out(logger_.get(), "membership: {}", membership_state_name(membership->state()));
  if(membership->active()) {
    print_out(logger_.get(), "room: {} as {}", membership->room(), membership->self().name);
  }
  print_out(logger_.get(), "open channels: {}", session_->channels()->open_count());
  auto transfers = session_->transfers();
  print_out(logger_.get(), "transfers: {}", transfers->busy() ? "streaming" : "idle");
  if(!session_->status().empty()) {
    print_out(logger_.get(), "status: {}", session_->status());
  }
}

void RoomCli::handle_settings_command(const std::vector<std::string>& args) {
  if(!settings_) {
    print_out(logger_.get(), "Settings manager unavailable.");
    return;
  }
  const std::string action = args.empty() ? "list" : args[0];

  if(action == "list") {
    list_settings();
    return;
  }

  if(action == "get") {
    if(args.size() < 2) {
      print_out(logger_.get(), "Usage: settings get <key>");
      return;
    }
    auto resolved = settings_->resolve_key(args[1]);
    if(!resolved) {
      print_out(logger_.get(), "Unknown setting '{}'.", args[1]);
      return;
    }
    print_out(logger_.get(), "{} = {}", *resolved, settings_->value_as_string(*resolved));
    return;
  }

  if(action == "set") {
    if(args.size() < 3 || args[1].empty() || args[2].empty()) {
      print_out(logger_.get(), "Usage: settings set <key> <value>");
      return;
    }
    auto resolved = settings_->resolve_key(args[1]);
    if(!resolved) {
      print_out(logger_.get(), "Unknown setting '{}'.", args[1]);
      return;
    }
    std::string value = args[2];
    for(std::size_t i = 3; i < args.size(); ++i) value += " " + args[i];
    std::string error;
    if(settings_->set_from_string(*resolved, value, error)) {
      apply_setting_side_effects(*resolved);
      print_out(logger_.get(), "{} = {}", *resolved, settings_->value_as_string(*resolved));
    } else {
      print_out(logger_.get(), "Failed to set {}: {}", *resolved, error);
    }
    return;
  }

  if(action == "save") {
    if(settings_->save()) {
      print_out(logger_.get(), "Saved settings to {}", settings_->settings_path().string());
    } else {
      print_out(logger_.get(), "Failed to save settings.");
    }
    return;
  }

  if(action == "load") {
    if(settings_->load()) {
      apply_setting_side_effects("transfer_debug");
      apply_setting_side_effects("verbose");
      print_out(logger_.get(), "Loaded settings from {}", settings_->settings_path().string());
    } else {
      print_out(logger_.get(), "Settings file not found.");
    }
    return;
  }

  print_out(logger_.get(), "Unknown settings command.");
}

void RoomCli::list_settings() {
  if(!settings_) return;
  auto keys = settings_->keys();
  std::sort(keys.begin(), keys.end());
  for(const auto& key : keys) {
    print_out(logger_.get(), "{} = {}", key, settings_->value_as_string(key));
  }
}

void RoomCli::apply_setting_side_effects(const std::string& key) {
  if(!settings_) return;
  if(key == "transfer_debug") {
    session_->set_transfer_debug(settings_->get<bool>("transfer_debug"));
  } else if(key == "verbose" || key == "log_file") {
    LogOptions options;
    options.verbose = settings_->get<bool>("verbose");
    options.log_file = settings_->get<std::string>("log_file");
    init(options);
  }
}

void RoomCli::print_help() {
  print_out(logger_.get(), "Available commands:");
  print_out(logger_.get(), "  help|h|?                          Show this help message");
  print_out(logger_.get(), "  quit                              Leave the room and exit");
  print_out(logger_.get(), "  join [room] [name]                Join a room (defaults from settings)");
  print_out(logger_.get(), "  leave                             Leave the current room");
  print_out(logger_.get(), "  users|who                         List room members and channel states");
  print_out(logger_.get(), "  send <path> [path...]             Send files to everyone in the room");
  print_out(logger_.get(), "  resend <fileId>                   Stream a sent file again");
  print_out(logger_.get(), "  files|history                     Show sent and received files");
  print_out(logger_.get(), "  save <fileId> [dir]               Write a received file to disk");
  print_out(logger_.get(), "  status                            Show session state");
  print_out(logger_.get(), "  settings [list|get|set|save|load] Manage runtime settings");
  print_out(logger_.get(), "  set [key value]                   Shortcut for settings set (lists when empty)");
  print_out(logger_.get(), "  get <key>                         Shortcut for settings get");
}
