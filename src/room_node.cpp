#include "room_node.hpp"

#include <csignal>
#include <stdexcept>

#include "discovery_client.hpp"
#include "room_cli.hpp"
#include "room_session.hpp"
#include "settings_manager.hpp"
#include "tcp_signaling.hpp"

RoomNode::RoomNode(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("room-node")) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
}

RoomNode::~RoomNode() {
  stop();
  cli_.reset();
}

void RoomNode::ensure_workspace() const {
  std::error_code ec;
  std::filesystem::create_directories(options_.workspace_root, ec);
}

void RoomNode::start() {
  if(started_) return;
  started_ = true;

  ensure_workspace();

  settings_->set_settings_path(options_.workspace_root / ".config" / "settings.json");

  LogOptions log_options;
  log_options.verbose = settings_->get<bool>("verbose");
  log_options.log_file = settings_->get<std::string>("log_file");
  init(log_options);

  const std::string name = settings_->get<std::string>("name");
  if(!name.empty()) {
    logger_->set_name(name);
  }

  try {
    TcpSignaling::Options signaling_options;
    signaling_options.listen_ip = settings_->get<std::string>("listen_ip");
    signaling_options.listen_port = static_cast<uint16_t>(settings_->get<int>("listen_port"));
    signaling_options.advertise_host = settings_->get<std::string>("advertise_host");
    signaling_options.peer_token = settings_->get<std::string>("peer_id");
    signaling_options.retry_interval = std::chrono::milliseconds(settings_->get<int>("signaling_retry_ms"));
    signaling_options.handshake_timeout = std::chrono::milliseconds(settings_->get<int>("connect_timeout_ms"));
    signaling_ = std::make_shared<TcpSignaling>(io_, signaling_options, logger_);

    DiscoveryClient::Options discovery_options;
    discovery_options.base_url = settings_->get<std::string>("discovery_url");
    discovery_ = std::make_shared<DiscoveryClient>(io_, discovery_options, logger_);

    RoomSession::Options session_options;
    session_options.channels.connect_timeout = std::chrono::milliseconds(settings_->get<int>("connect_timeout_ms"));
    session_options.channels.send_queue_limit = static_cast<std::size_t>(settings_->get<int>("send_queue_limit"));
    session_options.transfer.chunk_size = static_cast<std::size_t>(settings_->get<int>("chunk_size"));
    session_options.transfer.transfer_debug = settings_->get<bool>("transfer_debug");
    session_ = RoomSession::create(io_, signaling_, discovery_, session_options, logger_);
    session_->start();
  } catch(const std::exception& e) {
    logger_->error("Unable to start node: {}", e.what());
    started_ = false;
    throw;
  }

  peer_id_ = session_->peer_id();
  listen_port_ = signaling_->listen_port();
  work_guard_.emplace(asio::make_work_guard(io_));

  if(options_.handle_signals) {
    signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
    signals_->async_wait([this](const std::error_code& ec, int signal_number){
      if(ec) return;
      logger_->info("Signal {} received, leaving", signal_number);
      shutdown_session();
    });
  }

  cli_ = std::make_unique<RoomCli>(io_, session_, settings_, logger_, [this](){ request_quit(); });
  if(options_.start_cli_thread) {
    cli_->start();
  }

  const std::string room = settings_->get<std::string>("room");
  if(settings_->get<bool>("auto_join") && !room.empty() && !name.empty()) {
    auto session = session_;
    asio::post(io_, [session, room, name](){ session->join(room, name); });
  }
}

void RoomNode::run() {
  if(!started_) start();
  io_.run();
}

void RoomNode::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_exited_ = std::promise<void>();
  io_done_ = io_exited_.get_future();
  io_thread_ = std::thread([this](){
    io_.run();
    io_exited_.set_value();
  });
}

void RoomNode::shutdown_session() {
  if(signals_) {
    std::error_code ignored;
    signals_->cancel(ignored);
  }
  if(session_) session_->stop();
  work_guard_.reset();
}

void RoomNode::request_quit() {
  asio::post(io_, [this](){ shutdown_session(); });
}

void RoomNode::stop() {
  if(!started_) return;
  started_ = false;

  if(cli_) {
    cli_->stop();
  }

  if(io_thread_.joinable()) {
    asio::post(io_, [this](){ shutdown_session(); });
    // run() returns once the leave traffic has drained
    if(io_done_.wait_for(options_.shutdown_grace) == std::future_status::timeout) {
      logger_->warn("Shutdown did not drain within {} ms", options_.shutdown_grace.count());
      io_.stop();
    }
    io_thread_.join();
  } else {
    io_.restart();
    asio::post(io_, [this](){ shutdown_session(); });
    io_.run_for(options_.shutdown_grace);
  }
  io_.restart();
}

void RoomNode::execute_command(const std::string& line) {
  if(!cli_) return;
  asio::post(io_, [this, line](){
    if(cli_) cli_->execute(line);
  });
}

RoomNode::Stats RoomNode::stats() {
  if(!session_) return {};
  return call([this](){
    Stats s;
    auto membership = session_->membership();
    s.roster = membership->roster();
    s.open_channels = session_->channels()->open_count();
    for(const auto& entry : session_->transfers()->history()) {
      if(!entry.completed) continue;
      if(entry.direction == HistoryEntry::Direction::Sent) {
        ++s.sent;
      } else {
        ++s.received;
      }
    }
    s.state = membership_state_name(membership->state());
    s.status = session_->status();
    return s;
  });
}

LogListenerHandle RoomNode::add_log_listener(Logger::Listener listener) {
  if(!logger_) return 0;
  return logger_->add_listener(std::move(listener));
}

void RoomNode::remove_log_listener(LogListenerHandle handle) {
  if(logger_ && handle != 0) {
    logger_->remove_listener(handle);
  }
}

void RoomNode::clear_log_listeners() {
  if(logger_) {
    logger_->clear_listeners();
  }
}
