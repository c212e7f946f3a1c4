#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>

#include <csignal>
#include <filesystem>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "registry_server.hpp"
#include "registry_store.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>(REGISTRY_SETTINGS_SPECIFICATION);
    settings->set_settings_path(std::filesystem::current_path() / ".config" / "registry.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "roomdrop-registry",
                             "Room registry: tracks which peers are in which room.",
                             {"listen_port", "listen_ip"});
    std::string error;
    if(!parser.parse(argc, argv, *settings, error)) {
      init();
      Logger logger("registry-main");
      logger.print_err("{}", error);
      parser.usage(*settings);
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage(*settings);
      return 0;
    }

    LogOptions log_options;
    log_options.verbose = settings->get<bool>("verbose");
    log_options.log_file = settings->get<std::string>("log_file");
    init(log_options);
    auto logger = std::make_shared<Logger>("registry");

    asio::io_context io;
    auto store = std::make_shared<InMemoryRegistryStore>(
        std::chrono::seconds(settings->get<int>("ttl_seconds")));

    RegistryServer::Options options;
    options.listen_ip = settings->get<std::string>("listen_ip");
    options.listen_port = static_cast<uint16_t>(settings->get<int>("listen_port"));
    options.sweep_interval = std::chrono::seconds(settings->get<int>("sweep_interval_seconds"));
    auto server = std::make_shared<RegistryServer>(io, store, options, logger);
    server->start();

    asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const std::error_code& ec, int signal_number){
      if(ec) return;
      logger->info("Signal {} received, shutting down after {} request(s)",
                   signal_number, server->requests_served());
      server->stop();
    });

    io.run();
    return 0;
  } catch(std::exception& e) {
    init();
    Logger logger("registry-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
