#include <cpptrace/cpptrace.hpp>

#include <cstring>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "room_node.hpp"
#include "settings_manager.hpp"

std::string get_unique_display_name() {
    char hostname[256];
    if(gethostname(hostname, sizeof(hostname)) != 0) {
        std::strcpy(hostname, "UnknownHost");
    }
    std::stringstream ss;
    ss << hostname << "-" << getpid();
    return ss.str();
}

int main(int argc, char** argv){
  try {
    RoomNode::Options options;
    options.workspace_root = std::filesystem::current_path();
    options.start_cli_thread = true;
    options.handle_signals = true;

    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(options.workspace_root / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "roomdrop",
                             "Share files with everyone in a room over direct peer channels.",
                             {"room", "name", "discovery_url"});
    std::string error;
    if(!parser.parse(argc, argv, *settings, error)) {
      init();
      Logger logger("roomdrop-main");
      logger.print_err("{}", error);
      parser.usage(*settings);
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage(*settings);
      return 0;
    }

    if(settings->get<std::string>("name").empty() &&
       !settings->set_from_string("name", get_unique_display_name(), error)) {
      throw std::runtime_error("Unable to choose a display name: " + error);
    }

    if(settings->save_requested()) {
      if(!settings->save()) {
        init();
        Logger logger("roomdrop-main");
        logger.error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    RoomNode node(settings, options);
    node.start();
    node.logger()->print("Peer id: {}", node.peer_id());
    node.run();
    node.stop();

    return 0;
  } catch(std::exception& e) {
    init();
    Logger logger("roomdrop-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
