#include <cpptrace/cpptrace.hpp>

#include <filesystem>
#include <memory>
#include <stdexcept>

#include "command_line_parser.hpp"
#include "console.hpp"
#include "daemon_config.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"
#include "ztalk_daemon.hpp"

namespace {

// Writes a freshly generated peer_id into the settings file without
// persisting anything that only came from the command line.
void persist_peer_id(const std::filesystem::path& path, const std::string& peer_id, Logger& logger) {
  SettingsManager on_disk;
  on_disk.set_settings_path(path);
  on_disk.load();
  std::string error;
  if(!on_disk.set_from_string("peer_id", peer_id, error) || !on_disk.save()) {
    logger.warn("Unable to persist peer_id to {}", path.string());
  }
}

} // namespace

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    if(auto config_path = CommandLineParser::find_config_path(argc, argv)) {
      settings->set_settings_path(*config_path);
    }
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0])
                               ? std::filesystem::path(argv[0]).filename().string()
                               : "ztalkd");
    try {
      parser.parse(argc, argv, *settings);
    } catch(const CommandLineError& e) {
      print_err(nullptr, "{}", e.what());
      parser.usage(*settings);
      return 2;
    }
    if(settings->help_requested()) {
      parser.usage(*settings);
      return 0;
    }

    LogOptions log_options;
    log_options.verbose = settings->get<bool>("verbose");
    log_options.log_file = settings->get<std::string>("log_file");
    init(log_options);
    auto logger = std::make_shared<Logger>("ztalkd-main");
    logger->debug("Verbose logging enabled");

    if(settings->get<std::string>("peer_id").empty()) {
      auto id = to_hex(random_uid());
      std::string error;
      if(!settings->set_from_string("peer_id", id, error)) {
        throw std::runtime_error("Unable to set peer_id: " + error);
      }
      persist_peer_id(settings->settings_path(), id, *logger);
      logger->info("Generated peer_id {}", id);
    }

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    auto config = make_daemon_config(*settings);
    bool interactive = settings->get<bool>("console");

    ZtalkDaemon::Options options;
    options.handle_signals = !interactive;
    ZtalkDaemon daemon(config, options);
    daemon.start();

    if(interactive) {
      Console console(daemon, settings, config.audio_notifications);
      console.run();
      daemon.stop();
    } else {
      daemon.run();
    }
    return 0;
  } catch(std::exception& e) {
    init();
    Logger logger("ztalkd-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
