#include <cpptrace/cpptrace.hpp>
#include <filesystem>
#include <iostream>
#include <memory>

#include "ShareCLI.hpp"
#include "command_line_parser.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "share_engine.hpp"
#include "share_errors.hpp"
#include "utils.hpp"

// Moves a plain --password into the stored hash so it is never persisted.
bool absorb_password(SettingsManager& settings, Logger& logger) {
  auto password = settings.get<std::string>("password");
  if(password.empty()) return true;
  std::string error;
  if(!settings.set_value("password_hash", hash_password(password), error) ||
     !settings.set_value("password", std::string(), error)) {
    logger.error("Unable to store password: {}", error);
    return false;
  }
  return true;
}

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "lanshare");
    try {
      parser.parse(argc, argv, *settings);
    } catch(const CommandLineError& e) {
      std::cerr << e.what() << "\n";
      parser.usage(*settings);
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage(*settings);
      return 0;
    }

    init(settings->get<bool>("verbose"), settings->get<std::string>("log_file"));
    Logger logger("lanshare-main");
    if(!absorb_password(*settings, logger)) return 1;

    if(settings->save_requested()) {
      if(settings->save()) {
        logger.print("Saved settings to {}", settings->settings_path().string());
      } else {
        logger.error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    auto engine = std::make_shared<ShareEngine>(settings, ShareEngine::Options{});
    try {
      engine->start();
    } catch(const ServeError& e) {
      logger.error("Unable to share folder: {}", e.what());
      return 1;
    }

    logger.print("Sharing {}", engine->shared_folder().string());
    for(const auto& url : engine->local_urls()) {
      logger.print("  {}", url);
    }
    if(!engine->discovery_active()) {
      logger.warn("Peer discovery is unavailable; other machines can still use the URLs above");
    }
    logger.print("Type 'help' for a list of commands.");

    ShareCLI cli(engine, settings);
    cli.start();
    cli.wait();
    cli.stop();
    engine->stop();

    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("lanshare-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
