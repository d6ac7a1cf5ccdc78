#include <cpptrace/cpptrace.hpp>

#include <csignal>
#include <memory>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "relay_engine.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv){
  try {
    // Broken pipes from helper processes or the ssh socket surface as
    // EPIPE on the write instead of killing the watcher.
    std::signal(SIGPIPE, SIG_IGN);

    auto settings = std::make_shared<SettingsManager>();
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "skrins");
    parser.parse(argc, argv, *settings);
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    RelayEngine engine(settings, RelayEngine::Options{});
    auto logger = engine.logger();

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    engine.start();
    // No shutdown path: the process is stopped from outside.
    engine.run();
    engine.stop();

    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("skrins-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
