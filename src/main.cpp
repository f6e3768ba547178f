#include <cpptrace/cpptrace.hpp>
#include <filesystem>
#include <memory>
#include <string>

#include "archive_monitor.hpp"
#include "command_line_parser.hpp"
#include "monitor_snapshot.hpp"
#include "settings_manager.hpp"
#include "log.hpp"

int main(int argc, char** argv){
  try {
    ArchiveMonitor monitor(nullptr, ArchiveMonitor::Options{});
    auto settings = monitor.settings();
    auto logger = monitor.logger();
    settings->set_settings_path(std::filesystem::current_path() / ".config" / "archwatch.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "archwatch");
    std::string parse_error;
    if(!parser.parse(argc, argv, *settings, parse_error)) {
      print_err(logger.get(), "{}", parse_error);
      parser.usage(*settings);
      return 2;
    }
    if(settings->help_requested()) {
      parser.usage(*settings);
      return 0;
    }

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    if(settings->get<bool>("once")) {
      LogOptions log_options;
      log_options.verbose = settings->get<bool>("verbose");
      log_options.log_file = settings->get<std::string>("log_file");
      init(log_options);

      auto snapshot = monitor.poll_once();
      print_out(logger.get(), "{}", snapshot_json::to_json(*snapshot).dump(2));
      return 0;
    }

    const auto snapshot_file = settings->get<std::string>("snapshot_file");
    if(!snapshot_file.empty()) {
      monitor.add_snapshot_listener([logger, snapshot_file](const std::shared_ptr<const MonitorSnapshot>& snapshot){
        std::string error;
        if(!snapshot_json::write_file(*snapshot, snapshot_file, error)) {
          logger->warn("Snapshot not written: {}", error);
        }
      });
    }

    monitor.start();
    monitor.run();
    monitor.stop();

    return 0;
  } catch(std::exception& e) {
    init();
    Logger logger("archwatch-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
