#include "monitor/road_monitor.hpp"
#include "utils/args.hpp"
#include "utils/config.hpp"
#include "utils/debug.hpp"
#include "utils/signals.hpp"
#include "utils/logging.hpp"
#include <iostream>
#include <string>

using namespace std;

// version string for the application
const string version = "0.1.0";

int main(int argc, char **argv)
{
  // Check for help or version flags first
  if (hasFlag(argc, argv, "--version"))
    debug::printVersionAndExit(version);
  if (hasFlag(argc, argv, "--help"))
    debug::printHelpAndExit();

  bool debug_mode = hasFlag(argc, argv, "--debug") || hasFlag(argc, argv, "-d");
  bool quiet_mode = hasFlag(argc, argv, "--quiet") || hasFlag(argc, argv, "-q");

  if (debug_mode)
  {
    logging::setLogLevel(logging::LogLevel::DEBUG);
    logging::settings().showTimestamp = true;
    log_info("Debug mode enabled - showing all log messages");
  }
  else if (quiet_mode)
  {
    logging::setLogLevel(logging::LogLevel::ERROR);
  }

  // Explicit level wins over --debug/--quiet
  string log_level = getArg(argc, argv, "--log-level", "");
  if (!log_level.empty())
  {
    logging::LogLevel level;
    if (logging::parseLogLevel(log_level, level))
      logging::setLogLevel(level);
    else
      log_error("Unknown log level " + log_level + " (expected error, warning, info or debug)");
  }

  string log_file = getArg(argc, argv, "--log-file", "");
  if (!log_file.empty() && !logging::setFileLogging(true, log_file))
  {
    log_error("Cannot write log file " + log_file + ", logging to console only");
  }

  // Detector configuration: defaults <- config file <- command line
  DetectorConfig detector_config;
  string config_path = getArg(argc, argv, "--config", "");
  if (!config_path.empty() && !config::load(config_path, detector_config))
  {
    return 1;
  }

  string model_path = getArg(argc, argv, "--model", "");
  if (!model_path.empty())
    detector_config.model.modelPath = model_path;
  if (hasFlag(argc, argv, "--heuristic"))
    detector_config.heuristicOnly = true;

  double min_confidence = getArg(argc, argv, "--min-confidence", -1.0);
  if (min_confidence >= 0.0)
  {
    detector_config.modelMinConfidence = float(min_confidence);
    detector_config.heuristicMinConfidence = float(min_confidence);
  }

  if (hasFlag(argc, argv, "--print-config"))
  {
    cout << config::toJson(detector_config).dump(2) << endl;
    return 0;
  }

  MonitorOptions options;
  options.source = getArg(argc, argv, "--source", options.source);
  options.fps = getArg(argc, argv, "--fps", options.fps);
  options.cooldown = getArg(argc, argv, "--cooldown", options.cooldown);
  options.max_frames = getArg(argc, argv, "--max-frames", options.max_frames);
  options.json_output = hasFlag(argc, argv, "--json");

  if (!quiet_mode)
  {
    debug::printStartup("OpenPothole", version);
    debug::printConfig(options.source, detector_config.model.modelPath, detector_config.heuristicOnly,
                       options.fps, options.cooldown);
  }

  RoadMonitor monitor(options, detector_config, debug_mode);

  // Register signal handlers with a lambda to stop the monitor
  signals::setupSignalHandlers([&monitor]()
                               { monitor.stop(); });

  return monitor.run() ? 0 : 1;
}
