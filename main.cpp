#include "./lib.cpp" // Include all definitions from lib.cpp

// Standard Headers needed by main itself
#include <exception>
#include <iostream> // For std::cin, std::cout
#include <memory>   // For std::make_unique

int main(int argc, char *argv[]) {
  // 1. Parse Arguments
  Config config = parse_arguments(argc, argv);

  // 2. Setup Logging
  TeeLogSink log;
  log.add(std::make_unique<ConsoleLogSink>(config.verbose));
  if (!config.logFile.empty()) {
    auto file_sink = std::make_unique<FileLogSink>(config.logFile, config.verbose);
    if (file_sink->is_open()) {
      log.add(std::move(file_sink));
    } else {
      log.warning("Could not open log file: " + normalize_path(config.logFile));
    }
  }

  // 3. Run, asking on the terminal for anything the arguments left out
  ConsolePrompter prompter(std::cin, std::cout);
  try {
    return run_application(config, prompter, log);
  } catch (const std::exception &e) {
    log.error(std::string("Unhandled exception during processing: ") +
              e.what());
    return 1;
  }
}
