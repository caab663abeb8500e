#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <cstring>
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <filesystem>
#include <system_error>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --datadir=<path>     Data directory (default: ~/.topowatch)\n"
      << "  --inventory=<path>   Inventory document (default: <datadir>/inventory.json)\n"
      << "  --once               Run a single discovery round and exit\n"
      << "  --interval=<sec>     Seconds between rounds (default: inventory scan_interval)\n"
      << "\n"
      << "Discovery:\n"
      << "  --probetimeout=<ms>  Per-probe timeout (default: 10000)\n"
      << "  --maxconcurrency=<n> Probe tasks run in parallel (default: 8)\n"
      << "  --maxretries=<n>     Retries for timed out probes (default: 2)\n"
      << "  --rounddeadline=<s>  Deadline for a whole round (default: 120)\n"
      << "\n"
      << "Lifecycle:\n"
      << "  --warnafter=<sec>    Unseen time before a device is WARNING (default: 300)\n"
      << "  --grace=<sec>        Unseen time before a device is OFFLINE (default: 900)\n"
      << "  --retention=<sec>    Unseen time before a device is removed (default: 86400)\n"
      << "  --history=<n>        Snapshots kept for diffs (default: 64)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: discovery, resolver, graph, analytics,\n"
      << "                       storage, app, all\n"
      << "                       Can be comma-separated: --debug=discovery,graph\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

namespace {

// Parse "--name=<int>" within [min, max]; prints the error itself
bool ParseIntOption(const std::string &arg, size_t prefix_len, int min, int max, int &out) {
  auto value = topowatch::util::SafeParseInt(arg.substr(prefix_len), min, max);
  if (!value) {
    std::cerr << "Error: Invalid value for " << arg.substr(0, prefix_len - 1) << ": "
              << arg.substr(prefix_len) << std::endl;
    std::cerr << "Value must be a number between " << min << " and " << max << std::endl;
    return false;
  }
  out = *value;
  return true;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    topowatch::app::AppConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;
    auto &round = config.engine.round;
    auto &lifecycle = config.engine.lifecycle;
    int value = 0;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << topowatch::GetFullVersionString() << std::endl;
        std::cout << topowatch::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (arg.find("--inventory=") == 0) {
        config.inventory_path = arg.substr(12);
      } else if (arg == "--once") {
        config.once = true;
      } else if (arg.find("--interval=") == 0) {
        if (!ParseIntOption(arg, 11, 1, 86400, config.interval)) {
          return 1;
        }
      } else if (arg.find("--probetimeout=") == 0) {
        if (!ParseIntOption(arg, 15, 100, 600000, value)) {
          return 1;
        }
        round.probe_timeout = std::chrono::milliseconds(value);
      } else if (arg.find("--maxconcurrency=") == 0) {
        if (!ParseIntOption(arg, 17, 1, 256, value)) {
          return 1;
        }
        round.max_concurrency = static_cast<size_t>(value);
      } else if (arg.find("--maxretries=") == 0) {
        if (!ParseIntOption(arg, 13, 0, 10, round.max_retries)) {
          return 1;
        }
      } else if (arg.find("--rounddeadline=") == 0) {
        if (!ParseIntOption(arg, 16, 1, 86400, value)) {
          return 1;
        }
        round.round_deadline = std::chrono::seconds(value);
      } else if (arg.find("--warnafter=") == 0) {
        if (!ParseIntOption(arg, 12, 1, 31536000, value)) {
          return 1;
        }
        lifecycle.warning_after = value;
      } else if (arg.find("--grace=") == 0) {
        if (!ParseIntOption(arg, 8, 1, 31536000, value)) {
          return 1;
        }
        lifecycle.grace_period = value;
      } else if (arg.find("--retention=") == 0) {
        if (!ParseIntOption(arg, 12, 1, 31536000, value)) {
          return 1;
        }
        lifecycle.retention_period = value;
      } else if (arg.find("--history=") == 0) {
        if (!ParseIntOption(arg, 10, 1, 4096, value)) {
          return 1;
        }
        config.engine.history_depth = static_cast<size_t>(value);
      } else if (arg == "--verbose") {
        config.verbose = true;
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=discovery,graph
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            debug_components.push_back(components.substr(pos));
            break;
          }
          debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    if (!(lifecycle.warning_after < lifecycle.grace_period &&
          lifecycle.grace_period <= lifecycle.retention_period)) {
      std::cerr << "Error: Lifecycle periods must satisfy warnafter < grace <= retention"
                << std::endl;
      return 1;
    }

    // Ensure datadir exists before initializing file logger
    std::error_code ec;
    std::filesystem::create_directories(config.datadir, ec);
    if (ec) {
      std::cerr << "Error: Cannot create data directory " << config.datadir.string() << ": "
                << ec.message() << std::endl;
      return 1;
    }
    // Initialize logging system (enable file logging with topowatch.log)
    std::string log_file = (config.datadir / "topowatch.log").string();
    topowatch::util::LogManager::Initialize(log_level, true, log_file);

    // Apply component-specific debug levels
    for (const auto& component : debug_components) {
      if (component == "all") {
        topowatch::util::LogManager::SetLogLevel("trace");
      } else if (component == "disc") {
        topowatch::util::LogManager::SetComponentLevel("discovery", "trace");
      } else {
        topowatch::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    int exit_code = 0;

    // IMPORTANT: Use nested scope to ensure app destructor runs before LogManager::Shutdown()
    // This prevents probe threads from logging after the logger is destroyed
    {
      topowatch::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        topowatch::util::LogManager::Shutdown();
        return 1;
      }

      if (config.once) {
        auto report = app.run_round();
        exit_code = report.ok() ? 0 : 2;
      } else {
        if (!app.start()) {
          LOG_ERROR("Failed to start application");
          topowatch::util::LogManager::Shutdown();
          return 1;
        }

        // Run until shutdown requested
        app.wait_for_shutdown();
      }

      // app destructor runs here, joining the round thread
    }

    // Shutdown logging AFTER app is fully destroyed
    topowatch::util::LogManager::Shutdown();

    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    topowatch::util::LogManager::Shutdown();
    return 1;
  }
}
