#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <cstring>
#include <filesystem>
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <system_error>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --datadir=<path>     Data directory (default: ~/.parley)\n"
      << "  --port=<port>        Listen port (default: 5050)\n"
      << "  --advertise=<ip>     IP announced to peers (default: 127.0.0.1)\n"
      << "  --nickname=<name>    Set profile nickname\n"
      << "  --connect=<pubkey>@<host:port>\n"
      << "                       Dial a contact at startup (repeatable)\n"
      << "  --noconsole          Do not read commands from stdin\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: network, auth, call, app, all\n"
      << "                       Can be comma-separated: --debug=network,auth\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    parley::app::AppConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << parley::GetFullVersionString() << std::endl;
        std::cout << parley::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (arg.find("--port=") == 0) {
        auto port_opt = parley::util::SafeParsePort(arg.substr(7));
        if (!port_opt) {
          std::cerr << "Error: Invalid port number: " << arg.substr(7) << std::endl;
          std::cerr << "Port must be a number between 1 and 65535" << std::endl;
          return 1;
        }
        config.listen_port = *port_opt;
      } else if (arg.find("--advertise=") == 0) {
        config.advertise_ip = arg.substr(12);
      } else if (arg.find("--nickname=") == 0) {
        config.nickname = arg.substr(11);
      } else if (arg.find("--connect=") == 0) {
        // <pubkey>@<address>
        std::string value = arg.substr(10);
        size_t at = value.find('@');
        if (at == std::string::npos || at == 0 || at + 1 == value.size()) {
          std::cerr << "Error: --connect expects <pubkey>@<host:port>" << std::endl;
          return 1;
        }
        config.connect.emplace_back(value.substr(0, at), value.substr(at + 1));
      } else if (arg == "--noconsole") {
        config.console = false;
      } else if (arg == "--verbose") {
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=network,auth
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

    // Ensure datadir exists before initializing file logger
    std::error_code ec;
    std::filesystem::create_directories(config.datadir, ec);
    if (ec) {
      std::cerr << "Error: cannot create " << config.datadir.string() << ": "
                << ec.message() << std::endl;
      return 1;
    }

    // Initialize logging system (enable file logging with debug.log)
    std::string log_file = (config.datadir / "debug.log").string();
    parley::util::LogManager::Initialize(log_level, true, log_file);

    // Apply component-specific debug levels
    for (const auto &component : debug_components) {
      if (component == "all") {
        parley::util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        parley::util::LogManager::SetComponentLevel("network", "trace");
      } else {
        parley::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    // IMPORTANT: Use nested scope to ensure app destructor runs before LogManager::Shutdown()
    // Session workers log until the messenger has joined them
    {
      parley::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        return 1;
      }

      if (!app.start()) {
        LOG_ERROR("Failed to start application");
        return 1;
      }

      // Run until /quit or a signal
      app.wait_for_shutdown();
    }

    parley::util::LogManager::Shutdown();

    return 0;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    parley::util::LogManager::Shutdown();
    return 1;
  }
}
