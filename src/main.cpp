#include "server/preview_server.hpp"
#include "utils/config.hpp"
#include "utils/port_reaper.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <termcolor/termcolor.hpp>

namespace fs = std::filesystem;

struct CliOptions {
  std::optional<fs::path> config_file;
  std::optional<std::string> host;
  std::optional<int> port;
  std::optional<fs::path> root;
  bool no_reclaim = false;
  bool verbose = false;
  bool help = false;
};

void print_usage() {
  std::cout << "preview - serve the current directory on a fixed port\n\n";
  std::cout << "Usage: preview [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --port <n>        Port to serve on (default "
            << PreviewConfig::DEFAULT_PORT << ")\n";
  std::cout << "  --host <addr>     IPv4 address to bind (default 0.0.0.0)\n";
  std::cout << "  --root <dir>      Directory to serve (default: current)\n";
  std::cout << "  --config <file>   Read settings from a YAML file\n";
  std::cout << "                    (default: ./" << PreviewConfig::DEFAULT_FILE
            << " if present)\n";
  std::cout << "  --no-reclaim      Do not stop the process holding the port\n";
  std::cout << "  --verbose         Log how request paths are resolved\n";
  std::cout << "  --help            Show this help\n";
}

static CliOptions parse_args(int argc, char *argv[]) {
  CliOptions options;

  auto value_of = [&](int &i, const std::string &flag) -> std::string {
    if (i + 1 >= argc) {
      throw std::runtime_error("Missing value for " + flag);
    }
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      options.help = true;
    } else if (arg == "--port" || arg == "-p") {
      options.port = PreviewConfig::parse_port(value_of(i, arg));
    } else if (arg == "--host") {
      options.host = value_of(i, arg);
    } else if (arg == "--root") {
      options.root = fs::path(value_of(i, arg));
    } else if (arg == "--config") {
      options.config_file = fs::path(value_of(i, arg));
    } else if (arg == "--no-reclaim") {
      options.no_reclaim = true;
    } else if (arg == "--verbose") {
      options.verbose = true;
    } else {
      throw std::runtime_error("Unknown option: " + arg);
    }
  }

  return options;
}

static PreviewConfig resolve_config(const CliOptions &options) {
  PreviewConfig config;
  config.root = fs::current_path();

  if (options.config_file) {
    config = PreviewConfig::load(*options.config_file, config);
  } else if (fs::exists(PreviewConfig::DEFAULT_FILE)) {
    config = PreviewConfig::load(PreviewConfig::DEFAULT_FILE, config);
  }

  if (options.host)
    config.host = *options.host;
  if (options.port)
    config.port = *options.port;
  if (options.root)
    config.root = *options.root;
  if (options.no_reclaim)
    config.reclaim = false;
  if (options.verbose)
    config.verbose = true;

  config.root = fs::absolute(config.root);
  return config;
}

static void reclaim_port(int port) {
  PortReaper reaper;
  ReclaimResult result = reaper.reclaim(port);

  for (const auto &failure : result.failures) {
    std::cout << termcolor::bright_yellow << "  ⚠ " << termcolor::reset
              << "Port check: " << failure << "\n";
  }

  if (result.outcome == ReclaimOutcome::NoListener) {
    std::cout << termcolor::bright_green << "  ✓ " << termcolor::reset
              << "Port " << termcolor::white << port << termcolor::reset
              << " is free\n";
    return;
  }

  std::cout << termcolor::bright_green << "  ✓ " << termcolor::reset
            << "Reclaimed port " << termcolor::white << port
            << termcolor::reset << " (killed pid";
  for (pid_t pid : result.terminated) {
    std::cout << " " << pid;
  }
  std::cout << ")\n";
}

static void print_banner(const PreviewConfig &config) {
  std::cout << "\n"
            << termcolor::bright_cyan
            << "╔════════════════════════════════════════╗\n"
            << "║          Preview Server                ║\n"
            << "╚════════════════════════════════════════╝" << termcolor::reset
            << "\n\n";

  std::cout << termcolor::bright_blue << "    " << termcolor::reset
            << "Directory: " << termcolor::white << config.root.string()
            << termcolor::reset << "\n";
  std::cout << termcolor::bright_blue << "    " << termcolor::reset
            << "Local:     " << termcolor::bright_cyan << config.url()
            << termcolor::reset << "\n\n";
  std::cout << termcolor::bright_blue << "Press Ctrl+C to stop"
            << termcolor::reset << "\n\n";
}

int main(int argc, char *argv[]) {
  try {
    CliOptions options = parse_args(argc, argv);
    if (options.help) {
      print_usage();
      return 0;
    }

    PreviewConfig config = resolve_config(options);

    if (config.reclaim) {
      reclaim_port(config.port);
    }

    print_banner(config);

    PreviewServer server(config.host, config.verbose);
    return server.run(config.port, config.root);

  } catch (const std::exception &e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }
}
