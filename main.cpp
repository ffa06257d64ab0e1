#include <cstdlib>
#include <exception>
#include <iostream>
#include <string_view>
#include <utility>

#include "config.hpp"
#include "debug.hpp"
#include "monitor.hpp"

namespace {

void usage(const char* argv0) {
  std::cerr
    << "usage: " << argv0 << " [-d|--debug] [-c|--config <path>] [--system-bus] [--no-control]\n"
    << "  -d, --debug        verbose [dbg] messages on stderr\n"
    << "  -c, --config PATH  configuration file (default: "
    << hrstream::ConfigProvider::default_path() << ")\n"
    << "      --system-bus   publish the control surface on the system bus\n"
    << "      --no-control   do not publish the D-Bus control surface\n"
    << "Environment: HRSTREAM_API_KEY overrides the configured apiKey.\n";
}

} // anonymous namespace

int main(int argc, char** argv) {
  hrstream::MonitorOptions opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg(argv[i]);
    if (arg == "-d" || arg == "--debug") {
      hrstream::g_debug = true;
    } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
      opts.config_path = argv[++i];
    } else if (arg == "--system-bus") {
      opts.system_bus = true;
    } else if (arg == "--no-control") {
      opts.enable_control = false;
    } else if (arg == "-h" || arg == "--help") {
      usage(argv[0]);
      return 0;
    } else {
      ERR << "[err] Unknown argument: " << arg << "\n";
      usage(argv[0]);
      return EXIT_FAILURE;
    }
  }
  DBG << "[dbg] main(): debug enabled, compiler=" << __VERSION__
      << ", __cplusplus=" << __cplusplus << "\n";

  try {
    hrstream::Monitor monitor(std::move(opts));
    if (!monitor.init()) {
      ERR << "[fatal] Cannot build the ingestion pipeline.\n";
      return EXIT_FAILURE;
    }
    int rc = monitor.run();
    DBG << "[dbg] main(): run() returned " << rc << "\n";
    return rc;
  } catch (const std::exception& e) {
    ERR << "[fatal] Unhandled exception: " << e.what() << "\n";
    return EXIT_FAILURE;
  }
}
