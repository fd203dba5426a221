#include "commands.h"
#include "config.h"

#include "puid/core/version.h"

#include <exception>
#include <iostream>

int main(int argc, char* argv[]) {
  try {
    if (argc == 1) {
      return puid::cli::run_demo(std::cout);
    }

    const auto parsed = puid::cli::parse_args(argc, argv);
    const auto registry = puid::cli::build_option_registry();

    if (!parsed.ok()) {
      for (const auto& error : parsed.errors) {
        std::cerr << error << "\n";
      }
      std::cerr << puid::apps::format_usage("puid_cli", registry);
      return 1;
    }

    const auto& config = parsed.config;
    if (config.help) {
      std::cout << "puid_cli v" << puid::core::kBuildVersion << "\n\n"
                << puid::apps::format_usage("puid_cli", registry);
      return 0;
    }

    if (config.decode.has_value()) {
      return puid::cli::run_decode(config.decode.value(), std::cout, std::cerr);
    }

    return puid::cli::run_generate(config, std::cout, std::cerr);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
