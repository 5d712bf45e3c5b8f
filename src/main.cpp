#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#if defined(XTALVIEW_HAS_OPENMP) && XTALVIEW_HAS_OPENMP
  #include <omp.h>
#endif

#include "xtalview/app/Runner.hpp"
#include "xtalview/config/IniConfig.hpp"
#include "xtalview/config/SceneConfig.hpp"

namespace fs = std::filesystem;

namespace {

enum class CliAction {
  Run,
  Validate,
  Help,
  Version,
};

struct CliOptions {
  CliAction action = CliAction::Run;
  fs::path config;
  std::optional<xtalview::RunMode> mode; // overrides [run] mode
  int threads = 0;                       // 0 = OpenMP default
};

void print_usage(std::ostream& os, const std::string& prog) {
  os << "Usage: " << prog << " --config <file.ini> [options]\n"
     << "\n"
     << "Options:\n"
     << "  --config <path>     run configuration (INI)\n"
     << "  --mode <m>          compare | wire, replaces [run] mode\n"
     << "  --threads <N>       OpenMP threads for bond search (0 = default)\n"
     << "  --validate-config   check the configuration and exit\n"
     << "  --version           print version and exit\n"
     << "  -h, --help          show this text\n";
}

int parse_thread_count(const std::string& s) {
  std::size_t pos = 0;
  int n = -1;
  try {
    n = std::stoi(s, &pos);
  } catch (const std::exception&) {
    pos = 0;
  }
  if (pos == 0 || pos != s.size() || n < 0) {
    throw std::runtime_error("--threads expects a non-negative integer (got '" + s + "')");
  }
  return n;
}

CliOptions parse_cli(int argc, char** argv) {
  CliOptions opt;
  auto value_of = [&](int& i, const std::string& flag) -> std::string {
    if (i + 1 >= argc) throw std::runtime_error(flag + " requires a value");
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      opt.action = CliAction::Help;
      return opt;
    }
    if (arg == "--version") {
      opt.action = CliAction::Version;
      return opt;
    }
    if (arg == "--config") {
      opt.config = value_of(i, arg);
    } else if (arg == "--mode") {
      opt.mode = xtalview::parse_run_mode(value_of(i, arg));
    } else if (arg == "--threads") {
      opt.threads = parse_thread_count(value_of(i, arg));
    } else if (arg == "--validate-config") {
      opt.action = CliAction::Validate;
    } else {
      throw std::runtime_error("unknown argument: " + arg + " (see --help)");
    }
  }

  if (opt.config.empty()) throw std::runtime_error("--config is required (see --help)");
  return opt;
}

void configure_threads(int threads) {
#if defined(XTALVIEW_HAS_OPENMP) && XTALVIEW_HAS_OPENMP
  if (threads > 0) omp_set_num_threads(threads);
  std::cerr << "[xtalview] OpenMP threads: " << omp_get_max_threads() << "\n";
#else
  if (threads > 1) {
    std::cerr << "[xtalview] built without OpenMP; --threads " << threads << " ignored\n";
  }
#endif
}

} // namespace

int main(int argc, char** argv) {
  const std::string prog = (argc > 0) ? fs::path(argv[0]).filename().string() : "xtalview";
  try {
    const CliOptions opt = parse_cli(argc, argv);

    switch (opt.action) {
      case CliAction::Help:
        print_usage(std::cout, prog);
        return 0;
      case CliAction::Version:
        std::cout << "xtalview " << XTALVIEW_VERSION_STR << "\n";
        return 0;
      case CliAction::Run:
      case CliAction::Validate:
        break;
    }

    configure_threads(opt.threads);

    const xtalview::IniConfig cfg(opt.config);
    xtalview::Runner runner(cfg, opt.mode);
    return (opt.action == CliAction::Validate) ? runner.validate_config() : runner.run();
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
  }
}
