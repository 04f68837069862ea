#include <hotview/core/config.h>
#include <hotview/core/diagnostics.h>
#include <hotview/platform/event_loop.h>
#include <hotview/reload/reload_coordinator.h>
#include <hotview/render/render_request.h>

#include <csignal>
#include <pthread.h>

#include <charconv>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace {

constexpr const char kProgramName[] = "hotview";

void print_usage(std::ostream& stream) {
  stream << "usage: " << kProgramName
         << " <markup-file> [--debounce=MS] [--once] [--quiet] [-h|--help] [-V|--version]\n";
}

bool is_help_flag(std::string_view text) {
  return text == "-h" || text == "--help";
}

bool is_version_flag(std::string_view text) {
  return text == "-V" || text == "--version";
}

bool parse_positive_int(std::string_view text, int& value) {
  if (text.empty()) {
    return false;
  }

  int parsed = 0;
  const char* begin = text.data();
  const char* end = begin + text.size();
  const std::from_chars_result result = std::from_chars(begin, end, parsed);
  if (result.ec != std::errc() || result.ptr != end || parsed <= 0) {
    return false;
  }

  value = parsed;
  return true;
}

bool starts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() &&
         value.compare(0, prefix.size(), prefix) == 0;
}

void print_tree(const hotview::reload::TreeSnapshot& snapshot,
                hotview::core::DiagnosticEmitter& diagnostics) {
  hotview::render::RequestContext context;
  context.diagnostics = &diagnostics;
  context.base_directory =
      std::filesystem::path(snapshot.source_path).parent_path().string();

  const auto request = hotview::render::build_request(*snapshot.root, context);
  std::cout << "# " << snapshot.source_path << " generation " << snapshot.generation
            << " (" << request.node_count() << " elements, parsed in "
            << snapshot.parse_duration.count() << "us)\n"
            << hotview::render::format_request_tree(request) << std::flush;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc == 2 && is_help_flag(argv[1])) {
    print_usage(std::cout);
    return 0;
  }
  if (argc == 2 && is_version_flag(argv[1])) {
    std::cout << hotview::core::config::kVersionString << "\n";
    return 0;
  }

  hotview::core::ReloadConfig config;
  bool once = false;
  std::vector<std::string_view> positional_args;

  for (int index = 1; index < argc; ++index) {
    const std::string_view argument(argv[index] != nullptr ? argv[index] : "");
    if (argument == "--once") {
      once = true;
    } else if (argument == "--quiet") {
      config.min_severity = hotview::core::Severity::Warning;
    } else if (starts_with(argument, "--debounce=")) {
      int millis = 0;
      if (!parse_positive_int(argument.substr(11), millis)) {
        std::cerr << "Invalid --debounce: '" << argument
                  << "' (expected --debounce=MS with a positive integer)\n";
        print_usage(std::cerr);
        return 1;
      }
      config.debounce = std::chrono::milliseconds(millis);
    } else if (starts_with(argument, "-")) {
      std::cerr << "Unknown option: " << argument << "\n";
      print_usage(std::cerr);
      return 1;
    } else {
      positional_args.push_back(argument);
    }
  }

  if (positional_args.size() > 1) {
    print_usage(std::cerr);
    return 1;
  }
  if (!positional_args.empty()) {
    config.source_path = std::string(positional_args[0]);
  }

  hotview::core::DiagnosticEmitter diagnostics(hotview::core::config::kDiagnosticHistoryLimit);
  diagnostics.add_observer([](const hotview::core::DiagnosticEvent& event) {
    std::cerr << hotview::core::format_diagnostic(event) << "\n";
  });

  if (once) {
    hotview::reload::ReloadCoordinator coordinator(config, diagnostics);
    if (!coordinator.reload_now()) {
      return 1;
    }
    print_tree(*coordinator.snapshot(), diagnostics);
    return 0;
  }

  // Block the termination signals before any thread starts so that only the
  // signal thread below receives them.
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  hotview::platform::EventLoop loop;
  hotview::reload::ReloadCoordinator coordinator(config, diagnostics, nullptr, &loop);
  coordinator.subscribe([&coordinator, &diagnostics]() {
    if (auto snapshot = coordinator.snapshot()) {
      print_tree(*snapshot, diagnostics);
    }
  });

  if (!coordinator.start()) {
    return 1;
  }
  print_tree(*coordinator.snapshot(), diagnostics);

  std::jthread signal_thread([&signals, &loop]() {
    int received = 0;
    if (sigwait(&signals, &received) == 0) {
      std::cerr << kProgramName << ": received signal " << received << ", exiting\n";
    }
    loop.quit();
  });

  loop.run();
  coordinator.stop();
  return 0;
}
