#ifndef HOTVIEW_CORE_CONFIG_H
#define HOTVIEW_CORE_CONFIG_H

#include <hotview/core/diagnostics.h>

#include <chrono>
#include <cstddef>
#include <string>

namespace hotview::core::config {

inline constexpr std::chrono::milliseconds kDefaultDebounce{50};
// A burst of writes delays a reparse by at most this many debounce windows.
inline constexpr int kMaxDebounceWindows = 10;
inline constexpr std::size_t kDiagnosticHistoryLimit = 512;
inline constexpr const char kDefaultSourceFile[] = "ui/main.xml";
inline constexpr const char kVersionString[] = "hotview 0.1.0";

}  // namespace hotview::core::config

namespace hotview::core {

struct ReloadConfig {
    std::string source_path = config::kDefaultSourceFile;
    std::chrono::milliseconds debounce = config::kDefaultDebounce;
    bool recursive = true;
    Severity min_severity = Severity::Info;
};

}  // namespace hotview::core

#endif  // HOTVIEW_CORE_CONFIG_H
