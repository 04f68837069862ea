#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace hotview::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

const char* severity_name(Severity severity);

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t correlation_id = 0;
};

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Collects diagnostics from the parse, resolve and reload paths. Safe to use
// from the watcher and consumer threads at the same time; observers run on the
// emitting thread.
class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(std::size_t history_limit = 512);

    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);

    void info(const std::string& module, const std::string& stage, const std::string& message) {
        emit(Severity::Info, module, stage, message);
    }
    void warning(const std::string& module, const std::string& stage, const std::string& message) {
        emit(Severity::Warning, module, stage, message);
    }
    void error(const std::string& module, const std::string& stage, const std::string& message) {
        emit(Severity::Error, module, stage, message);
    }

    void set_correlation_id(std::uint64_t id);
    std::uint64_t correlation_id() const;

    void set_min_severity(Severity min);
    Severity min_severity() const;

    void add_observer(DiagnosticObserver observer);

    std::vector<DiagnosticEvent> events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;

    void clear();
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::deque<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::size_t history_limit_;
    std::uint64_t correlation_id_ = 0;
    Severity min_severity_ = Severity::Info;
};

}  // namespace hotview::core
