#include <hotview/reload/reload_coordinator.h>
#include <hotview/core/errors.h>
#include <hotview/markup/tree_builder.h>

#include <algorithm>
#include <filesystem>
#include <functional>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace hotview::reload {

namespace {

constexpr const char kModule[] = "reload";

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open " + path);
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error("cannot read " + path);
    }
    return contents.str();
}

std::string watch_directory(const std::string& source_path) {
    auto parent = std::filesystem::path(source_path).parent_path();
    return parent.empty() ? std::string(".") : parent.string();
}

// A throwing listener is reported and does not stop the others.
void call_listener(const std::function<void()>& listener, core::DiagnosticEmitter& diagnostics) {
    try {
        listener();
    } catch (const std::exception& e) {
        diagnostics.error(kModule, "notify", std::string("listener failed: ") + e.what());
    }
}

} // anonymous namespace

const char* reload_state_name(ReloadState state) {
    switch (state) {
        case ReloadState::Idle:      return "idle";
        case ReloadState::Watching:  return "watching";
        case ReloadState::Reparsing: return "reparsing";
        case ReloadState::Failed:    return "failed";
    }
    return "unknown";
}

ReloadCoordinator::ReloadCoordinator(core::ReloadConfig config,
                                     core::DiagnosticEmitter& diagnostics,
                                     std::unique_ptr<platform::WatchSource> source,
                                     platform::EventLoop* host_loop)
    : config_(std::move(config)),
      diagnostics_(diagnostics),
      source_(std::move(source)),
      host_loop_(host_loop) {
    diagnostics_.set_min_severity(config_.min_severity);
}

ReloadCoordinator::~ReloadCoordinator() {
    stop();
}

bool ReloadCoordinator::start() {
    if (started_.load()) return !stopped_.load();

    std::shared_ptr<const TreeSnapshot> initial;
    try {
        initial = load_snapshot();
    } catch (const MarkupError& e) {
        record_failure("parse", e.what());
        return false;
    } catch (const std::exception& e) {
        record_failure("read", e.what());
        return false;
    }
    publish(std::move(initial));

    if (!source_) {
        source_ = std::make_unique<platform::FileWatcher>(
            watch_directory(config_.source_path), config_.recursive);
    }

    started_.store(true);
    state_.store(ReloadState::Watching);
    consumer_ = std::jthread([this](std::stop_token stop) { consume(stop); });
    try {
        source_->start([this](const platform::WatchEvent& event) { on_watch_event(event); });
    } catch (const std::exception& e) {
        stopped_.store(true);
        queue_.close();
        consumer_.request_stop();
        consumer_.join();
        state_.store(ReloadState::Idle);
        record_failure("watch", e.what());
        return false;
    }

    diagnostics_.info(kModule, "watch",
                      "watching " + watch_directory(config_.source_path) + " for " +
                      config_.source_path);
    return true;
}

void ReloadCoordinator::stop() {
    if (!started_.load() || stopped_.exchange(true)) return;

    // Closing first releases a watcher thread blocked on the full slot
    queue_.close();
    source_->stop();
    consumer_.request_stop();
    if (consumer_.joinable()) consumer_.join();

    state_.store(ReloadState::Idle);
}

bool ReloadCoordinator::reload_now() {
    return reparse();
}

std::shared_ptr<const TreeSnapshot> ReloadCoordinator::snapshot() const {
    std::lock_guard lock(snapshot_mutex_);
    return snapshot_;
}

std::optional<std::string> ReloadCoordinator::last_error() const {
    std::lock_guard lock(error_mutex_);
    return last_error_;
}

ReloadCoordinator::SubscriptionId ReloadCoordinator::subscribe(Listener listener) {
    std::lock_guard lock(listeners_mutex_);
    auto id = next_subscription_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

bool ReloadCoordinator::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(listeners_mutex_);
    return listeners_.erase(id) > 0;
}

void ReloadCoordinator::on_watch_event(const platform::WatchEvent& event) {
    // Blocks while the consumer still holds an unprocessed event
    if (!queue_.push(event)) {
        diagnostics_.info(kModule, "watch",
                          std::string("dropped ") + platform::watch_event_kind_name(event.kind) +
                          " event for " + event.path + " during shutdown");
    }
}

void ReloadCoordinator::consume(std::stop_token stop) {
    while (!stop.stop_requested()) {
        auto event = queue_.pop(stop);
        if (!event) return;  // closed or stopping

        if (event->kind != platform::WatchEvent::Kind::ContentWrite) continue;

        if (!wait_until_quiet(stop)) return;
        reparse();
    }
}

// Keeps draining the slot until no content write arrives for one debounce
// window, or until kMaxDebounceWindows windows have passed since the first
// write. Returns false if the coordinator is stopping.
bool ReloadCoordinator::wait_until_quiet(std::stop_token stop) {
    using Clock = std::chrono::steady_clock;
    const auto first = Clock::now();
    const auto ceiling = first + config_.debounce * core::config::kMaxDebounceWindows;
    auto deadline = first + config_.debounce;

    for (;;) {
        auto remaining = std::min(deadline, ceiling) - Clock::now();
        if (remaining <= Clock::duration::zero()) break;

        auto next = queue_.try_pop_for(remaining, stop);
        if (!next) break;
        if (next->kind == platform::WatchEvent::Kind::ContentWrite) {
            deadline = Clock::now() + config_.debounce;
        }
    }
    return !stop.stop_requested() && !queue_.closed();
}

bool ReloadCoordinator::reparse() {
    std::lock_guard reparse_lock(reparse_mutex_);
    state_.store(ReloadState::Reparsing);
    reparse_count_.fetch_add(1);

    std::shared_ptr<const TreeSnapshot> next;
    try {
        next = load_snapshot();
    } catch (const MarkupError& e) {
        state_.store(ReloadState::Failed);
        record_failure("parse", e.what());
    } catch (const std::exception& e) {
        state_.store(ReloadState::Failed);
        record_failure("read", e.what());
    }
    if (!next) {
        state_.store(resting_state());
        return false;
    }

    publish(std::move(next));
    state_.store(resting_state());
    notify();
    return true;
}

ReloadState ReloadCoordinator::resting_state() const {
    return started_.load() && !stopped_.load() ? ReloadState::Watching : ReloadState::Idle;
}

std::shared_ptr<const TreeSnapshot> ReloadCoordinator::load_snapshot() {
    auto begin = std::chrono::steady_clock::now();
    auto markup = read_file(config_.source_path);
    auto root = std::make_shared<const markup::Element>(markup::parse_markup(markup));
    auto elapsed = std::chrono::steady_clock::now() - begin;

    auto snapshot = std::make_shared<TreeSnapshot>();
    snapshot->root = std::move(root);
    snapshot->source_path = config_.source_path;
    snapshot->parsed_at = std::chrono::system_clock::now();
    snapshot->parse_duration = std::chrono::duration_cast<std::chrono::microseconds>(elapsed);
    return snapshot;
}

void ReloadCoordinator::publish(std::shared_ptr<const TreeSnapshot> snapshot) {
    auto stamped = std::make_shared<TreeSnapshot>(*snapshot);
    std::uint64_t generation = 0;
    {
        std::lock_guard lock(snapshot_mutex_);
        generation = ++generation_;
        stamped->generation = generation;
        snapshot_ = std::move(stamped);
    }
    {
        std::lock_guard lock(error_mutex_);
        last_error_.reset();
    }

    diagnostics_.set_correlation_id(generation);
    diagnostics_.info(kModule, "publish",
                      "parsed " + config_.source_path + " in " +
                      std::to_string(snapshot->parse_duration.count()) + "us (" +
                      std::to_string(snapshot->root->node_count()) + " elements)");
}

void ReloadCoordinator::notify() {
    std::vector<Listener> listeners;
    {
        std::lock_guard lock(listeners_mutex_);
        listeners.reserve(listeners_.size());
        for (const auto& [id, listener] : listeners_) {
            listeners.push_back(listener);
        }
    }
    if (listeners.empty()) return;

    if (host_loop_) {
        host_loop_->post_task([listeners = std::move(listeners), diagnostics = &diagnostics_]() {
            for (const auto& listener : listeners) call_listener(listener, *diagnostics);
        });
        return;
    }
    for (const auto& listener : listeners) call_listener(listener, diagnostics_);
}

void ReloadCoordinator::record_failure(const std::string& stage, const std::string& message) {
    {
        std::lock_guard lock(error_mutex_);
        last_error_ = message;
    }
    diagnostics_.error(kModule, stage, config_.source_path + ": " + message);
}

} // namespace hotview::reload
