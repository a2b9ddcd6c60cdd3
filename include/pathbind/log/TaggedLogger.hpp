#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace PB {

/**
 * TaggedLogger: tagged diagnostics with an asynchronous stderr writer.
 *
 * Messages carry a set of tags. Severity is expressed as a tag: "WARNING"
 * and "ERROR" are written to stderr unless PATHBIND_LOG_QUIET is set; all
 * other messages are written only when logging is enabled
 * (PATHBIND_LOG_ENABLED / PATHBIND_LOG). Observers see every message
 * synchronously on the logging thread, regardless of the stderr policy.
 *
 * Environment:
 *   PATHBIND_LOG_ENABLED, PATHBIND_LOG       enable debug output
 *   PATHBIND_LOG_QUIET                       silence warnings/errors on stderr
 *   PATHBIND_LOG_ENABLE_TAGS                 comma list; only messages whose tags are all listed
 *   PATHBIND_LOG_SKIP_TAGS                   comma list added to the skip set
 *   PATHBIND_LOG_CLEAR_DEFAULT_SKIPS         drop the built-in skip set
 */
class TaggedLogger {
public:
    struct LogMessage {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string>                 tags;
        std::string                           message;
        std::string                           threadName;
        std::source_location                  location;
    };

    using Observer   = std::function<void(LogMessage const&)>;
    using ObserverId = std::uint64_t;

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;
    TaggedLogger(TaggedLogger&&)                 = delete;
    TaggedLogger& operator=(TaggedLogger&&)      = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto addObserver(Observer observer) -> ObserverId;
    auto removeObserver(ObserverId id) -> void;

    auto setThreadName(const std::string& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;
    auto setWarningsEnabled(bool enabled) -> void;
    [[nodiscard]] auto isLoggingEnabled() const -> bool;

    static std::mutex coutMutex;

private:
    std::queue<LogMessage>  messageQueue;
    mutable std::mutex      queueMutex;
    std::condition_variable cv;
    std::thread             workerThread;
    std::atomic<bool>       running;
    std::atomic<bool>       loggingEnabled;
    std::atomic<bool>       warningsEnabled;
    std::set<std::string>   skipTags{"Function Called", "INFO", "Flush", "Reconcile", "Testcase"};
    std::set<std::string>   enabledTags{};

    std::vector<std::pair<ObserverId, Observer>> observers;
    mutable std::mutex                           observersMutex;
    ObserverId                                   nextObserverId = 1;

    std::unordered_map<std::thread::id, std::string> threadNames;
    mutable std::mutex                               threadNamesMutex;
    std::atomic<int>                                 nextThreadNumber;

    auto        enqueue(LogMessage message) -> void;
    auto        processQueue() -> void;
    auto        shouldWrite(const LogMessage& msg) const -> bool;
    auto        writeToStderr(const LogMessage& msg) const -> void;
    auto        getThreadName(const std::thread::id& id) -> std::string;
    auto        applyEnvironment() -> void;
    static auto getShortPath(const char* filepath) -> std::string;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    auto logMessage = LogMessage{.timestamp  = std::chrono::system_clock::now(),
                                 .tags       = {std::string(std::forward<Tags>(tags))...},
                                 .message    = message,
                                 .threadName = getThreadName(std::this_thread::get_id()),
                                 .location   = location};
    this->enqueue(std::move(logMessage));
}

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace PB

#define pb_warn(message, ...) ::PB::logger().log_impl(message, std::source_location::current(), "WARNING", ##__VA_ARGS__)
#define pb_error(message, ...) ::PB::logger().log_impl(message, std::source_location::current(), "ERROR", ##__VA_ARGS__)

#ifdef PB_LOG_DEBUG
#define pb_log(message, ...) ::PB::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)
#else
#define pb_log(message, ...) ((void)0)
#endif // PB_LOG_DEBUG
