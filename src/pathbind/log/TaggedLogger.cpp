#include <pathbind/log/TaggedLogger.hpp>

#include <cctype>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>

namespace PB {

namespace {

template <typename Range, typename Delimiter>
std::string join_with_impl(const Range& range, const Delimiter& delim) {
    std::ostringstream oss;
    bool               first = true;
    for (const auto& item : range) {
        if (!first)
            oss << delim;
        oss << item;
        first = false;
    }
    return oss.str();
}

auto parse_truthy(char const* value) -> bool {
    if (value == nullptr) {
        return false;
    }
    std::string_view text{value};
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    if (text.empty()) {
        return true;
    }
    std::string normalized;
    normalized.reserve(text.size());
    for (char ch : text) {
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return !(normalized == "0" || normalized == "false" || normalized == "off" || normalized == "no");
}

auto split_tags(char const* value) -> std::set<std::string> {
    std::set<std::string> tags;
    if (value == nullptr) {
        return tags;
    }
    std::string_view text{value};
    while (!text.empty()) {
        auto comma = text.find(',');
        auto token = text.substr(0, comma);
        while (!token.empty() && std::isspace(static_cast<unsigned char>(token.front())))
            token.remove_prefix(1);
        while (!token.empty() && std::isspace(static_cast<unsigned char>(token.back())))
            token.remove_suffix(1);
        if (!token.empty())
            tags.emplace(token);
        if (comma == std::string_view::npos)
            break;
        text.remove_prefix(comma + 1);
    }
    return tags;
}

} // namespace

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() : running(true), loggingEnabled(false), warningsEnabled(true), nextThreadNumber(0) {
    this->applyEnvironment();
    this->workerThread = std::thread(&TaggedLogger::processQueue, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->running = false;
        this->cv.notify_one();
    }
    if (this->workerThread.joinable()) {
        this->workerThread.join();
    }
}

auto TaggedLogger::applyEnvironment() -> void {
    if (parse_truthy(std::getenv("PATHBIND_LOG_ENABLED")) || parse_truthy(std::getenv("PATHBIND_LOG"))) {
        this->loggingEnabled.store(true, std::memory_order_relaxed);
    }
    if (parse_truthy(std::getenv("PATHBIND_LOG_QUIET"))) {
        this->warningsEnabled.store(false, std::memory_order_relaxed);
    }
    if (parse_truthy(std::getenv("PATHBIND_LOG_CLEAR_DEFAULT_SKIPS"))) {
        this->skipTags.clear();
    }
    for (auto& tag : split_tags(std::getenv("PATHBIND_LOG_SKIP_TAGS"))) {
        this->skipTags.insert(tag);
    }
    this->enabledTags = split_tags(std::getenv("PATHBIND_LOG_ENABLE_TAGS"));
}

auto TaggedLogger::addObserver(Observer observer) -> ObserverId {
    std::lock_guard<std::mutex> lock(this->observersMutex);
    auto                        id = this->nextObserverId++;
    this->observers.emplace_back(id, std::move(observer));
    return id;
}

auto TaggedLogger::removeObserver(ObserverId id) -> void {
    std::lock_guard<std::mutex> lock(this->observersMutex);
    std::erase_if(this->observers, [id](auto const& entry) { return entry.first == id; });
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    const auto                  threadId = std::this_thread::get_id();
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    threadNames[threadId] = name;
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    loggingEnabled.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::setWarningsEnabled(bool enabled) -> void {
    warningsEnabled.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::isLoggingEnabled() const -> bool {
    return loggingEnabled.load(std::memory_order_relaxed);
}

auto TaggedLogger::enqueue(LogMessage message) -> void {
    std::vector<Observer> snapshot;
    {
        std::lock_guard<std::mutex> lock(this->observersMutex);
        snapshot.reserve(this->observers.size());
        for (auto const& [id, observer] : this->observers)
            snapshot.push_back(observer);
    }
    for (auto const& observer : snapshot) {
        if (observer)
            observer(message);
    }

    if (!this->shouldWrite(message))
        return;

    std::unique_lock<std::mutex> lock(this->queueMutex);
    this->messageQueue.push(std::move(message));
    this->cv.notify_one();
}

auto TaggedLogger::shouldWrite(const LogMessage& msg) const -> bool {
    bool const severe = msg.tags.contains("WARNING") || msg.tags.contains("ERROR");
    if (severe)
        return this->warningsEnabled.load(std::memory_order_relaxed);
    if (!this->loggingEnabled.load(std::memory_order_relaxed))
        return false;
    if (!this->enabledTags.empty())
        for (auto const& tag : msg.tags)
            if (!this->enabledTags.contains(tag))
                return false;
    for (auto const& skipTag : this->skipTags)
        if (msg.tags.contains(skipTag))
            return false;
    return true;
}

auto TaggedLogger::processQueue() -> void {
    while (true) {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->cv.wait(lock, [this] { return !this->messageQueue.empty() || !this->running; });

        if (!this->running && this->messageQueue.empty()) {
            return;
        }

        while (!this->messageQueue.empty()) {
            const auto msg = std::move(this->messageQueue.front());
            this->messageQueue.pop();
            lock.unlock();
            this->writeToStderr(msg);
            lock.lock();
        }
    }
}

auto TaggedLogger::getShortPath(const char* filepath) -> std::string {
    namespace fs = std::filesystem;
    fs::path p{filepath};
    if (p.has_parent_path()) {
        auto parent = p.parent_path().filename();
        return (parent / p.filename()).string();
    }
    return p.filename().string();
}

auto TaggedLogger::writeToStderr(const LogMessage& msg) const -> void {
    const auto now      = msg.timestamp;
    const auto nowMs    = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    const auto nowTimeT = std::chrono::system_clock::to_time_t(now);
    std::tm    nowTm{};
    localtime_r(&nowTimeT, &nowTm);

    std::ostringstream oss;
    oss << std::put_time(&nowTm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << nowMs.count() << ' ';
    oss << '[' << join_with_impl(msg.tags, std::string("][")) << ']' << ' ';
    oss << "[" << msg.threadName << "] ";
    oss << "[" << getShortPath(msg.location.file_name()) << ":" << msg.location.line() << "] ";
    oss << msg.message << '\n';

    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << oss.str() << std::flush;
}

auto TaggedLogger::getThreadName(const std::thread::id& id) -> std::string {
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    auto                        it = threadNames.find(id);
    if (it != threadNames.end()) {
        return it->second;
    }
    std::string name = "Thread " + std::to_string(nextThreadNumber++);
    threadNames[id]  = name;
    return name;
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace PB
