#include "TaggedLogger.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>

using namespace std::string_view_literals;

namespace LP {

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

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

auto env_flag(char const* name) -> bool {
    auto const* value = std::getenv(name);
    if (value == nullptr) {
        return false;
    }
    auto text = trim(value);
    return text != "0"sv && text != "false"sv && text != "off"sv && text != "no"sv;
}

auto split_tags(char const* value) -> std::set<std::string> {
    std::set<std::string> tags;
    if (value == nullptr) {
        return tags;
    }
    std::string_view remaining{value};
    while (!remaining.empty()) {
        auto comma = remaining.find(',');
        auto token = trim(remaining.substr(0, comma));
        if (!token.empty()) {
            tags.emplace(token);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        remaining.remove_prefix(comma + 1);
    }
    return tags;
}

} // namespace

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() : running(true), loggingEnabled(false), nextThreadNumber(0) {
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
    if (env_flag("LONGPRESS_LOG_ENABLED") || env_flag("LONGPRESS_LOG")) {
        loggingEnabled.store(true, std::memory_order_relaxed);
    }
    if (env_flag("LONGPRESS_LOG_CLEAR_DEFAULT_SKIPS")) {
        skipTags.clear();
    }
    for (auto& tag : split_tags(std::getenv("LONGPRESS_LOG_SKIP_TAGS"))) {
        skipTags.insert(tag);
    }
    enabledTags = split_tags(std::getenv("LONGPRESS_LOG_ENABLE_TAGS"));
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    const auto                  threadId = std::this_thread::get_id();
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    threadNames[threadId] = name;
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    loggingEnabled.store(enabled, std::memory_order_relaxed);
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
    if (this->enabledTags.size())
        for (auto const& tag : msg.tags)
            if (!this->enabledTags.contains(tag))
                return;
    for (auto const& skipTag : this->skipTags)
        if (msg.tags.contains(skipTag))
            return;
    const auto  now      = msg.timestamp;
    const auto  nowMs    = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    const auto  nowTimeT = std::chrono::system_clock::to_time_t(now);
    const auto* nowTm    = std::localtime(&nowTimeT);

    std::ostringstream oss;
    oss << std::put_time(nowTm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << nowMs.count() << ' ';

    oss << '[' << join_with_impl(msg.tags, "][") << ']' << ' ';

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
    } else {
        std::string name = "Thread " + std::to_string(nextThreadNumber++);
        threadNames[id]  = name;
        return name;
    }
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace LP
