#ifdef RT_LOG_DEBUG
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>

namespace RT {

namespace {

// "src/retrace/cache/ReplayCache.cpp" -> "cache/ReplayCache.cpp"
auto short_source(char const* file) -> std::string {
    std::filesystem::path const path{file};
    auto const                  parent = path.parent_path().filename();
    return parent.empty() ? path.filename().string() : (parent / path.filename()).string();
}

auto split_tags(std::string_view text) -> std::set<std::string> {
    std::set<std::string> tags;
    while (!text.empty()) {
        auto const comma = text.find(',');
        auto       tag   = text.substr(0, comma);
        if (!tag.empty()) {
            tags.emplace(tag);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        text.remove_prefix(comma + 1);
    }
    return tags;
}

} // namespace

auto logger() -> TaggedLogger& {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger()
    : worker_([this] { run(); }) {}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        stopping_ = true;
    }
    wake_.notify_one();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void TaggedLogger::nameThread(std::string name) {
    std::lock_guard<std::mutex> lock(threadMutex_);
    threadNames_[std::this_thread::get_id()] = std::move(name);
}

void TaggedLogger::setSkipTags(std::set<std::string> tags) {
    std::lock_guard<std::mutex> lock(filterMutex_);
    skipTags_ = std::move(tags);
}

void TaggedLogger::setOnlyTags(std::set<std::string> tags) {
    std::lock_guard<std::mutex> lock(filterMutex_);
    onlyTags_ = std::move(tags);
}

void TaggedLogger::flush() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    drained_.wait(lock, [this] { return queue_.empty() && writing_ == 0; });
}

void TaggedLogger::run() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    for (;;) {
        wake_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        while (!queue_.empty()) {
            Record record = std::move(queue_.front());
            queue_.pop_front();
            ++writing_;
            lock.unlock();
            if (accepts(record)) {
                write(record);
            }
            lock.lock();
            --writing_;
        }
        drained_.notify_all();
        if (stopping_) {
            return;
        }
    }
}

auto TaggedLogger::accepts(Record const& record) const -> bool {
    std::lock_guard<std::mutex> lock(filterMutex_);
    auto const                  has = [&](std::set<std::string> const& set) {
        return std::any_of(record.tags.begin(), record.tags.end(), [&](auto const& tag) { return set.contains(tag); });
    };
    if (has(skipTags_)) {
        return false;
    }
    return onlyTags_.empty() || has(onlyTags_);
}

void TaggedLogger::write(Record const& record) {
    auto const  seconds = std::chrono::system_clock::to_time_t(record.when);
    auto const  millis  = std::chrono::duration_cast<std::chrono::milliseconds>(record.when.time_since_epoch()) % 1000;
    std::tm     local{};
    localtime_r(&seconds, &local);

    std::ostringstream line;
    line << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis.count() << ' ';
    for (auto const& tag : record.tags) {
        line << '[' << tag << ']';
    }
    line << " (" << record.thread << ") " << short_source(record.where.file_name()) << ':' << record.where.line()
         << ' ' << record.text << '\n';

    std::lock_guard<std::mutex> lock(outputMutex_);
    std::cerr << line.str() << std::flush;
}

auto TaggedLogger::threadLabel() -> std::string {
    std::lock_guard<std::mutex> lock(threadMutex_);
    auto [it, inserted] = threadNames_.try_emplace(std::this_thread::get_id());
    if (inserted) {
        it->second = "thread-" + std::to_string(unnamedThreads_++);
    }
    return it->second;
}

void set_thread_name(std::string const& name) {
    logger().nameThread(name);
}

void set_logging_enabled(bool enabled) {
    logger().enable(enabled);
}

void configure_log_filters_from_env() {
    if (char const* only = std::getenv("RETRACE_LOG_TAGS")) {
        logger().setOnlyTags(split_tags(only));
    }
    if (char const* skip = std::getenv("RETRACE_LOG_SKIP")) {
        logger().setSkipTags(split_tags(skip));
    }
}

void flush_log() {
    logger().flush();
}

} // namespace RT
#endif // RT_LOG_DEBUG
