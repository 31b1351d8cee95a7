#pragma once

#ifdef RT_LOG_DEBUG
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace RT {

/*
 * Asynchronous, tag-filtered stderr logger. Callers only queue a record; a
 * single background thread formats and writes it. Every record carries the
 * tags it was logged with ("ReplayCache", "Session", "Error", ...), the name
 * of the logging thread and its source location.
 *
 * Filters: a record with any skip tag is dropped; when the only-set is not
 * empty a record must also carry at least one of its tags.
 */
class TaggedLogger {
public:
    struct Record {
        std::chrono::system_clock::time_point when;
        std::vector<std::string>              tags;
        std::string                           text;
        std::string                           thread;
        std::source_location                  where;
    };

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(TaggedLogger const&)                    = delete;
    auto operator=(TaggedLogger const&) -> TaggedLogger& = delete;

    template <typename... Tags>
    void submit(std::string text, std::source_location const& where, Tags&&... tags);

    void nameThread(std::string name);
    void enable(bool on) { enabled_.store(on, std::memory_order_relaxed); }
    [[nodiscard]] auto enabled() const -> bool { return enabled_.load(std::memory_order_relaxed); }

    void setSkipTags(std::set<std::string> tags);
    void setOnlyTags(std::set<std::string> tags);

    // Blocks until every queued record has been written.
    void flush();

    // Held while writing a record; other stdout/stderr writers can share it.
    [[nodiscard]] auto outputMutex() -> std::mutex& { return outputMutex_; }

private:
    void run();
    [[nodiscard]] auto accepts(Record const& record) const -> bool;
    void write(Record const& record);
    [[nodiscard]] auto threadLabel() -> std::string;

    std::deque<Record>      queue_;
    std::mutex              queueMutex_;
    std::condition_variable wake_;
    std::condition_variable drained_;
    std::size_t             writing_  = 0;
    bool                    stopping_ = false;
    std::atomic<bool>       enabled_{false};

    mutable std::mutex    filterMutex_;
    std::set<std::string> skipTags_{"ReplayCacheHit"};
    std::set<std::string> onlyTags_;

    std::mutex                                       threadMutex_;
    std::unordered_map<std::thread::id, std::string> threadNames_;
    int                                              unnamedThreads_ = 0;

    std::mutex  outputMutex_;
    std::thread worker_; // started last, after every other member exists
};

auto logger() -> TaggedLogger&;

template <typename... Tags>
void TaggedLogger::submit(std::string text, std::source_location const& where, Tags&&... tags) {
    if (!enabled()) {
        return;
    }
    Record record{std::chrono::system_clock::now(),
                  {std::string(std::forward<Tags>(tags))...},
                  std::move(text),
                  threadLabel(),
                  where};
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        queue_.push_back(std::move(record));
    }
    wake_.notify_one();
}

void set_thread_name(std::string const& name);
void set_logging_enabled(bool enabled);
// RETRACE_LOG_TAGS and RETRACE_LOG_SKIP: comma separated tag lists.
void configure_log_filters_from_env();
void flush_log();

} // namespace RT

#define rt_log(message, ...) ::RT::logger().submit(message, std::source_location::current(), ##__VA_ARGS__)

#else
#define rt_log(message, ...) ((void)0)
#endif // RT_LOG_DEBUG
