#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "logger.hpp"

namespace relaycp {

// Per-session accounting sink. Calls come from relay worker threads and
// must return without waiting on I/O.
class SessionJournal {
public:
    virtual ~SessionJournal() = default;

    virtual void session_started(const std::string& session_id,
                                 const std::string& room,
                                 const std::string& source) = 0;
    virtual void bytes_relayed(const std::string& session_id, uint64_t n) = 0;
    virtual void session_ended(const std::string& session_id) = 0;
};

// Appends one line per event to a file from a background thread.
// The queue is bounded; events that do not fit are counted and dropped.
class FileSessionJournal final : public SessionJournal {
public:
    FileSessionJournal(const std::string& path, Logger& logger, size_t capacity = 4096);
    ~FileSessionJournal() override;

    FileSessionJournal(const FileSessionJournal&) = delete;
    FileSessionJournal& operator=(const FileSessionJournal&) = delete;

    void session_started(const std::string& session_id,
                         const std::string& room,
                         const std::string& source) override;
    void bytes_relayed(const std::string& session_id, uint64_t n) override;
    void session_ended(const std::string& session_id) override;

    bool enabled() const { return enabled_; }
    uint64_t dropped() const { return dropped_.load(); }

    // Drains pending events and joins the writer. Idempotent.
    void stop();

private:
    enum class EventType { STARTED, BYTES, ENDED };

    struct Event {
        EventType type = EventType::STARTED;
        std::string session_id;
        std::string room;
        std::string source;
        uint64_t bytes = 0;
        uint64_t wall_ms = 0;
    };

    void push(Event ev);
    void run();
    void write_event(const Event& ev);

    Logger& logger_;
    const size_t capacity_;
    bool enabled_ = false;

    std::ofstream out_;
    // Touched only by the writer thread.
    std::unordered_map<std::string, uint64_t> totals_;

    std::mutex mu_;
    std::condition_variable cv_;
    std::deque<Event> queue_;
    bool stopping_ = false;
    std::atomic<uint64_t> dropped_{0};
    std::thread worker_;
};

} // namespace relaycp
