#include "session_journal.hpp"

#include <chrono>

namespace relaycp {

namespace {

uint64_t wall_now_ms() {
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

} // namespace

FileSessionJournal::FileSessionJournal(const std::string& path, Logger& logger, size_t capacity)
    : logger_(logger), capacity_(capacity) {
    out_.open(path, std::ios::out | std::ios::app);
    if (!out_.is_open()) {
        logger_.warn("session journal disabled: cannot open " + path);
        return;
    }
    enabled_ = true;
    worker_ = std::thread([this]() { run(); });
}

FileSessionJournal::~FileSessionJournal() {
    stop();
}

void FileSessionJournal::stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_) return;
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();

    uint64_t lost = dropped_.load();
    if (lost > 0) logger_.warn("session journal dropped " + std::to_string(lost) + " events");
}

void FileSessionJournal::session_started(const std::string& session_id,
                                         const std::string& room,
                                         const std::string& source) {
    Event ev;
    ev.type = EventType::STARTED;
    ev.session_id = session_id;
    ev.room = room;
    ev.source = source;
    push(std::move(ev));
}

void FileSessionJournal::bytes_relayed(const std::string& session_id, uint64_t n) {
    Event ev;
    ev.type = EventType::BYTES;
    ev.session_id = session_id;
    ev.bytes = n;
    push(std::move(ev));
}

void FileSessionJournal::session_ended(const std::string& session_id) {
    Event ev;
    ev.type = EventType::ENDED;
    ev.session_id = session_id;
    push(std::move(ev));
}

void FileSessionJournal::push(Event ev) {
    if (!enabled_) return;
    ev.wall_ms = wall_now_ms();
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_) return;
        if (queue_.size() >= capacity_) {
            dropped_.fetch_add(1);
            return;
        }
        queue_.push_back(std::move(ev));
    }
    cv_.notify_one();
}

void FileSessionJournal::run() {
    std::unique_lock<std::mutex> lk(mu_);
    for (;;) {
        cv_.wait(lk, [this]() { return stopping_ || !queue_.empty(); });
        if (queue_.empty() && stopping_) break;

        std::deque<Event> batch;
        batch.swap(queue_);
        lk.unlock();
        for (const auto& ev : batch) write_event(ev);
        out_.flush();
        lk.lock();
    }
}

void FileSessionJournal::write_event(const Event& ev) {
    switch (ev.type) {
        case EventType::STARTED:
            totals_[ev.session_id] = 0;
            out_ << ev.wall_ms << " start " << ev.session_id
                 << " room=" << ev.room << " source=" << ev.source << "\n";
            break;
        case EventType::BYTES:
            totals_[ev.session_id] += ev.bytes;
            out_ << ev.wall_ms << " bytes " << ev.session_id << " n=" << ev.bytes << "\n";
            break;
        case EventType::ENDED: {
            uint64_t total = 0;
            auto it = totals_.find(ev.session_id);
            if (it != totals_.end()) {
                total = it->second;
                totals_.erase(it);
            }
            out_ << ev.wall_ms << " end " << ev.session_id << " total=" << total << "\n";
        } break;
    }
}

} // namespace relaycp
