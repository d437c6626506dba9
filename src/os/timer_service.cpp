#include "os/rtos.hpp"

#include <atomic>
#include <condition_variable>
#include <exception>
#include <iostream>
#include <map>
#include <mutex>
#include <thread>

namespace Rtos {

// =======================
// Timer Service Implementation
// =======================

namespace {

struct TimerEntry {
    uint64_t id = 0;
    std::string tag;
    TimerService::Callback fn;
};

// Idle poll interval when nothing is scheduled
constexpr int IDLE_WAIT_MS = 100;

} // namespace

struct TimerService::TimerHandle {
    mutable Mutex mtx;
    BinarySemaphore wake;
    Task task;

    // Deadline ordered; equal deadlines keep insertion order
    std::multimap<uint64_t, TimerEntry> queue;
    uint64_t next_id = 1;

    // Callback popped from the queue and running on the worker
    bool in_flight = false;
    std::string in_flight_tag;
    std::condition_variable_any idle;
    std::thread::id worker;

    std::atomic<bool> running{false};

    // Caller must hold mtx. The worker never waits on itself.
    template <typename Pred>
    void waitIdle(std::unique_lock<Mutex>& lk, Pred busy) {
        if (std::this_thread::get_id() == worker) return;
        idle.wait(lk, [this, &busy] { return !in_flight || !busy(); });
    }
};

TimerService::TimerService() {
    handle_ = new TimerHandle;
}

TimerService::~TimerService() {
    Stop();
    delete handle_;
}

bool TimerService::Start() {
    if (handle_->running.load()) return true;

    handle_->running.store(true);
    if (!handle_->task.Create("TimerService", &TimerService::TaskEntry, this)) {
        handle_->running.store(false);
        std::cerr << "[TIMER] worker create failed\n";
        return false;
    }
    return true;
}

void TimerService::Stop() {
    if (!handle_->running.exchange(false)) return;

    const std::size_t dropped = cancelAll();
    if (dropped > 0) {
        std::cout << "[TIMER] stop cancelled " << dropped << " pending timer(s)\n";
    }
    handle_->wake.give();
    handle_->task.Join();
}

uint64_t TimerService::schedule(int delay_ms, const std::string& tag, Callback fn) {
    if (!handle_->running.load() || !fn) return 0;
    if (delay_ms < 0) delay_ms = 0;

    const uint64_t due = NowUs() + static_cast<uint64_t>(delay_ms) * 1000ULL;

    uint64_t id = 0;
    {
        std::lock_guard<Mutex> lk(handle_->mtx);
        id = handle_->next_id++;
        handle_->queue.emplace(due, TimerEntry{id, tag, std::move(fn)});
    }
    handle_->wake.give();
    return id;
}

std::size_t TimerService::cancel(const std::string& tag) {
    std::unique_lock<Mutex> lk(handle_->mtx);
    std::size_t n = 0;
    for (auto it = handle_->queue.begin(); it != handle_->queue.end();) {
        if (it->second.tag == tag) {
            it = handle_->queue.erase(it);
            ++n;
        } else {
            ++it;
        }
    }
    // A callback for this tag already popped may still be running
    handle_->waitIdle(lk, [this, &tag] { return handle_->in_flight_tag == tag; });
    return n;
}

std::size_t TimerService::cancelAll() {
    std::unique_lock<Mutex> lk(handle_->mtx);
    const std::size_t n = handle_->queue.size();
    handle_->queue.clear();
    handle_->waitIdle(lk, [] { return true; });
    return n;
}

std::size_t TimerService::pending(const std::string& tag) const {
    std::lock_guard<Mutex> lk(handle_->mtx);
    std::size_t n = 0;
    for (const auto& kv : handle_->queue) {
        if (kv.second.tag == tag) ++n;
    }
    return n;
}

std::size_t TimerService::pending() const {
    std::lock_guard<Mutex> lk(handle_->mtx);
    return handle_->queue.size();
}

bool TimerService::running() const {
    return handle_->running.load();
}

void TimerService::TaskEntry(void* arg) {
    static_cast<TimerService*>(arg)->Run();
}

void TimerService::Run() {
    {
        std::lock_guard<Mutex> lk(handle_->mtx);
        handle_->worker = std::this_thread::get_id();
    }

    while (handle_->running.load()) {
        TimerEntry due_entry;
        bool fire = false;
        int wait_ms = IDLE_WAIT_MS;

        {
            std::lock_guard<Mutex> lk(handle_->mtx);
            if (!handle_->queue.empty()) {
                auto it = handle_->queue.begin();
                const uint64_t now = NowUs();
                if (it->first <= now) {
                    due_entry = std::move(it->second);
                    handle_->queue.erase(it);
                    handle_->in_flight = true;
                    handle_->in_flight_tag = due_entry.tag;
                    fire = true;
                } else {
                    wait_ms = static_cast<int>((it->first - now) / 1000ULL) + 1;
                    if (wait_ms > IDLE_WAIT_MS) wait_ms = IDLE_WAIT_MS;
                }
            }
        }

        if (fire) {
            // Outside the lock so callbacks may schedule or cancel
            try {
                due_entry.fn();
            } catch (const std::exception& e) {
                std::cerr << "[TIMER] callback '" << due_entry.tag << "' threw: " << e.what() << "\n";
            }
            {
                std::lock_guard<Mutex> lk(handle_->mtx);
                handle_->in_flight = false;
                handle_->in_flight_tag.clear();
            }
            handle_->idle.notify_all();
            continue;
        }

        handle_->wake.take_for(wait_ms);
    }
}

} // namespace Rtos
