#pragma once
#include <cstddef> // Required for size_t
#include <cstdint>
#include <functional>
#include <string>

namespace Rtos {

void SleepMs(int ms);

// Monotonic time since an arbitrary epoch.
uint64_t NowUs();
double   NowSec();

//== Task abstraction ==//
// This class provides a simple task wrapper
class Task {
public:
    Task();
    ~Task();

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    bool Create(const char* name, void (*fn)(void*), void* arg);
    void Join();

    // Bounded join. Returns false if the task is still running after timeout_ms.
    bool JoinFor(int timeout_ms);

    bool Running() const;

private:
    struct TaskHandle;
    TaskHandle* handle_;
};

//== Mutex abstraction ==//
// This class provides a simple mutex wrapper.
// Satisfies BasicLockable, so std::lock_guard<Rtos::Mutex> works.

class Mutex {
public:
    Mutex();
    ~Mutex();

    Mutex(const Mutex&) = delete;
    Mutex& operator=(const Mutex&) = delete;

    void lock();
    void unlock();

private:
    struct MutexHandle;
    MutexHandle* handle_;
};

//== Binary Semaphore abstraction ==//
class BinarySemaphore {
public:
    BinarySemaphore();
    ~BinarySemaphore();

    BinarySemaphore(const BinarySemaphore&) = delete;
    BinarySemaphore& operator=(const BinarySemaphore&) = delete;

    void take();                  // Blocks until available
    bool try_take();              // Non-blocking
    bool take_for(int timeout_ms); // Blocks up to timeout_ms
    void give();                  // Releases the semaphore

private:
    struct SemaphoreHandle;
    SemaphoreHandle* handle_;
};

//== Timer service ==//
// One worker task runs deferred callbacks in deadline order.
// Every timer carries a tag; outstanding timers are tracked per tag so a
// caller can cancel all work it scheduled for one key without touching
// anyone else's. Callbacks run on the worker, never under the service lock.
class TimerService {
public:
    using Callback = std::function<void()>;

    TimerService();
    ~TimerService();

    TimerService(const TimerService&) = delete;
    TimerService& operator=(const TimerService&) = delete;

    bool Start();
    // Cancels everything still pending, then joins the worker.
    void Stop();

    // Returns a non-zero timer id, or 0 if the service is not running.
    uint64_t schedule(int delay_ms, const std::string& tag, Callback fn);

    // Drop pending timers. Returns how many were removed. Called off the
    // worker, also waits for a matching callback that is already running.
    std::size_t cancel(const std::string& tag);
    std::size_t cancelAll();

    std::size_t pending(const std::string& tag) const;
    std::size_t pending() const;

    bool running() const;

    static void TaskEntry(void* arg);

private:
    struct TimerHandle;
    TimerHandle* handle_;

    void Run();
};

} // namespace Rtos
