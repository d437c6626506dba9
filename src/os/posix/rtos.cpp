#include "os/rtos.hpp"
#include <pthread.h>
#include <unistd.h>   // for usleep
#include <iostream>   // for std::cerr
#include <cerrno>
#include <cstring>
#include <ctime>
#include <atomic>
#include <memory>

namespace Rtos {

namespace {

timespec abs_deadline(clockid_t clk, int timeout_ms) {
    timespec ts{};
    clock_gettime(clk, &ts);
    ts.tv_sec  += timeout_ms / 1000;
    ts.tv_nsec += static_cast<long>(timeout_ms % 1000) * 1000000L;
    if (ts.tv_nsec >= 1000000000L) {
        ts.tv_sec  += 1;
        ts.tv_nsec -= 1000000000L;
    }
    return ts;
}

} // namespace

// Sleep utility
void SleepMs(int ms) {
    if (ms <= 0) return;
    usleep(static_cast<useconds_t>(ms) * 1000);  // Convert ms to microseconds
}

uint64_t NowUs() {
    timespec ts{};
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<uint64_t>(ts.tv_sec) * 1000000ULL + static_cast<uint64_t>(ts.tv_nsec) / 1000ULL;
}

double NowSec() {
    return static_cast<double>(NowUs()) * 1e-6;
}

// =======================
// Task Implementation
// =======================

// Wrapper to convert function pointer to pthread-style.
// 'done' outlives the Task object when the thread is detached.
struct ThreadArgs {
    void (*fn)(void*);
    void* arg;
    std::shared_ptr<std::atomic<bool>> done;
};

// Static thread entry point
void* threadEntryPoint(void* ptr) {
    ThreadArgs* args = static_cast<ThreadArgs*>(ptr);
    args->fn(args->arg);
    args->done->store(true);
    delete args;
    return nullptr;
}

// Platform-specific handle
struct Task::TaskHandle {
    pthread_t thread;
    bool created = false;
    bool joined = false;
    std::shared_ptr<std::atomic<bool>> done = std::make_shared<std::atomic<bool>>(false);
};

// Constructor
Task::Task() {
    handle_ = new TaskHandle{};
}

// Destructor
Task::~Task() {
    if (handle_ && !handle_->joined && handle_->created) {
        pthread_detach(handle_->thread);  // detach if not joined
    }
    delete handle_;
}

// Create a new thread
bool Task::Create(const char* name, void (*fn)(void*), void* arg) {
    if (handle_->created && !handle_->joined) {
        std::cerr << "[Task] " << (name ? name : "?") << " already running\n";
        return false;
    }

    handle_->done = std::make_shared<std::atomic<bool>>(false);
    auto* args = new ThreadArgs{fn, arg, handle_->done};

    const int rc = pthread_create(&handle_->thread, nullptr, threadEntryPoint, args);
    if (rc != 0) {
        std::cerr << "[Task] Failed to create " << (name ? name : "?")
                  << " err=" << rc << " " << std::strerror(rc) << "\n";
        delete args;
        return false;
    }
    handle_->created = true;
    handle_->joined = false;
    return true;
}

void Task::Join() {
    if (handle_ && handle_->created && !handle_->joined) {
        pthread_join(handle_->thread, nullptr);
        handle_->joined = true;
    }
}

bool Task::JoinFor(int timeout_ms) {
    if (!handle_ || !handle_->created || handle_->joined) return true;

    timespec ts = abs_deadline(CLOCK_REALTIME, timeout_ms);
    const int rc = pthread_timedjoin_np(handle_->thread, nullptr, &ts);
    if (rc == 0) {
        handle_->joined = true;
        return true;
    }
    if (rc != ETIMEDOUT) {
        std::cerr << "[Task] timed join failed err=" << rc << " " << std::strerror(rc) << "\n";
    }
    return false;
}

bool Task::Running() const {
    return handle_ && handle_->created && !handle_->joined && !handle_->done->load();
}

// =======================
// Mutex Implementation
// =======================

struct Mutex::MutexHandle {
    pthread_mutex_t native;
};

Mutex::Mutex() {
    handle_ = new MutexHandle;
    if (pthread_mutex_init(&handle_->native, nullptr) != 0) {
        std::cerr << "Mutex init failed\n";
    }
}

Mutex::~Mutex() {
    pthread_mutex_destroy(&handle_->native);
    delete handle_;
}

void Mutex::lock() {
    pthread_mutex_lock(&handle_->native);
}

void Mutex::unlock() {
    pthread_mutex_unlock(&handle_->native);
}

// =======================
// Binary Semaphore Implementation
// =======================

struct BinarySemaphore::SemaphoreHandle {
    pthread_mutex_t mutex;
    pthread_cond_t cond;
    bool available;  // acts like a binary flag
};

BinarySemaphore::BinarySemaphore() {
    handle_ = new SemaphoreHandle;
    pthread_mutex_init(&handle_->mutex, nullptr);

    // Timed waits measure against the monotonic clock
    pthread_condattr_t attr;
    pthread_condattr_init(&attr);
    pthread_condattr_setclock(&attr, CLOCK_MONOTONIC);
    pthread_cond_init(&handle_->cond, &attr);
    pthread_condattr_destroy(&attr);

    handle_->available = false;  // starts as "not given"
}

BinarySemaphore::~BinarySemaphore() {
    pthread_cond_destroy(&handle_->cond);
    pthread_mutex_destroy(&handle_->mutex);
    delete handle_;
}

void BinarySemaphore::take() {
    pthread_mutex_lock(&handle_->mutex);
    while (!handle_->available) {
        pthread_cond_wait(&handle_->cond, &handle_->mutex);
    }
    handle_->available = false;  // consume the semaphore
    pthread_mutex_unlock(&handle_->mutex);
}

bool BinarySemaphore::try_take() {
    bool acquired = false;
    pthread_mutex_lock(&handle_->mutex);
    if (handle_->available) {
        handle_->available = false;
        acquired = true;
    }
    pthread_mutex_unlock(&handle_->mutex);
    return acquired;
}

bool BinarySemaphore::take_for(int timeout_ms) {
    if (timeout_ms <= 0) return try_take();

    const timespec deadline = abs_deadline(CLOCK_MONOTONIC, timeout_ms);

    bool acquired = false;
    pthread_mutex_lock(&handle_->mutex);
    while (!handle_->available) {
        const int rc = pthread_cond_timedwait(&handle_->cond, &handle_->mutex, &deadline);
        if (rc == ETIMEDOUT) break;
    }
    if (handle_->available) {
        handle_->available = false;
        acquired = true;
    }
    pthread_mutex_unlock(&handle_->mutex);
    return acquired;
}

void BinarySemaphore::give() {
    pthread_mutex_lock(&handle_->mutex);
    handle_->available = true;
    pthread_cond_signal(&handle_->cond);  // wake one waiting thread
    pthread_mutex_unlock(&handle_->mutex);
}

}  // namespace Rtos
