#include "os/rtos.hpp"
#include <atomic>
#include <iostream>

static void printResult(const char* name, bool ok) {
    std::cout << name << ": " << (ok ? "OK" : "FAIL") << "\n";
}

Rtos::BinarySemaphore sem;
std::atomic<bool> consumerGot{false};

void Consumer(void*) {
    std::cout << "[Consumer] Waiting for semaphore...\n";
    // Non-blocking attempt
    if (sem.try_take()) {
        std::cout << "[Consumer] Semaphore acquired immediately!\n";
    } else {
        std::cout << "[Consumer] Semaphore not available, waiting...\n";
        sem.take();  // Will block until Producer gives
        std::cout << "[Consumer] Semaphore acquired after waiting!\n";
    }
    consumerGot.store(true);
}

void Producer(void*) {
    std::cout << "[Producer] Sleeping for 500 ms before giving semaphore...\n";
    Rtos::SleepMs(500);
    std::cout << "[Producer] Giving semaphore now.\n";
    sem.give();
}

void SlowTask(void*) {
    Rtos::SleepMs(800);
}

int main() {
    std::cout << "=== rtos_semaphore_test ===\n";
    bool all = true;

    {
        std::cout << "\n[Test 1] take() blocks until another task gives\n";
        Rtos::Task consumerTask;
        Rtos::Task producerTask;

        consumerTask.Create("Consumer", Consumer, nullptr);
        producerTask.Create("Producer", Producer, nullptr);

        consumerTask.Join();
        producerTask.Join();

        printResult("consumer acquired", consumerGot.load());
        all = all && consumerGot.load();
    }

    {
        std::cout << "\n[Test 2] take_for() times out without a give\n";
        Rtos::BinarySemaphore s;
        const double t0 = Rtos::NowSec();
        const bool got = s.take_for(200);
        const double waited = Rtos::NowSec() - t0;
        std::cout << "waited " << waited << "s\n";

        const bool ok = !got && waited >= 0.15;
        printResult("take_for(200) timeout", ok);
        all = all && ok;
    }

    {
        std::cout << "\n[Test 3] take_for() returns early after a give; binary, not counting\n";
        Rtos::BinarySemaphore s;
        s.give();
        s.give();
        const bool first = s.take_for(100);
        const bool second = s.try_take();

        const bool ok = first && !second;
        printResult("give twice, take once", ok);
        all = all && ok;
    }

    {
        std::cout << "\n[Test 4] JoinFor() is bounded\n";
        Rtos::Task t;
        t.Create("Slow", SlowTask, nullptr);

        const bool running = t.Running();
        const bool early = t.JoinFor(100);
        printResult("Running() while the task sleeps", running);
        printResult("JoinFor(100) on a running task returns false", !early);
        const bool late = t.JoinFor(2000);
        printResult("JoinFor(2000) joins", late);
        printResult("not Running() after the join", !t.Running());
        all = all && running && !early && late && !t.Running();
    }

    if (!all) {
        std::cout << "\nrtos_semaphore_test: FAIL\n";
        return 1;
    }
    std::cout << "\nrtos_semaphore_test: PASS\n";
    return 0;
}
