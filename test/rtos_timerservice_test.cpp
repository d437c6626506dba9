#include "os/rtos.hpp"
#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

static void printResult(const char* name, bool ok) {
    std::cout << name << ": " << (ok ? "OK" : "FAIL") << "\n";
}

int main() {
    std::cout << "=== rtos_timerservice_test ===\n";
    bool all = true;

    {
        std::cout << "\n[Test 0] schedule() before Start() is refused\n";
        Rtos::TimerService ts;
        const uint64_t id = ts.schedule(10, "early", [] {});
        printResult("schedule() returns 0", id == 0);
        all = all && id == 0;
    }

    Rtos::TimerService ts;
    if (!ts.Start()) {
        std::cout << "FAIL: Start()\n";
        return 1;
    }

    {
        std::cout << "\n[Test 1] callbacks run in deadline order\n";
        Rtos::Mutex mtx;
        std::vector<std::string> order;
        auto note = [&](const char* s) {
            return [&mtx, &order, s] {
                std::lock_guard<Rtos::Mutex> lk(mtx);
                order.push_back(s);
            };
        };

        ts.schedule(150, "t", note("c"));
        ts.schedule(50, "t", note("a"));
        ts.schedule(100, "t", note("b"));
        Rtos::SleepMs(400);

        std::lock_guard<Rtos::Mutex> lk(mtx);
        const bool ok = order.size() == 3 && order[0] == "a" && order[1] == "b" && order[2] == "c";
        printResult("a, b, c", ok);
        all = all && ok;
    }

    {
        std::cout << "\n[Test 2] cancel(tag) drops only that tag\n";
        std::atomic<int> k1{0};
        std::atomic<int> k2{0};

        ts.schedule(200, "overlay:key1", [&] { k1.fetch_add(1); });
        ts.schedule(300, "overlay:key1", [&] { k1.fetch_add(1); });
        ts.schedule(200, "overlay:key2", [&] { k2.fetch_add(1); });

        const bool pending_ok = ts.pending("overlay:key1") == 2 && ts.pending("overlay:key2") == 1;
        printResult("pending per tag", pending_ok);

        const std::size_t dropped = ts.cancel("overlay:key1");
        Rtos::SleepMs(500);

        const bool ok = dropped == 2 && k1.load() == 0 && k2.load() == 1;
        printResult("key1 cancelled, key2 fired", ok);
        all = all && pending_ok && ok;
    }

    {
        std::cout << "\n[Test 3] a callback may schedule more work\n";
        std::atomic<int> hits{0};
        ts.schedule(10, "chain", [&] {
            hits.fetch_add(1);
            ts.schedule(10, "chain", [&] { hits.fetch_add(1); });
        });
        Rtos::SleepMs(300);

        const bool ok = hits.load() == 2;
        printResult("chained callback ran", ok);
        all = all && ok;
    }

    {
        std::cout << "\n[Test 4] cancel(tag) waits for a callback already running\n";
        std::atomic<bool> started{false};
        std::atomic<bool> finished{false};
        ts.schedule(0, "slow", [&] {
            started.store(true);
            Rtos::SleepMs(200);
            finished.store(true);
        });

        for (int i = 0; i < 100 && !started.load(); ++i) Rtos::SleepMs(5);
        const std::size_t dropped = ts.cancel("slow");
        const bool waited = started.load() && finished.load();

        // Cancelling from inside a callback must not block on itself
        std::atomic<bool> self_done{false};
        ts.schedule(0, "self", [&] {
            ts.cancel("self");
            self_done.store(true);
        });
        for (int i = 0; i < 100 && !self_done.load(); ++i) Rtos::SleepMs(5);

        printResult("nothing left queued", dropped == 0);
        printResult("cancel returned after the callback finished", waited);
        printResult("callback cancelled its own tag", self_done.load());
        all = all && dropped == 0 && waited && self_done.load();
    }

    {
        std::cout << "\n[Test 5] Stop() cancels everything still pending\n";
        std::atomic<int> hits{0};
        ts.schedule(1000, "late", [&] { hits.fetch_add(1); });
        ts.schedule(1000, "late2", [&] { hits.fetch_add(1); });

        ts.Stop();
        Rtos::SleepMs(1200);

        const bool ok = hits.load() == 0 && ts.pending() == 0 && !ts.running();
        printResult("nothing fired after Stop()", ok);
        all = all && ok;
    }

    if (!all) {
        std::cout << "\nrtos_timerservice_test: FAIL\n";
        return 1;
    }
    std::cout << "\nrtos_timerservice_test: PASS\n";
    return 0;
}
