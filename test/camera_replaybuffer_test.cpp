#include <iostream>

#include "apps/camera/ReplayBuffer.hpp"

static void printResult(const char* name, bool ok) {
    std::cout << name << ": " << (ok ? "OK" : "FAIL") << "\n";
}

static msg::ReplayFrame makeFrame(uint32_t id) {
    msg::ReplayFrame f;
    f.frame_id = id;
    f.t_us = static_cast<uint64_t>(id) * 1000;
    f.image = cv::Mat(4, 4, CV_8UC3, cv::Scalar(id, id, id));
    f.leds["red"] = static_cast<uint8_t>(id % 2);
    return f;
}

int main() {
    std::cout << "=== camera_replaybuffer_test ===\n";
    bool all = true;

    {
        std::cout << "\n[Test 1] empty ring\n";
        camera::ReplayBuffer buf(3);
        msg::ReplayFrame f;
        const bool ok = !buf.latest(f) && buf.drain().empty() && buf.size() == 0 && buf.pushed() == 0;
        printResult("latest/drain on empty", ok);
        all = all && ok;
    }

    {
        std::cout << "\n[Test 2] oldest overwritten first\n";
        camera::ReplayBuffer buf(3);
        for (uint32_t i = 1; i <= 5; ++i) buf.push(makeFrame(i));

        const auto frames = buf.drain();
        const bool order = frames.size() == 3 && frames[0].frame_id == 3 &&
                           frames[1].frame_id == 4 && frames[2].frame_id == 5;

        msg::ReplayFrame last;
        const bool newest = buf.latest(last) && last.frame_id == 5 && last.leds.at("red") == 1;
        const bool counts = buf.size() == 3 && buf.pushed() == 5;
        const bool untouched = buf.drain().size() == 3;

        printResult("drain oldest-to-newest", order);
        printResult("latest is newest", newest);
        printResult("size and push count", counts);
        printResult("drain leaves the ring intact", untouched);
        all = all && order && newest && counts && untouched;
    }

    {
        std::cout << "\n[Test 3] partially filled ring\n";
        camera::ReplayBuffer buf(4);
        buf.push(makeFrame(10));
        buf.push(makeFrame(11));

        const auto frames = buf.drain();
        const bool ok = frames.size() == 2 && frames[0].frame_id == 10 && frames[1].frame_id == 11;
        printResult("two of four", ok);
        all = all && ok;
    }

    {
        std::cout << "\n[Test 4] clear() and zero capacity\n";
        camera::ReplayBuffer buf(2);
        buf.push(makeFrame(1));
        buf.push(makeFrame(2));
        buf.clear();
        msg::ReplayFrame f;
        const bool cleared = buf.size() == 0 && buf.pushed() == 0 && !buf.latest(f);

        buf.push(makeFrame(7));
        const bool reused = buf.latest(f) && f.frame_id == 7 && buf.drain().size() == 1;

        camera::ReplayBuffer tiny(0);
        tiny.push(makeFrame(1));
        tiny.push(makeFrame(2));
        const bool one = tiny.capacity() == 1 && tiny.size() == 1 && tiny.drain().front().frame_id == 2;

        printResult("clear resets", cleared);
        printResult("usable after clear", reused);
        printResult("capacity 0 -> 1", one);
        all = all && cleared && reused && one;
    }

    if (!all) {
        std::cout << "\ncamera_replaybuffer_test: FAIL\n";
        return 1;
    }
    std::cout << "\ncamera_replaybuffer_test: PASS\n";
    return 0;
}
