#pragma once
#include <cstddef>
#include <vector>

#include "os/rtos.hpp"
#include "msg/ReplayFrame.hpp"

namespace camera {

// ------------------------------
// ReplayBuffer: fixed-capacity ring, oldest overwritten first.
// The lock is held only for copy-in / copy-out; readers get copies.
// cv::Mat copies share pixel data, and producers never write into a
// pushed frame again.
// ------------------------------
class ReplayBuffer {
public:
    explicit ReplayBuffer(std::size_t capacity);

    void push(const msg::ReplayFrame& f);

    // Newest entry. Returns false when empty.
    bool latest(msg::ReplayFrame& out) const;

    // Oldest-to-newest copy of everything held. The ring is not modified.
    std::vector<msg::ReplayFrame> drain() const;

    void clear();

    std::size_t size() const;
    std::size_t capacity() const { return m_slots.size(); }

    // Total pushes since construction (or clear)
    uint64_t pushed() const;

private:
    mutable Rtos::Mutex m_mtx;
    std::vector<msg::ReplayFrame> m_slots;
    std::size_t m_head = 0;   // next write
    std::size_t m_count = 0;
    uint64_t m_pushed = 0;
};

} // namespace camera
