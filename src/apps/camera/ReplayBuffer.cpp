#include "apps/camera/ReplayBuffer.hpp"

#include <mutex>

namespace camera {

ReplayBuffer::ReplayBuffer(std::size_t capacity)
    : m_slots(capacity < 1 ? 1 : capacity) {}

void ReplayBuffer::push(const msg::ReplayFrame& f) {
    std::lock_guard<Rtos::Mutex> lk(m_mtx);
    m_slots[m_head] = f;
    m_head = (m_head + 1) % m_slots.size();
    if (m_count < m_slots.size()) ++m_count;
    ++m_pushed;
}

bool ReplayBuffer::latest(msg::ReplayFrame& out) const {
    std::lock_guard<Rtos::Mutex> lk(m_mtx);
    if (m_count == 0) return false;
    const std::size_t idx = (m_head + m_slots.size() - 1) % m_slots.size();
    out = m_slots[idx];
    return true;
}

std::vector<msg::ReplayFrame> ReplayBuffer::drain() const {
    std::lock_guard<Rtos::Mutex> lk(m_mtx);
    std::vector<msg::ReplayFrame> out;
    out.reserve(m_count);
    const std::size_t oldest = (m_head + m_slots.size() - m_count) % m_slots.size();
    for (std::size_t i = 0; i < m_count; ++i) {
        out.push_back(m_slots[(oldest + i) % m_slots.size()]);
    }
    return out;
}

void ReplayBuffer::clear() {
    std::lock_guard<Rtos::Mutex> lk(m_mtx);
    for (auto& s : m_slots) s = msg::ReplayFrame{};
    m_head = 0;
    m_count = 0;
    m_pushed = 0;
}

std::size_t ReplayBuffer::size() const {
    std::lock_guard<Rtos::Mutex> lk(m_mtx);
    return m_count;
}

uint64_t ReplayBuffer::pushed() const {
    std::lock_guard<Rtos::Mutex> lk(m_mtx);
    return m_pushed;
}

} // namespace camera
