#include "apps/camera/KeyOverlay.hpp"

#include <iostream>
#include <mutex>

namespace camera {

namespace {
int to_ms(double s) { return static_cast<int>(s * 1000.0 + 0.5); }
}

KeyOverlay::KeyOverlay(Rtos::TimerService& timers, const KeyOverlayConfig& cfg)
    : m_timers(timers), m_cfg(sanitise(cfg)) {}

KeyOverlay::~KeyOverlay() {
    clear();
}

void KeyOverlay::add(const std::string& key) {
    std::lock_guard<Rtos::Mutex> lk(m_mtx);
    m_active.insert(key);
}

void KeyOverlay::remove(const std::string& key) {
    std::lock_guard<Rtos::Mutex> lk(m_mtx);
    m_active.erase(key);
}

void KeyOverlay::defer(const std::string& key, double delay_s, bool add_key) {
    {
        std::lock_guard<Rtos::Mutex> lk(m_mtx);
        m_known.insert(key);
    }
    auto fn = add_key ? Rtos::TimerService::Callback([this, key] { add(key); })
                      : Rtos::TimerService::Callback([this, key] { remove(key); });
    if (m_timers.schedule(to_ms(delay_s), tagFor(key), fn) == 0) {
        // No timer worker: apply immediately
        fn();
    }
}

void KeyOverlay::logPress(const std::string& key, double duration_s) {
    if (!m_cfg.enabled) return;
    if (duration_s < 0.0) duration_s = 0.0;

    m_timers.cancel(tagFor(key));
    defer(key, m_cfg.visual_delay_s, true);
    defer(key, m_cfg.visual_delay_s + duration_s + m_cfg.sustain_s, false);
}

void KeyOverlay::startPress(const std::string& key) {
    if (!m_cfg.enabled) return;
    m_timers.cancel(tagFor(key));
    defer(key, m_cfg.visual_delay_s, true);
}

void KeyOverlay::stopPress(const std::string& key) {
    if (!m_cfg.enabled) return;
    m_timers.cancel(tagFor(key));
    defer(key, m_cfg.visual_delay_s + m_cfg.sustain_s, false);
}

std::set<std::string> KeyOverlay::snapshot() const {
    std::lock_guard<Rtos::Mutex> lk(m_mtx);
    return m_active;
}

void KeyOverlay::clear() {
    std::set<std::string> known;
    {
        std::lock_guard<Rtos::Mutex> lk(m_mtx);
        known = m_known;
    }
    std::size_t dropped = 0;
    for (const auto& k : known) dropped += m_timers.cancel(tagFor(k));
    if (dropped > 0) {
        std::cout << "[OVERLAY] cancelled " << dropped << " pending key timer(s)\n";
    }

    std::lock_guard<Rtos::Mutex> lk(m_mtx);
    m_active.clear();
}

} // namespace camera
