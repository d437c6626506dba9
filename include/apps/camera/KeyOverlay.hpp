#pragma once
#include <set>
#include <string>

#include "os/rtos.hpp"

namespace camera {

struct KeyOverlayConfig {
    bool enabled = true;
    double visual_delay_s = 0.1;   // key appears this long after the press
    double sustain_s = 0.15;       // and stays this long after release
};

static inline KeyOverlayConfig sanitise(const KeyOverlayConfig& in) {
    KeyOverlayConfig c = in;
    if (c.visual_delay_s < 0.0) c.visual_delay_s = 0.0;
    if (c.sustain_s < 0.0) c.sustain_s = 0.0;
    return c;
}

// ------------------------------
// KeyOverlay: the set of keys drawn as "pressed" in replay clips.
// Adds/removes are deferred closures on the shared TimerService, tagged
// per key so a new press on a key supersedes that key's pending timers.
// The TimerService must outlive this object.
// ------------------------------
class KeyOverlay {
public:
    KeyOverlay(Rtos::TimerService& timers, const KeyOverlayConfig& cfg);
    ~KeyOverlay();

    KeyOverlay(const KeyOverlay&) = delete;
    KeyOverlay& operator=(const KeyOverlay&) = delete;

    // Momentary press: visible from delay to delay + duration + sustain.
    void logPress(const std::string& key, double duration_s);

    // Held until stopPress.
    void startPress(const std::string& key);
    void stopPress(const std::string& key);

    std::set<std::string> snapshot() const;

    // Cancels every pending timer and empties the set.
    void clear();

    bool enabled() const { return m_cfg.enabled; }
    void setEnabled(bool on) { m_cfg.enabled = on; }

private:
    Rtos::TimerService& m_timers;
    KeyOverlayConfig m_cfg{};

    mutable Rtos::Mutex m_mtx;
    std::set<std::string> m_active;
    std::set<std::string> m_known;  // keys that ever had timers

    void add(const std::string& key);
    void remove(const std::string& key);
    void defer(const std::string& key, double delay_s, bool add_key);

    static std::string tagFor(const std::string& key) { return "overlay:" + key; }
};

} // namespace camera
