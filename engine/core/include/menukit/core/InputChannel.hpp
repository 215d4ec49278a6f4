#pragma once

#include <functional>
#include <limits>
#include <unordered_map>

namespace menukit::core {

enum class PushState { Unknown, NotPushed, Pushed };

constexpr bool IsPushed(PushState state) noexcept {
    return state == PushState::Pushed;
}

// Repeat delay that never elapses: the query fires once per physical press.
inline constexpr double kNoRepeat = std::numeric_limits<double>::infinity();

// Seconds on a monotonic clock.
using TimeSource = std::function<double()>;

TimeSource SteadyTimeSource();

// Press edge and typematic repeat tracking for one family of input ids.
//
// The first Push() after a press fires regardless of the delay and arms the
// repeat timer; while the input stays held, Push() fires again each time
// `delay` seconds have passed since it last fired. A release does not clear a
// pending first press, so a tap that starts and ends inside one event batch is
// still reported once. A press on an input that is already down is ignored.
template <typename Id, typename Hash = std::hash<Id>>
class InputChannel {
public:
    void Press(const Id& id) {
        Entry& entry = entries_[id];
        if (entry.down) {
            return;
        }
        entry.down = true;
        entry.first = true;
    }

    void Release(const Id& id) { entries_[id].down = false; }

    PushState Push(const Id& id, double delay, double now) {
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return PushState::Unknown;
        }
        Entry& entry = it->second;
        if (entry.first) {
            entry.first = false;
            entry.last_fire = now;
            return PushState::Pushed;
        }
        if (!entry.down) {
            return PushState::NotPushed;
        }
        if (now - entry.last_fire >= delay) {
            entry.last_fire = now;
            return PushState::Pushed;
        }
        return PushState::NotPushed;
    }

    bool known(const Id& id) const { return entries_.count(id) != 0; }

    bool held(const Id& id) const {
        auto it = entries_.find(id);
        return it != entries_.end() && it->second.down;
    }

    std::size_t size() const noexcept { return entries_.size(); }

private:
    struct Entry {
        bool down = false;
        bool first = false;
        double last_fire = 0.0;
    };

    std::unordered_map<Id, Entry, Hash> entries_;
};

}  // namespace menukit::core
