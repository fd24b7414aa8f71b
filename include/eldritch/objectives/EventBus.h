// include/eldritch/objectives/EventBus.h
#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "eldritch/core/Json.h"
#include "eldritch/core/Time.h"
#include "eldritch/objectives/ObjectiveTypes.h"

namespace eldritch {

struct BusEvent
{
    TimePoint   timestamp{};
    std::string type;
    json        data = json::object();
};

[[nodiscard]] json ToJson(const BusEvent& e);

// Synchronous in-process fan-out keyed by event type. Handlers run inline
// and must not re-enter the manager's mutating API. A throwing handler is
// logged and the remaining handlers still run.
class EventBus
{
public:
    using Handler = std::function<void(const BusEvent&)>;

    explicit EventBus(std::size_t recentCapacity = ELDRITCH_RECENT_EVENT_CAPACITY)
        : capacity_(recentCapacity) {}

    int subscribe(const std::string& type, Handler h);
    bool unsubscribe(int subscriptionId);
    void unsubscribeAll() { subs_.clear(); }

    void emit(const std::string& type, json data, TimePoint now);

    // Oldest first; bounded to the capacity given at construction.
    const std::deque<BusEvent>& recent() const noexcept { return recent_; }
    void clearRecent() { recent_.clear(); }
    std::size_t listenerCount(const std::string& type) const;

private:
    std::size_t capacity_;
    int sid_ = 0;
    std::unordered_map<std::string, std::vector<std::pair<int, Handler>>> subs_;
    std::deque<BusEvent> recent_;
};

} // namespace eldritch
