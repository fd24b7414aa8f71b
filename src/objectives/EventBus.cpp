// src/objectives/EventBus.cpp
#include "eldritch/objectives/EventBus.h"

#include "eldritch/logging/Log.h"

#include <exception>

namespace eldritch {

json ToJson(const BusEvent& e)
{
    return {{"timestamp", FormatIso8601(e.timestamp)}, {"type", e.type}, {"data", e.data}};
}

int EventBus::subscribe(const std::string& type, Handler h)
{
    const int id = ++sid_;
    subs_[type].emplace_back(id, std::move(h));
    return id;
}

bool EventBus::unsubscribe(int subscriptionId)
{
    for (auto& kv : subs_)
    {
        auto& handlers = kv.second;
        for (auto it = handlers.begin(); it != handlers.end(); ++it)
        {
            if (it->first == subscriptionId)
            {
                handlers.erase(it);
                return true;
            }
        }
    }
    return false;
}

std::size_t EventBus::listenerCount(const std::string& type) const
{
    auto it = subs_.find(type);
    return it == subs_.end() ? 0 : it->second.size();
}

void EventBus::emit(const std::string& type, json data, TimePoint now)
{
    BusEvent event{now, type, std::move(data)};

    recent_.push_back(event);
    while (recent_.size() > capacity_)
        recent_.pop_front();

    auto it = subs_.find(type);
    if (it == subs_.end())
        return;

    // Snapshot: a handler may subscribe or unsubscribe.
    const auto handlers = it->second;
    for (const auto& [id, handler] : handlers)
    {
        try
        {
            handler(event);
        }
        catch (const std::exception& e)
        {
            logsys::get()->error("Error in event listener #{} for {}: {}", id, type, e.what());
        }
    }
}

} // namespace eldritch
