#include "change_broadcaster.hpp"

#include <vector>
#include "../logger/Mylogger.hpp"

namespace broadcast
{
    ChangeBroadcaster::SubscriptionId ChangeBroadcaster::subscribe(std::shared_ptr<ChangeObserver> observer)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        SubscriptionId id = next_id_++;
        observers_.emplace(id, std::move(observer));
        return id;
    }

    void ChangeBroadcaster::unsubscribe(SubscriptionId id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        observers_.erase(id);
    }

    std::size_t ChangeBroadcaster::publish(const nlohmann::json &message)
    {
        const std::string payload = message.dump();

        // Deliver outside the lock so an observer may unsubscribe from deliver().
        std::vector<std::shared_ptr<ChangeObserver>> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            targets.reserve(observers_.size());
            for (const auto &[id, observer] : observers_)
                targets.push_back(observer);
        }

        std::size_t delivered = 0;
        for (const auto &observer : targets)
        {
            if (!observer->isReady())
                continue;
            observer->deliver(payload);
            ++delivered;
        }
        MyLogger::debug("Broadcast " + payload + " to " + std::to_string(delivered) + " client(s)");
        return delivered;
    }

    std::size_t ChangeBroadcaster::observerCount() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return observers_.size();
    }

    nlohmann::json entryEvent(const std::string &type, const std::string &path)
    {
        return nlohmann::json{{"type", type}, {"path", path}};
    }

    nlohmann::json tagEvent(const std::string &type, const store::Tag &tag)
    {
        return nlohmann::json{
            {"type", type},
            {"path", tag.path},
            {"tag", {{"key", tag.key}, {"value", tag.value}}}};
    }
}
