#ifndef CHANGE_BROADCASTER_HPP
#define CHANGE_BROADCASTER_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "nlohmann/json.hpp"
#include "../store/records.hpp"

namespace broadcast
{
    // A connected client that wants change notifications.
    class ChangeObserver
    {
    public:
        virtual ~ChangeObserver() = default;

        // False while the connection is not open; such observers are skipped.
        virtual bool isReady() const = 0;
        // Must not block.
        virtual void deliver(const std::string &payload) = 0;
    };

    /// Fan-out of change events to every ready observer.
    class ChangeBroadcaster
    {
    public:
        using SubscriptionId = std::uint64_t;

        SubscriptionId subscribe(std::shared_ptr<ChangeObserver> observer);
        void unsubscribe(SubscriptionId id);

        // Serializes once, then delivers to each ready observer.
        // Returns the number of observers reached.
        std::size_t publish(const nlohmann::json &message);

        std::size_t observerCount() const;

    private:
        mutable std::mutex mutex_;
        std::map<SubscriptionId, std::shared_ptr<ChangeObserver>> observers_;
        SubscriptionId next_id_ = 1;
    };

    nlohmann::json entryEvent(const std::string &type, const std::string &path);
    nlohmann::json tagEvent(const std::string &type, const store::Tag &tag);
}

#endif // CHANGE_BROADCASTER_HPP
