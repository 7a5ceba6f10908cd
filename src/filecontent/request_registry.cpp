#include "request_registry.hpp"

namespace filecontent
{
    std::shared_ptr<CancelToken> RequestRegistry::begin(const std::string &resourceKey)
    {
        auto token = std::make_shared<CancelToken>();
        std::lock_guard<std::mutex> lock(mutex_);
        auto &slot = current_[resourceKey];
        if (slot)
            slot->cancel();
        slot = token;
        return token;
    }

    void RequestRegistry::finish(const std::string &resourceKey, const std::shared_ptr<CancelToken> &token)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = current_.find(resourceKey);
        if (found != current_.end() && found->second == token)
            current_.erase(found);
    }

    std::size_t RequestRegistry::inFlight() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_.size();
    }
}
