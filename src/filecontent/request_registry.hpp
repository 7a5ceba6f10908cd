#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace filecontent
{
    class CancelToken
    {
    public:
        void cancel() { cancelled_ = true; }
        bool cancelled() const { return cancelled_.load(); }

    private:
        std::atomic<bool> cancelled_{false};
    };

    // At most one live read per resource key (client + path). Starting a
    // new read cancels the previous one so a stale result is never delivered.
    class RequestRegistry
    {
    public:
        std::shared_ptr<CancelToken> begin(const std::string &resourceKey);
        // Drops the key if 'token' is still the current one.
        void finish(const std::string &resourceKey, const std::shared_ptr<CancelToken> &token);

        std::size_t inFlight() const;

    private:
        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<CancelToken>> current_;
    };
}
