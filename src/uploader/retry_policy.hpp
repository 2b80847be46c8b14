#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "../blob_client/block_store_client.hpp"

namespace azupload
{
    // Repeats block store calls that failed transiently, backing off
    // exponentially. With maxRetries == 0 every call is tried exactly once.
    class RetryPolicy
    {
    public:
        using Sleeper = std::function<void(std::chrono::milliseconds)>;

        // Upper bound on any single backoff.
        static constexpr std::chrono::milliseconds kMaxDelay = std::chrono::minutes(10);

        explicit RetryPolicy(uint32_t maxRetries = 0,
                             std::chrono::milliseconds baseDelay = std::chrono::milliseconds(500),
                             Sleeper sleeper = nullptr);

        // True if the response may succeed when repeated and retries are left.
        bool shouldRetry(const BlockStoreResponse &response, uint32_t attemptedRetries) const;

        // Delay before retry number `retry` (1-based): baseDelay * 2^(retry - 1),
        // saturating at kMaxDelay.
        std::chrono::milliseconds delayBeforeRetry(uint32_t retry) const;

        uint32_t maxRetries() const { return maxRetries_; }

        BlockStoreResponse run(const std::string &what, const std::function<BlockStoreResponse()> &call) const;

    private:
        uint32_t maxRetries_;
        std::chrono::milliseconds baseDelay_;
        Sleeper sleeper_;
    };
}
