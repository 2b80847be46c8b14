#include "retry_policy.hpp"
#include "../logger/Mylogger.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace azupload
{
    RetryPolicy::RetryPolicy(uint32_t maxRetries, std::chrono::milliseconds baseDelay, Sleeper sleeper)
        : maxRetries_(maxRetries), baseDelay_(baseDelay), sleeper_(std::move(sleeper))
    {
        if (!sleeper_)
        {
            sleeper_ = [](std::chrono::milliseconds delay)
            { std::this_thread::sleep_for(delay); };
        }
    }

    bool RetryPolicy::shouldRetry(const BlockStoreResponse &response, uint32_t attemptedRetries) const
    {
        if (attemptedRetries >= maxRetries_)
        {
            return false;
        }
        return response.transient();
    }

    std::chrono::milliseconds RetryPolicy::delayBeforeRetry(uint32_t retry) const
    {
        if (retry == 0)
        {
            return std::chrono::milliseconds(0);
        }
        std::chrono::milliseconds delay = std::min(baseDelay_, kMaxDelay);
        for (uint32_t i = 1; i < retry && delay < kMaxDelay; ++i)
        {
            delay = std::min(delay * 2, kMaxDelay);
        }
        return delay;
    }

    BlockStoreResponse RetryPolicy::run(const std::string &what, const std::function<BlockStoreResponse()> &call) const
    {
        uint32_t retries = 0;
        while (true)
        {
            BlockStoreResponse response = call();
            if (response.ok() || !shouldRetry(response, retries))
            {
                return response;
            }
            ++retries;
            auto delay = delayBeforeRetry(retries);
            MyLogger::warning(what + " failed (" + response.describe() + "), retry " + std::to_string(retries) + "/" +
                              std::to_string(maxRetries_) + " in " + std::to_string(delay.count()) + " ms");
            sleeper_(delay);
        }
    }
}
