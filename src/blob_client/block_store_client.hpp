#ifndef AZUPLOAD_BLOCK_STORE_CLIENT_HPP
#define AZUPLOAD_BLOCK_STORE_CLIENT_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace azupload
{
    // Response of a block store call.
    struct BlockStoreResponse
    {
        int responseCode = 0;     // HTTP status, or the CURL error code when no response arrived.
        bool transportError = false;
        std::string errorMessage; // Error message, if any.
        std::string content;      // Response body.

        bool ok() const { return !transportError && responseCode >= 200 && responseCode < 300; }

        // Timeouts, throttling and server-side failures may succeed when repeated.
        bool transient() const
        {
            return transportError || responseCode == 408 || responseCode == 429 || responseCode >= 500;
        }

        std::string describe() const
        {
            std::string text = transportError ? "transport error " + std::to_string(responseCode)
                                              : "HTTP " + std::to_string(responseCode);
            if (!errorMessage.empty())
            {
                text += ": " + errorMessage;
            }
            return text;
        }
    };

    struct BlockListEntry
    {
        std::string name;
        uint64_t size = 0;
        bool committed = false;
    };

    struct BlockListResponse
    {
        BlockStoreResponse response;
        std::vector<BlockListEntry> blocks; // committed blocks first, in blob order
    };

    // The three block blob operations the uploader depends on.
    class BlockStoreClient
    {
    public:
        virtual ~BlockStoreClient() = default;

        virtual BlockStoreResponse putBlock(const std::string &blockId, const std::vector<char> &data,
                                            const std::string &contentMd5) = 0;
        virtual BlockStoreResponse putBlockList(const std::vector<std::string> &blockIds) = 0;
        virtual BlockListResponse getBlockList(bool includeUncommitted) = 0;

        // Human readable name of the target object, for log lines.
        virtual std::string describeTarget() const = 0;
    };
}

#endif // AZUPLOAD_BLOCK_STORE_CLIENT_HPP
