#pragma once

#include <string>
#include <vector>

#include "retry_policy.hpp"
#include "upload_result.hpp"
#include "../blob_client/block_store_client.hpp"

namespace azupload
{
    // Commits the block list of a fully transferred upload and checks the
    // store agrees with it afterwards.
    class CommitVerifier
    {
    public:
        CommitVerifier(BlockStoreClient &client, const RetryPolicy &retryPolicy);

        // Completed, CommitFailed or VerificationFailed. Never touches the restart record.
        UploadResult commit(const RestartState &state);

        // Logs every block the store knows about, committed or not.
        // Returns false if the listing failed.
        bool reportBlockList(const std::string &stage);

        // Empty when the committed blocks match the state, otherwise the first mismatch.
        static std::string verify(const std::vector<BlockListEntry> &remote, const RestartState &state);

    private:
        BlockStoreClient &client;
        const RetryPolicy &retryPolicy;
    };
}
