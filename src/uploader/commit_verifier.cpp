#include "commit_verifier.hpp"
#include "../blocks/block_sequencer.hpp"
#include "../logger/Mylogger.hpp"

namespace azupload
{
    CommitVerifier::CommitVerifier(BlockStoreClient &client, const RetryPolicy &retryPolicy)
        : client(client), retryPolicy(retryPolicy)
    {
    }

    namespace
    {
        void logBlocks(const std::vector<BlockListEntry> &blocks)
        {
            for (const auto &block : blocks)
            {
                if (block.committed)
                {
                    MyLogger::info("Block " + block.name + " has been committed to block list. Block length = " +
                                   std::to_string(block.size));
                }
                else
                {
                    MyLogger::info("Block " + block.name + " is uncommitted. Block length = " +
                                   std::to_string(block.size));
                }
            }
        }
    }

    bool CommitVerifier::reportBlockList(const std::string &stage)
    {
        BlockListResponse listing = client.getBlockList(true);
        if (!listing.response.ok())
        {
            MyLogger::warning("Could not read block list " + stage + ": " + listing.response.describe());
            return false;
        }
        MyLogger::info("Block list " + stage + " (" + std::to_string(listing.blocks.size()) + " blocks):");
        logBlocks(listing.blocks);
        return true;
    }

    std::string CommitVerifier::verify(const std::vector<BlockListEntry> &remote, const RestartState &state)
    {
        BlockSequencer sequencer(state.fileSize, state.blockSize);
        std::vector<const BlockListEntry *> committed;
        for (const auto &block : remote)
        {
            if (block.committed)
            {
                committed.push_back(&block);
            }
        }

        for (size_t i = 0; i < state.committedBlockIds.size(); ++i)
        {
            const std::string &expected = state.committedBlockIds[i];
            if (i >= committed.size())
            {
                return "block " + expected + " (#" + std::to_string(i) + ") is not committed";
            }
            if (committed[i]->name != expected)
            {
                return "committed block #" + std::to_string(i) + " is " + committed[i]->name + ", expected " + expected;
            }
            uint64_t expectedLength = sequencer.descriptorFor(i).length;
            if (committed[i]->size != expectedLength)
            {
                return "committed block " + expected + " has length " + std::to_string(committed[i]->size) +
                       ", expected " + std::to_string(expectedLength);
            }
        }
        if (committed.size() != state.committedBlockIds.size())
        {
            return "store has " + std::to_string(committed.size()) + " committed blocks, expected " +
                   std::to_string(state.committedBlockIds.size());
        }
        return "";
    }

    UploadResult CommitVerifier::commit(const RestartState &state)
    {
        UploadResult result;
        result.state = state;

        reportBlockList("before commit");

        BlockStoreResponse committed = retryPolicy.run("Put block list", [&]()
                                                       { return client.putBlockList(state.committedBlockIds); });
        if (!committed.ok())
        {
            result.status = UploadStatus::CommitFailed;
            result.message = "Committing " + std::to_string(state.committedBlockIds.size()) + " blocks failed: " +
                             committed.describe();
            MyLogger::error(result.message);
            return result;
        }

        BlockListResponse listing = client.getBlockList(true);
        if (!listing.response.ok())
        {
            result.status = UploadStatus::VerificationFailed;
            result.message = "Could not read block list after commit: " + listing.response.describe();
            MyLogger::error(result.message);
            return result;
        }
        MyLogger::info("Block list after commit (" + std::to_string(listing.blocks.size()) + " blocks):");
        logBlocks(listing.blocks);

        std::string mismatch = verify(listing.blocks, state);
        if (!mismatch.empty())
        {
            result.status = UploadStatus::VerificationFailed;
            result.message = "Block list verification failed: " + mismatch;
            MyLogger::error(result.message);
            return result;
        }

        result.status = UploadStatus::Completed;
        result.message = "Committed " + std::to_string(state.committedBlockIds.size()) + " blocks to " +
                         client.describeTarget();
        MyLogger::info(result.message);
        return result;
    }
}
