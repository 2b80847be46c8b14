#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>

#include "retry_policy.hpp"
#include "upload_result.hpp"
#include "../blob_client/block_store_client.hpp"
#include "../blocks/block_sequencer.hpp"
#include "../restart/restart_store.hpp"

namespace azupload
{
    struct ExecutorOptions
    {
        uint64_t blockSize = kDefaultBlockSize; // ignored when resuming; the record keeps its own
        RetryPolicy retryPolicy;
        const std::atomic<bool> *stopRequested = nullptr; // checked between blocks
    };

    // Drives one upload attempt: plan (fresh or resumed), transfer every
    // remaining block in order, then commit and verify.
    //
    // The restart record is written before each block transfer, so a crash
    // at any point leaves a record naming the block to retry. It is removed
    // only after the block list is committed and verified.
    //
    // Local problems (unreadable source, corrupt record) throw UploadError;
    // store failures come back as an UploadResult with the record kept.
    class UploadExecutor
    {
    public:
        UploadExecutor(BlockStoreClient &client, const RestartStore &store, ExecutorOptions options);

        UploadResult run(const std::filesystem::path &sourceFile);

        // Working state for this run: the recovered record with its in-flight
        // markers dropped, or a fresh state for the whole file.
        RestartState plan(const std::filesystem::path &sourceFile, uint64_t fileSize) const;

    private:
        BlockStoreClient &client;
        const RestartStore &store;
        ExecutorOptions options;

        std::vector<char> readBlock(std::ifstream &source, const BlockDescriptor &block) const;
        bool stopRequested() const;

        static RestartState markInFlight(const RestartState &state, const BlockDescriptor &block);
        static RestartState advance(const RestartState &inFlight, const BlockDescriptor &block);
    };
}
