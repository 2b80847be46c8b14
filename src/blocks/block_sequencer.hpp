#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace azupload
{
    // 100 MiB
    constexpr uint64_t kDefaultBlockSize = 100ULL * 1024 * 1024;

    // Block numbers are embedded in a seven-digit field of the block id.
    constexpr uint64_t kMaxBlockCount = 10000000ULL;

    struct BlockDescriptor
    {
        uint64_t blockNumber; // 0-based position in the file
        uint64_t offset;      // blockNumber * blockSize
        uint64_t length;      // blockSize except for the final block
        std::string blockId;  // deterministic, derived from blockNumber only
    };

    // Walks the blocks of a file of fileSize bytes, one descriptor at a time.
    class BlockSequencer
    {
    public:
        BlockSequencer(uint64_t fileSize, uint64_t blockSize, uint64_t firstBlock = 0);

        // Next descriptor in ascending order, or nothing once the file is exhausted.
        std::optional<BlockDescriptor> next();

        BlockDescriptor descriptorFor(uint64_t blockNumber) const;

        uint64_t blockCount() const { return blockCount_; }
        uint64_t fileSize() const { return fileSize_; }
        uint64_t blockSize() const { return blockSize_; }

        static uint64_t blockCountFor(uint64_t fileSize, uint64_t blockSize);

        // base64("BlockId" + seven-digit zero-padded number)
        static std::string blockIdFor(uint64_t blockNumber);

    private:
        uint64_t fileSize_;
        uint64_t blockSize_;
        uint64_t blockCount_;
        uint64_t nextBlock_;
    };
}
