#include "block_sequencer.hpp"
#include "../hash/block_checksum.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace azupload
{
    BlockSequencer::BlockSequencer(uint64_t fileSize, uint64_t blockSize, uint64_t firstBlock)
        : fileSize_(fileSize), blockSize_(blockSize), blockCount_(0), nextBlock_(firstBlock)
    {
        if (blockSize_ == 0)
        {
            throw std::invalid_argument("Block size must be greater than zero");
        }
        blockCount_ = blockCountFor(fileSize_, blockSize_);
        if (blockCount_ > kMaxBlockCount)
        {
            throw std::invalid_argument("File of " + std::to_string(fileSize_) + " bytes needs " +
                                        std::to_string(blockCount_) + " blocks of " + std::to_string(blockSize_) +
                                        " bytes, more than the " + std::to_string(kMaxBlockCount) + " a block id can number");
        }
    }

    uint64_t BlockSequencer::blockCountFor(uint64_t fileSize, uint64_t blockSize)
    {
        if (blockSize == 0)
        {
            throw std::invalid_argument("Block size must be greater than zero");
        }
        return fileSize / blockSize + (fileSize % blockSize != 0 ? 1 : 0);
    }

    std::optional<BlockDescriptor> BlockSequencer::next()
    {
        if (nextBlock_ >= blockCount_)
        {
            return std::nullopt;
        }
        return descriptorFor(nextBlock_++);
    }

    BlockDescriptor BlockSequencer::descriptorFor(uint64_t blockNumber) const
    {
        if (blockNumber >= blockCount_)
        {
            throw std::out_of_range("Block " + std::to_string(blockNumber) + " is past the last block (" +
                                    std::to_string(blockCount_) + " blocks)");
        }
        uint64_t offset = blockNumber * blockSize_;
        uint64_t length = std::min(blockSize_, fileSize_ - offset);
        return BlockDescriptor{blockNumber, offset, length, blockIdFor(blockNumber)};
    }

    std::string BlockSequencer::blockIdFor(uint64_t blockNumber)
    {
        if (blockNumber >= kMaxBlockCount)
        {
            throw std::out_of_range("Block number " + std::to_string(blockNumber) + " does not fit a block id");
        }
        std::ostringstream ss;
        ss << "BlockId" << std::setw(7) << std::setfill('0') << blockNumber;
        return checksum::base64Encode(ss.str());
    }
}
