#include "upload_executor.hpp"
#include "commit_verifier.hpp"
#include "../common/upload_error.hpp"
#include "../hash/block_checksum.hpp"
#include "../logger/Mylogger.hpp"

#include <algorithm>
#include <iomanip>
#include <optional>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace azupload
{
    namespace
    {
        std::string formatElapsed(std::chrono::steady_clock::duration elapsed)
        {
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
            std::ostringstream ss;
            ss << std::setfill('0') << std::setw(2) << ms / 3600000 << ":" << std::setw(2) << (ms / 60000) % 60
               << ":" << std::setw(2) << (ms / 1000) % 60 << "." << std::setw(3) << ms % 1000;
            return ss.str();
        }
    }

    UploadExecutor::UploadExecutor(BlockStoreClient &client, const RestartStore &store, ExecutorOptions options)
        : client(client), store(store), options(std::move(options))
    {
        if (this->options.blockSize == 0)
        {
            throw UploadError(ErrorKind::Configuration, "Block size must be greater than zero");
        }
    }

    bool UploadExecutor::stopRequested() const
    {
        return options.stopRequested && options.stopRequested->load();
    }

    RestartState UploadExecutor::plan(const fs::path &sourceFile, uint64_t fileSize) const
    {
        std::optional<RestartState> recovered = store.load(sourceFile);
        if (!recovered)
        {
            RestartState fresh;
            fresh.fileSize = fileSize;
            fresh.blockSize = options.blockSize;
            fresh.remainingBytes = static_cast<int64_t>(fileSize);
            if (BlockSequencer::blockCountFor(fileSize, fresh.blockSize) > kMaxBlockCount)
            {
                throw UploadError(ErrorKind::Configuration,
                                  "Block size " + std::to_string(fresh.blockSize) + " splits the " +
                                      std::to_string(fileSize) + " byte source into too many blocks");
            }
            return fresh;
        }

        RestartState state = *recovered;
        std::string recordPath = RestartStore::restartPathFor(sourceFile).string();
        if (state.fileSize != fileSize)
        {
            throw UploadError(ErrorKind::RestartRecord,
                              "Source file is " + std::to_string(fileSize) + " bytes but the restart record " +
                                  recordPath + " was written for " + std::to_string(state.fileSize) +
                                  " bytes; delete it to start the upload over");
        }
        for (uint64_t i = 0; i < state.committedBlockIds.size(); ++i)
        {
            if (state.committedBlockIds[i] != BlockSequencer::blockIdFor(i))
            {
                throw UploadError(ErrorKind::RestartRecord,
                                  "Restart record " + recordPath + " lists block " + state.committedBlockIds[i] +
                                      " at position " + std::to_string(i) + "; delete it to start the upload over");
            }
        }
        if (state.blockSize != options.blockSize)
        {
            MyLogger::warning("Resuming with the recorded block size of " + std::to_string(state.blockSize) +
                              " bytes instead of the configured " + std::to_string(options.blockSize));
        }
        if (state.inFlight())
        {
            MyLogger::info("Block " + std::to_string(state.currentBlockNumber) + " (" + state.currentBlockId +
                           ") was in flight and will be sent again");
            state.currentBlockId.clear();
            state.currentBlockSize = 0;
        }
        return state;
    }

    RestartState UploadExecutor::markInFlight(const RestartState &state, const BlockDescriptor &block)
    {
        RestartState next = state;
        next.currentBlockId = block.blockId;
        next.currentBlockSize = block.length;
        return next;
    }

    RestartState UploadExecutor::advance(const RestartState &inFlight, const BlockDescriptor &block)
    {
        RestartState next = inFlight;
        if (std::find(next.committedBlockIds.begin(), next.committedBlockIds.end(), block.blockId) ==
            next.committedBlockIds.end())
        {
            next.committedBlockIds.push_back(block.blockId);
        }
        next.currentBlockNumber = block.blockNumber + 1;
        next.remainingBytes -= static_cast<int64_t>(block.length);
        next.currentBlockId.clear();
        next.currentBlockSize = 0;
        return next;
    }

    std::vector<char> UploadExecutor::readBlock(std::ifstream &source, const BlockDescriptor &block) const
    {
        std::vector<char> buffer(block.length);
        source.clear();
        source.seekg(static_cast<std::streamoff>(block.offset), std::ios::beg);
        source.read(buffer.data(), static_cast<std::streamsize>(block.length));
        std::streamsize bytesRead = source.gcount();
        if (bytesRead != static_cast<std::streamsize>(block.length))
        {
            throw UploadError(ErrorKind::LocalRead,
                              "Short read of block " + std::to_string(block.blockNumber) + ": expected " +
                                  std::to_string(block.length) + " bytes at offset " + std::to_string(block.offset) +
                                  ", got " + std::to_string(bytesRead) + "; the source file shrank");
        }
        return buffer;
    }

    UploadResult UploadExecutor::run(const fs::path &sourceFile)
    {
        auto started = std::chrono::steady_clock::now();

        std::error_code ec;
        uint64_t fileSize = fs::file_size(sourceFile, ec);
        if (ec)
        {
            throw UploadError(ErrorKind::LocalRead, "Cannot stat source file " + sourceFile.string() + ": " + ec.message());
        }

        bool resuming = store.exists(sourceFile);
        RestartState state = plan(sourceFile, fileSize);
        BlockSequencer sequencer(state.fileSize, state.blockSize, state.currentBlockNumber);

        if (resuming)
        {
            MyLogger::info("!! RESTARTING UPLOAD !!");
        }
        MyLogger::info("Uploading file: " + sourceFile.string() + " to " + client.describeTarget());
        MyLogger::info("Uploading bytes: " + std::to_string(state.remainingBytes));
        MyLogger::info("Blocks to upload: " + std::to_string(sequencer.blockCount() - state.currentBlockNumber) +
                       " of " + std::to_string(sequencer.blockCount()));

        std::ifstream source(sourceFile, std::ios::binary);
        if (!source.is_open())
        {
            throw UploadError(ErrorKind::LocalRead, "Unable to open source file: " + sourceFile.string());
        }

        UploadResult result;
        while (state.remainingBytes > 0)
        {
            if (stopRequested())
            {
                store.save(state, sourceFile);
                result.status = UploadStatus::Cancelled;
                result.message = "Upload stopped before block " + std::to_string(state.currentBlockNumber) + ", " +
                                 std::to_string(state.remainingBytes) + " bytes remain";
                result.state = state;
                MyLogger::warning(result.message);
                return result;
            }

            std::optional<BlockDescriptor> nextBlock = sequencer.next();
            if (!nextBlock)
            {
                throw UploadError(ErrorKind::RestartRecord,
                                  "No block left at block " + std::to_string(state.currentBlockNumber) + " but " +
                                      std::to_string(state.remainingBytes) + " bytes remain");
            }
            const BlockDescriptor &block = *nextBlock;
            std::vector<char> data = readBlock(source, block);
            std::string md5Hash = checksum::md5Base64(data.data(), data.size());

            RestartState inFlight = markInFlight(state, block);
            store.save(inFlight, sourceFile);

            BlockStoreResponse response = options.retryPolicy.run("Put block " + std::to_string(block.blockNumber), [&]()
                                                                  { return client.putBlock(block.blockId, data, md5Hash); });
            if (!response.ok())
            {
                store.save(inFlight, sourceFile);
                result.status = UploadStatus::TransferFailed;
                result.message = "Block " + std::to_string(block.blockNumber) + " (" + block.blockId +
                                 ") was rejected: " + response.describe();
                result.state = inFlight;
                MyLogger::error("Error returned from the service: " + result.message);
                return result;
            }

            state = advance(inFlight, block);
            MyLogger::info("Block number: " + std::to_string(block.blockNumber) +
                           ", Block size: " + std::to_string(block.length) +
                           ", Block ID: " + block.blockId +
                           ", MD5 Hash: " + md5Hash +
                           ", Blocks Written: " + std::to_string(state.committedBlockIds.size()) +
                           ", Elapsed time: " + formatElapsed(std::chrono::steady_clock::now() - started));
        }

        // Every block is acknowledged; a failed commit can be retried from here.
        store.save(state, sourceFile);

        CommitVerifier verifier(client, options.retryPolicy);
        result = verifier.commit(state);
        if (result.completed())
        {
            store.clear(sourceFile);
        }
        else
        {
            MyLogger::warning("Restart record kept: " + RestartStore::restartPathFor(sourceFile).string());
        }
        MyLogger::info("Process complete. Total elapsed time: " + formatElapsed(std::chrono::steady_clock::now() - started));
        return result;
    }
}
