#include "restart_store.hpp"
#include "../blocks/block_sequencer.hpp"
#include "../common/upload_error.hpp"
#include "../logger/Mylogger.hpp"

#include <fstream>
#include <set>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace azupload
{
    namespace
    {
        constexpr int kRecordVersion = 1;

        fs::path temporaryPathFor(const fs::path &recordPath)
        {
            fs::path tmp = recordPath;
            tmp += ".tmp";
            return tmp;
        }
    }

    bool operator==(const RestartState &lhs, const RestartState &rhs)
    {
        return lhs.currentBlockId == rhs.currentBlockId &&
               lhs.committedBlockIds == rhs.committedBlockIds &&
               lhs.currentBlockNumber == rhs.currentBlockNumber &&
               lhs.currentBlockSize == rhs.currentBlockSize &&
               lhs.remainingBytes == rhs.remainingBytes &&
               lhs.fileSize == rhs.fileSize &&
               lhs.blockSize == rhs.blockSize;
    }

    json toJson(const RestartState &state)
    {
        json j;
        j["version"] = kRecordVersion;
        j["currentBlockId"] = state.currentBlockId;
        j["committedBlockIds"] = state.committedBlockIds;
        j["currentBlockNumber"] = state.currentBlockNumber;
        j["currentBlockSize"] = state.currentBlockSize;
        j["remainingBytes"] = state.remainingBytes;
        j["fileSize"] = state.fileSize;
        j["blockSize"] = state.blockSize;
        return j;
    }

    RestartState restartStateFromJson(const json &j)
    {
        if (!j.is_object())
        {
            throw std::invalid_argument("restart record is not a JSON object");
        }
        int version = j.at("version").get<int>();
        if (version != kRecordVersion)
        {
            throw std::invalid_argument("unsupported restart record version " + std::to_string(version));
        }
        RestartState state;
        state.currentBlockId = j.at("currentBlockId").get<std::string>();
        state.committedBlockIds = j.at("committedBlockIds").get<std::vector<std::string>>();
        state.currentBlockNumber = j.at("currentBlockNumber").get<uint64_t>();
        state.currentBlockSize = j.at("currentBlockSize").get<uint64_t>();
        state.remainingBytes = j.at("remainingBytes").get<int64_t>();
        state.fileSize = j.at("fileSize").get<uint64_t>();
        state.blockSize = j.at("blockSize").get<uint64_t>();
        return state;
    }

    std::string checkInvariants(const RestartState &state)
    {
        if (state.blockSize == 0)
        {
            return "block size is zero";
        }
        if (state.remainingBytes < 0)
        {
            return "remaining bytes are negative";
        }
        if (state.committedBlockIds.size() != state.currentBlockNumber)
        {
            return "current block number " + std::to_string(state.currentBlockNumber) + " does not match " +
                   std::to_string(state.committedBlockIds.size()) + " committed block ids";
        }
        std::set<std::string> seen;
        for (const auto &id : state.committedBlockIds)
        {
            if (!seen.insert(id).second)
            {
                return "duplicate committed block id " + id;
            }
        }
        uint64_t blockCount = BlockSequencer::blockCountFor(state.fileSize, state.blockSize);
        if (blockCount > kMaxBlockCount)
        {
            return "block size " + std::to_string(state.blockSize) + " splits the file into " +
                   std::to_string(blockCount) + " blocks, more than a block id can number";
        }
        if (state.currentBlockNumber > blockCount)
        {
            return "current block number " + std::to_string(state.currentBlockNumber) + " is past the last of " +
                   std::to_string(blockCount) + " blocks";
        }
        // Below blockCount the product is under fileSize and cannot wrap.
        uint64_t expectedRemaining = state.currentBlockNumber == blockCount
                                         ? 0
                                         : state.fileSize - state.currentBlockNumber * state.blockSize;
        if (static_cast<uint64_t>(state.remainingBytes) != expectedRemaining)
        {
            return "remaining bytes " + std::to_string(state.remainingBytes) + " do not match block " +
                   std::to_string(state.currentBlockNumber) + " of a " + std::to_string(state.fileSize) + " byte file";
        }
        if (state.inFlight())
        {
            if (state.remainingBytes == 0)
            {
                return "block " + state.currentBlockId + " is in flight but no bytes remain";
            }
            if (seen.count(state.currentBlockId) != 0)
            {
                return "block " + state.currentBlockId + " is both in flight and committed";
            }
        }
        return "";
    }

    fs::path RestartStore::restartPathFor(const fs::path &sourceFile)
    {
        fs::path record = sourceFile.parent_path() / sourceFile.stem();
        record += kSuffix;
        return record;
    }

    bool RestartStore::exists(const fs::path &sourceFile) const
    {
        std::error_code ec;
        return fs::exists(restartPathFor(sourceFile), ec);
    }

    std::optional<RestartState> RestartStore::load(const fs::path &sourceFile) const
    {
        fs::path recordPath = restartPathFor(sourceFile);
        std::error_code ec;
        if (!fs::exists(recordPath, ec))
        {
            if (ec)
            {
                throw UploadError(ErrorKind::RestartRecord,
                                  "Cannot check restart record " + recordPath.string() + ": " + ec.message());
            }
            MyLogger::debug("No restart record at " + recordPath.string());
            return std::nullopt;
        }

        std::ifstream file(recordPath, std::ios::binary);
        if (!file.is_open())
        {
            throw UploadError(ErrorKind::RestartRecord, "Unable to open restart record: " + recordPath.string());
        }

        RestartState state;
        try
        {
            json j;
            file >> j;
            state = restartStateFromJson(j);
        }
        catch (const json::exception &e)
        {
            throw UploadError(ErrorKind::RestartRecord, "Restart record " + recordPath.string() +
                                                            " is corrupt (" + e.what() +
                                                            "); delete it to start the upload over");
        }
        catch (const std::invalid_argument &e)
        {
            throw UploadError(ErrorKind::RestartRecord, "Restart record " + recordPath.string() +
                                                            " is unusable (" + e.what() +
                                                            "); delete it to start the upload over");
        }

        std::string broken = checkInvariants(state);
        if (!broken.empty())
        {
            throw UploadError(ErrorKind::RestartRecord, "Restart record " + recordPath.string() + " is inconsistent: " +
                                                            broken + "; delete it to start the upload over");
        }
        MyLogger::info("Loaded restart record: " + recordPath.string());
        return state;
    }

    void RestartStore::save(const RestartState &state, const fs::path &sourceFile) const
    {
        fs::path recordPath = restartPathFor(sourceFile);
        fs::path tmpPath = temporaryPathFor(recordPath);
        {
            std::ofstream file(tmpPath, std::ios::binary | std::ios::trunc);
            if (!file.is_open())
            {
                throw UploadError(ErrorKind::RestartRecord, "Unable to write restart record: " + tmpPath.string());
            }
            file << toJson(state).dump();
            file.flush();
            if (!file)
            {
                file.close();
                std::error_code ignored;
                fs::remove(tmpPath, ignored);
                throw UploadError(ErrorKind::RestartRecord, "Failed writing restart record: " + tmpPath.string());
            }
        }

        std::error_code ec;
        fs::rename(tmpPath, recordPath, ec);
        if (ec)
        {
            std::error_code ignored;
            fs::remove(tmpPath, ignored);
            throw UploadError(ErrorKind::RestartRecord,
                              "Failed to replace restart record " + recordPath.string() + ": " + ec.message());
        }
        MyLogger::debug("Saved restart record at block " + std::to_string(state.currentBlockNumber) + ": " +
                        recordPath.string());
    }

    void RestartStore::clear(const fs::path &sourceFile) const
    {
        fs::path recordPath = restartPathFor(sourceFile);
        std::error_code ec;
        fs::remove(temporaryPathFor(recordPath), ec);
        if (ec)
        {
            MyLogger::warning("Failed to remove temporary restart record: " + ec.message());
        }
        if (fs::remove(recordPath, ec))
        {
            MyLogger::info("Removed restart record: " + recordPath.string());
        }
        else if (ec)
        {
            throw UploadError(ErrorKind::RestartRecord,
                              "Failed to remove restart record " + recordPath.string() + ": " + ec.message());
        }
    }
}
