#ifndef AZUPLOAD_RESTART_STORE_HPP
#define AZUPLOAD_RESTART_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace azupload
{
    // Snapshot of an upload in progress. currentBlockId/currentBlockSize name
    // the block in flight and are empty/zero at a clean block boundary.
    struct RestartState
    {
        std::string currentBlockId;
        std::vector<std::string> committedBlockIds;
        uint64_t currentBlockNumber = 0;
        uint64_t currentBlockSize = 0;
        int64_t remainingBytes = 0;
        uint64_t fileSize = 0;
        uint64_t blockSize = 0;

        bool inFlight() const { return !currentBlockId.empty(); }
    };

    bool operator==(const RestartState &lhs, const RestartState &rhs);

    nlohmann::json toJson(const RestartState &state);
    RestartState restartStateFromJson(const nlohmann::json &j);

    // Returns a description of the first broken invariant, or an empty string.
    std::string checkInvariants(const RestartState &state);

    // Persists the restart record of a source file next to it as
    // <dir>/<stem>.azrestart. Deleting that file by hand forces a fresh upload.
    class RestartStore
    {
    public:
        static constexpr const char *kSuffix = ".azrestart";

        static std::filesystem::path restartPathFor(const std::filesystem::path &sourceFile);

        // Nothing when no record exists. Throws UploadError(RestartRecord)
        // when a record exists but cannot be used.
        std::optional<RestartState> load(const std::filesystem::path &sourceFile) const;

        // Writes a temporary file and renames it over the record.
        void save(const RestartState &state, const std::filesystem::path &sourceFile) const;

        void clear(const std::filesystem::path &sourceFile) const;

        bool exists(const std::filesystem::path &sourceFile) const;
    };
}

#endif // AZUPLOAD_RESTART_STORE_HPP
