#ifndef AZUPLOAD_LOAD_CONFIG_HPP
#define AZUPLOAD_LOAD_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace azupload
{
    // {
    //      "storageConnectionString": "<storage connection string>",
    //      "containerName": "<storage container name>",
    //      "sourceFile": "<source file full path>"
    // }
    // plus the optional tuning keys read in loadUploadConfig.
    struct UploadConfig
    {
        std::string storageConnectionString;
        std::string containerName;
        std::filesystem::path sourceFile;
        std::string blobName;
        uint64_t blockSize = 0;
        uint32_t maxRetries = 0;
        std::chrono::milliseconds retryBaseDelay{0};
        long requestTimeoutSeconds = 0;
    };

    namespace ConfigReader
    {
        // Throws UploadError(Configuration) when the file is missing or not JSON.
        json load(const std::string &filepath);

        // Required keys throw UploadError(Configuration) when absent, empty or mistyped.
        std::string get_config_string(const std::string &key, const json &j);
        // Optional keys fall back when absent and throw when mistyped.
        std::string get_config_string(const std::string &key, const json &j, const std::string &fallback);
        uint64_t get_config_unsigned(const std::string &key, const json &j, uint64_t fallback);
    }

    UploadConfig loadUploadConfig(const std::string &parametersFile);
    UploadConfig uploadConfigFromJson(const json &j);
}

#endif // AZUPLOAD_LOAD_CONFIG_HPP
