#include "load_config.hpp"
#include "../blocks/block_sequencer.hpp"
#include "../common/upload_error.hpp"
#include "../logger/Mylogger.hpp"
#include "../uploader/retry_policy.hpp"
#include <fstream>
#include <limits>

namespace azupload
{
    namespace ConfigReader
    {
        json load(const std::string &filepath)
        {
            std::ifstream config_file(filepath);
            if (!config_file.is_open())
            {
                MyLogger::error("Unable to open configuration file: " + filepath);
                throw UploadError(ErrorKind::Configuration, "Invalid parameters file path: " + filepath);
            }

            try
            {
                json j;
                config_file >> j;
                MyLogger::info("Configuration file loaded successfully: " + filepath);
                return j;
            }
            catch (const json::parse_error &e)
            {
                MyLogger::error("JSON parse error in file " + filepath + ": " + e.what());
                throw UploadError(ErrorKind::Configuration, "Parameters file is not valid JSON: " + filepath);
            }
        }

        std::string get_config_string(const std::string &key, const json &j)
        {
            if (!j.contains(key))
            {
                throw UploadError(ErrorKind::Configuration, "Key not found in parameters: " + key);
            }
            if (!j[key].is_string())
            {
                throw UploadError(ErrorKind::Configuration, "Key is not a string: " + key);
            }
            std::string value = j[key].get<std::string>();
            if (value.empty())
            {
                throw UploadError(ErrorKind::Configuration, "Key is empty: " + key);
            }
            return value;
        }

        std::string get_config_string(const std::string &key, const json &j, const std::string &fallback)
        {
            if (!j.contains(key) || j[key].is_null())
            {
                return fallback;
            }
            if (!j[key].is_string())
            {
                throw UploadError(ErrorKind::Configuration, "Key is not a string: " + key);
            }
            return j[key].get<std::string>();
        }

        uint64_t get_config_unsigned(const std::string &key, const json &j, uint64_t fallback)
        {
            if (!j.contains(key) || j[key].is_null())
            {
                return fallback;
            }
            if (!j[key].is_number_integer())
            {
                throw UploadError(ErrorKind::Configuration, "Key is not an unsigned integer: " + key);
            }
            if (j[key].is_number_unsigned())
            {
                return j[key].get<uint64_t>();
            }
            int64_t value = j[key].get<int64_t>();
            if (value < 0)
            {
                throw UploadError(ErrorKind::Configuration, "Key must not be negative: " + key);
            }
            return static_cast<uint64_t>(value);
        }
    }

    UploadConfig uploadConfigFromJson(const json &j)
    {
        if (!j.is_object())
        {
            throw UploadError(ErrorKind::Configuration, "Parameters must be a JSON object");
        }

        UploadConfig config;
        config.storageConnectionString = ConfigReader::get_config_string("storageConnectionString", j);
        config.containerName = ConfigReader::get_config_string("containerName", j);
        config.sourceFile = ConfigReader::get_config_string("sourceFile", j);
        config.blobName = ConfigReader::get_config_string("blobName", j, config.sourceFile.filename().string());
        config.blockSize = ConfigReader::get_config_unsigned("blockSizeBytes", j, kDefaultBlockSize);

        uint64_t maxRetries = ConfigReader::get_config_unsigned("maxRetries", j, 0);
        if (maxRetries > 30)
        {
            throw UploadError(ErrorKind::Configuration, "maxRetries must be at most 30");
        }
        config.maxRetries = static_cast<uint32_t>(maxRetries);
        uint64_t retryBaseDelayMs = ConfigReader::get_config_unsigned("retryBaseDelayMs", j, 500);
        if (retryBaseDelayMs > static_cast<uint64_t>(RetryPolicy::kMaxDelay.count()))
        {
            throw UploadError(ErrorKind::Configuration, "retryBaseDelayMs must be at most " +
                                                            std::to_string(RetryPolicy::kMaxDelay.count()));
        }
        config.retryBaseDelay = std::chrono::milliseconds(retryBaseDelayMs);

        uint64_t timeout = ConfigReader::get_config_unsigned("requestTimeoutSeconds", j, 0);
        if (timeout > static_cast<uint64_t>(std::numeric_limits<long>::max()))
        {
            throw UploadError(ErrorKind::Configuration, "requestTimeoutSeconds is out of range");
        }
        config.requestTimeoutSeconds = static_cast<long>(timeout);

        if (config.blockSize == 0)
        {
            throw UploadError(ErrorKind::Configuration, "blockSizeBytes must be greater than zero");
        }
        if (config.blobName.empty())
        {
            throw UploadError(ErrorKind::Configuration, "Cannot derive a blob name from " + config.sourceFile.string());
        }

        std::error_code ec;
        if (!std::filesystem::is_regular_file(config.sourceFile, ec))
        {
            throw UploadError(ErrorKind::Configuration, "Source file does not exist or is not a regular file: " +
                                                            config.sourceFile.string());
        }
        return config;
    }

    UploadConfig loadUploadConfig(const std::string &parametersFile)
    {
        return uploadConfigFromJson(ConfigReader::load(parametersFile));
    }
}
