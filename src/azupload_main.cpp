#include "blob_client/azure_blob_client.hpp"
#include "common/upload_error.hpp"
#include "load_config/connection_string.hpp"
#include "load_config/load_config.hpp"
#include "logger/Mylogger.hpp"
#include "restart/restart_store.hpp"
#include "uploader/upload_executor.hpp"

#include <atomic>
#include <csignal>
#include <string>

namespace
{
    enum ExitCode
    {
        kExitCompleted = 0,
        kExitConfiguration = 1,
        kExitResumable = 2,
        kExitFatal = 3
    };

    std::atomic<bool> g_stopRequested{false};

    void onStopSignal(int)
    {
        g_stopRequested.store(true);
    }
}

int main(int argc, char **argv)
{
    using namespace azupload;

    if (argc < 2)
    {
        MyLogger::error("Need parameters file path.");
        MyLogger::info(std::string("Usage: ") + argv[0] + " <parameters.json>");
        return kExitConfiguration;
    }

    UploadConfig config;
    StorageEndpoint endpoint;
    try
    {
        config = loadUploadConfig(argv[1]);
        endpoint = ConnectionString::parse(config.storageConnectionString);
    }
    catch (const UploadError &e)
    {
        MyLogger::error(e.what());
        return kExitConfiguration;
    }

    std::signal(SIGINT, onStopSignal);
    std::signal(SIGTERM, onStopSignal);

    try
    {
        AzureBlobClient client(endpoint, config.containerName, config.blobName, config.requestTimeoutSeconds);
        RestartStore store;

        ExecutorOptions options;
        options.blockSize = config.blockSize;
        options.retryPolicy = RetryPolicy(config.maxRetries, config.retryBaseDelay);
        options.stopRequested = &g_stopRequested;

        UploadExecutor executor(client, store, options);
        UploadResult result = executor.run(config.sourceFile);
        if (result.completed())
        {
            return kExitCompleted;
        }
        MyLogger::error(std::string("Upload ") + uploadStatusName(result.status) + ": " + result.message);
        if (result.resumable())
        {
            MyLogger::info("Run again with the same parameters to resume from block " +
                           std::to_string(result.state.currentBlockNumber));
            return kExitResumable;
        }
        return kExitFatal;
    }
    catch (const UploadError &e)
    {
        MyLogger::error(std::string(errorKindName(e.kind())) + ": " + e.what());
        return e.kind() == ErrorKind::Configuration ? kExitConfiguration : kExitFatal;
    }
    catch (const std::exception &e)
    {
        MyLogger::error(std::string("Upload aborted: ") + e.what());
        return kExitFatal;
    }
}
