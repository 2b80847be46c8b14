#ifndef AZURE_BLOB_CLIENT_H
#define AZURE_BLOB_CLIENT_H

#include "block_store_client.hpp"
#include "../load_config/connection_string.hpp"
#include <curl/curl.h>
#include <string>
#include <vector>

namespace azupload
{
    // Turns a Get Block List reply into a listing. A 404 BlobNotFound means no
    // blob and no uncommitted blocks yet, so it becomes an empty 200 listing.
    // An unparseable body becomes a 502.
    BlockListResponse blockListFromResponse(BlockStoreResponse response);

    // Block blob operations against Azure Blob Storage over its REST API.
    // Every request carries the SAS token of the connection string.
    class AzureBlobClient : public BlockStoreClient
    {
    public:
        static constexpr const char *kApiVersion = "2020-10-02";

        AzureBlobClient(const StorageEndpoint &endpoint, const std::string &containerName,
                        const std::string &blobName, long requestTimeoutSeconds = 0);
        ~AzureBlobClient() override;

        AzureBlobClient(const AzureBlobClient &) = delete;
        AzureBlobClient &operator=(const AzureBlobClient &) = delete;

        BlockStoreResponse putBlock(const std::string &blockId, const std::vector<char> &data,
                                    const std::string &contentMd5) override;
        BlockStoreResponse putBlockList(const std::vector<std::string> &blockIds) override;
        BlockListResponse getBlockList(bool includeUncommitted) override;

        std::string describeTarget() const override;

        // <endpoint>/<container>/<blob>?<query>&<sas>, path segments escaped.
        std::string blobUrl(const std::string &query) const;

        // Put Block URL; the base64 block id is escaped into the query.
        std::string blockUrl(const std::string &blockId) const;

    private:
        StorageEndpoint endpoint;
        std::string containerName;
        std::string blobName;
        long requestTimeoutSeconds;
        CURL *curlHandle;

        std::string escape(const std::string &value) const;

        // Helper function to perform an HTTP request.
        BlockStoreResponse performRequest(const std::string &method, const std::string &url,
                                          const char *body, size_t bodySize,
                                          struct curl_slist *headers);
    };
}

#endif // AZURE_BLOB_CLIENT_H
