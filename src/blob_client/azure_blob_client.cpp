#include "azure_blob_client.hpp"
#include "block_list_xml.hpp"
#include "../logger/Mylogger.hpp"
#include <stdexcept>
#include <utility>

namespace azupload
{
    namespace
    {
        size_t WriteCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
        {
            std::string *str = static_cast<std::string *>(userdata);
            size_t totalSize = size * nmemb;
            str->append(ptr, totalSize);
            return totalSize;
        }

        struct curl_slist *baseHeaders()
        {
            struct curl_slist *headers = NULL;
            std::string versionHeader = std::string("x-ms-version: ") + AzureBlobClient::kApiVersion;
            headers = curl_slist_append(headers, versionHeader.c_str());
            return headers;
        }
    }

    // Constructor: initialize CURL for the target blob.
    AzureBlobClient::AzureBlobClient(const StorageEndpoint &endpoint, const std::string &containerName,
                                     const std::string &blobName, long requestTimeoutSeconds)
        : endpoint(endpoint), containerName(containerName), blobName(blobName),
          requestTimeoutSeconds(requestTimeoutSeconds), curlHandle(nullptr)
    {
        MyLogger::debug("Initializing AzureBlobClient for " + describeTarget());
        curl_global_init(CURL_GLOBAL_ALL);
        curlHandle = curl_easy_init();
        if (!curlHandle)
        {
            MyLogger::error("Failed to initialize CURL in AzureBlobClient.");
            curl_global_cleanup();
            throw std::runtime_error("Failed to initialize CURL");
        }
    }

    // Destructor: Cleanup CURL.
    AzureBlobClient::~AzureBlobClient()
    {
        if (curlHandle)
        {
            curl_easy_cleanup(curlHandle);
        }
        curl_global_cleanup();
    }

    std::string AzureBlobClient::describeTarget() const
    {
        return endpoint.blobEndpoint + "/" + containerName + "/" + blobName;
    }

    std::string AzureBlobClient::escape(const std::string &value) const
    {
        char *escaped = curl_easy_escape(curlHandle, value.c_str(), static_cast<int>(value.size()));
        if (!escaped)
        {
            throw std::runtime_error("Failed to URL-escape '" + value + "'");
        }
        std::string result(escaped);
        curl_free(escaped);
        return result;
    }

    std::string AzureBlobClient::blobUrl(const std::string &query) const
    {
        std::string url = endpoint.blobEndpoint + "/" + escape(containerName) + "/" + escape(blobName) + "?" + query;
        if (!endpoint.sasToken.empty())
        {
            url += "&" + endpoint.sasToken;
        }
        return url;
    }

    std::string AzureBlobClient::blockUrl(const std::string &blockId) const
    {
        return blobUrl("comp=block&blockid=" + escape(blockId));
    }

    // Sets up CURL for one request, performs it and fills in a BlockStoreResponse.
    // The headers list is freed here.
    BlockStoreResponse AzureBlobClient::performRequest(const std::string &method, const std::string &url,
                                                       const char *body, size_t bodySize,
                                                       struct curl_slist *headers)
    {
        BlockStoreResponse response;
        std::string readBuffer;

        curl_easy_reset(curlHandle);
        curl_easy_setopt(curlHandle, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curlHandle, CURLOPT_CUSTOMREQUEST, method.c_str());
        if (method == "GET")
        {
            curl_easy_setopt(curlHandle, CURLOPT_HTTPGET, 1L);
        }
        else
        {
            // Binary-safe body; POSTFIELDS alone would stop at the first NUL.
            curl_easy_setopt(curlHandle, CURLOPT_POSTFIELDS, body);
            curl_easy_setopt(curlHandle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(bodySize));
        }
        curl_easy_setopt(curlHandle, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curlHandle, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curlHandle, CURLOPT_WRITEDATA, &readBuffer);
        if (requestTimeoutSeconds > 0)
        {
            curl_easy_setopt(curlHandle, CURLOPT_TIMEOUT, requestTimeoutSeconds);
        }

        CURLcode res = curl_easy_perform(curlHandle);
        if (res != CURLE_OK)
        {
            MyLogger::error("CURL perform failed: " + std::string(curl_easy_strerror(res)));
            response.transportError = true;
            response.responseCode = res;
            response.errorMessage = curl_easy_strerror(res);
        }
        else
        {
            long httpCode = 0;
            curl_easy_getinfo(curlHandle, CURLINFO_RESPONSE_CODE, &httpCode);
            response.responseCode = static_cast<int>(httpCode);
            response.content = readBuffer;
            if (!response.ok())
            {
                response.errorMessage = readBuffer;
            }
            MyLogger::debug(method + " returned HTTP " + std::to_string(response.responseCode));
        }
        curl_slist_free_all(headers);
        return response;
    }

    BlockStoreResponse AzureBlobClient::putBlock(const std::string &blockId, const std::vector<char> &data,
                                                 const std::string &contentMd5)
    {
        struct curl_slist *headers = baseHeaders();
        std::string md5Header = "Content-MD5: " + contentMd5;
        headers = curl_slist_append(headers, md5Header.c_str());
        headers = curl_slist_append(headers, "Content-Type: application/octet-stream");

        return performRequest("PUT", blockUrl(blockId), data.data(), data.size(), headers);
    }

    BlockStoreResponse AzureBlobClient::putBlockList(const std::vector<std::string> &blockIds)
    {
        MyLogger::info("Committing " + std::to_string(blockIds.size()) + " blocks to " + describeTarget());
        struct curl_slist *headers = baseHeaders();
        headers = curl_slist_append(headers, "Content-Type: application/xml");

        std::string body = BlockListXml::build(blockIds);
        return performRequest("PUT", blobUrl("comp=blocklist"), body.data(), body.size(), headers);
    }

    BlockListResponse blockListFromResponse(BlockStoreResponse response)
    {
        BlockListResponse result;
        result.response = std::move(response);

        if (result.response.responseCode == 404 && !result.response.transportError &&
            result.response.content.find("BlobNotFound") != std::string::npos)
        {
            result.response.responseCode = 200;
            result.response.errorMessage.clear();
            result.response.content.clear();
            return result;
        }
        if (!result.response.ok())
        {
            return result;
        }

        try
        {
            result.blocks = BlockListXml::parse(result.response.content);
        }
        catch (const std::runtime_error &e)
        {
            MyLogger::warning("Failed to parse block list from response: " + std::string(e.what()));
            result.response.responseCode = 502;
            result.response.errorMessage = e.what();
        }
        return result;
    }

    BlockListResponse AzureBlobClient::getBlockList(bool includeUncommitted)
    {
        std::string query = std::string("comp=blocklist&blocklisttype=") + (includeUncommitted ? "all" : "committed");
        return blockListFromResponse(performRequest("GET", blobUrl(query), nullptr, 0, baseHeaders()));
    }
}
