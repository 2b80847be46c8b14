#pragma once

#include <map>
#include <string>

namespace azupload
{
    // Where blocks go and the SAS token that authorizes it.
    struct StorageEndpoint
    {
        std::string blobEndpoint; // e.g. https://account.blob.core.windows.net, no trailing slash
        std::string sasToken;     // query string without the leading '?'
    };

    namespace ConnectionString
    {
        // Splits "Key=Value;Key=Value" into a map keyed by lower-cased key.
        std::map<std::string, std::string> split(const std::string &connectionString);

        // Accepts BlobEndpoint+SharedAccessSignature or AccountName+SharedAccessSignature
        // (with optional DefaultEndpointsProtocol and EndpointSuffix).
        // Throws UploadError(Configuration) for anything else.
        StorageEndpoint parse(const std::string &connectionString);
    }
}
