#include "connection_string.hpp"
#include "../common/upload_error.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace azupload
{
    namespace ConnectionString
    {
        namespace
        {
            std::string trim(const std::string &s)
            {
                auto begin = s.find_first_not_of(" \t\r\n");
                if (begin == std::string::npos)
                {
                    return "";
                }
                auto end = s.find_last_not_of(" \t\r\n");
                return s.substr(begin, end - begin + 1);
            }

            std::string lower(std::string s)
            {
                std::transform(s.begin(), s.end(), s.begin(),
                               [](unsigned char c)
                               { return static_cast<char>(std::tolower(c)); });
                return s;
            }

            std::string valueOr(const std::map<std::string, std::string> &parts, const std::string &key,
                                const std::string &fallback)
            {
                auto it = parts.find(key);
                return it == parts.end() || it->second.empty() ? fallback : it->second;
            }
        }

        std::map<std::string, std::string> split(const std::string &connectionString)
        {
            std::map<std::string, std::string> parts;
            std::stringstream ss(connectionString);
            std::string segment;
            while (std::getline(ss, segment, ';'))
            {
                segment = trim(segment);
                if (segment.empty())
                {
                    continue;
                }
                // Values (SAS tokens in particular) may contain '=' themselves.
                auto eq = segment.find('=');
                if (eq == std::string::npos || eq == 0)
                {
                    throw UploadError(ErrorKind::Configuration,
                                      "Malformed connection string segment: '" + segment + "'");
                }
                parts[lower(trim(segment.substr(0, eq)))] = trim(segment.substr(eq + 1));
            }
            return parts;
        }

        StorageEndpoint parse(const std::string &connectionString)
        {
            auto parts = split(connectionString);
            if (parts.empty())
            {
                throw UploadError(ErrorKind::Configuration, "Storage connection string is empty");
            }

            StorageEndpoint endpoint;
            endpoint.sasToken = valueOr(parts, "sharedaccesssignature", "");
            if (!endpoint.sasToken.empty() && endpoint.sasToken.front() == '?')
            {
                endpoint.sasToken.erase(0, 1);
            }
            if (endpoint.sasToken.empty())
            {
                if (parts.count("accountkey"))
                {
                    throw UploadError(ErrorKind::Configuration,
                                      "Shared key connection strings are not supported; "
                                      "provide a SharedAccessSignature for the container");
                }
                throw UploadError(ErrorKind::Configuration,
                                  "Storage connection string has no SharedAccessSignature");
            }

            endpoint.blobEndpoint = valueOr(parts, "blobendpoint", "");
            if (endpoint.blobEndpoint.empty())
            {
                std::string account = valueOr(parts, "accountname", "");
                if (account.empty())
                {
                    throw UploadError(ErrorKind::Configuration,
                                      "Storage connection string needs either BlobEndpoint or AccountName");
                }
                std::string protocol = valueOr(parts, "defaultendpointsprotocol", "https");
                std::string suffix = valueOr(parts, "endpointsuffix", "core.windows.net");
                endpoint.blobEndpoint = protocol + "://" + account + ".blob." + suffix;
            }
            while (!endpoint.blobEndpoint.empty() && endpoint.blobEndpoint.back() == '/')
            {
                endpoint.blobEndpoint.pop_back();
            }
            if (endpoint.blobEndpoint.rfind("http://", 0) != 0 && endpoint.blobEndpoint.rfind("https://", 0) != 0)
            {
                throw UploadError(ErrorKind::Configuration,
                                  "Blob endpoint must be an http(s) URL: " + endpoint.blobEndpoint);
            }
            return endpoint;
        }
    }
}
