#pragma once

#include <cstddef>
#include <string>

namespace azupload
{
    namespace checksum
    {
        // Standard base64 (RFC 4648, padded), no line breaks.
        std::string base64Encode(const unsigned char *data, size_t size);
        std::string base64Encode(const std::string &data);

        // Raw 16-byte MD5 digest of the buffer.
        std::string md5Digest(const char *data, size_t size);

        // MD5 of the buffer in the base64 form the blob store expects
        // in a Content-MD5 header.
        std::string md5Base64(const char *data, size_t size);
    }
}
