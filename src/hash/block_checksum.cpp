#include "block_checksum.hpp"

#include <openssl/evp.h>
#include <stdexcept>
#include <vector>

namespace azupload
{
    namespace checksum
    {
        std::string base64Encode(const unsigned char *data, size_t size)
        {
            if (size == 0)
            {
                return "";
            }
            // EVP_EncodeBlock writes 4 output bytes per 3 input bytes plus a NUL.
            std::vector<unsigned char> out(4 * ((size + 2) / 3) + 1);
            int written = EVP_EncodeBlock(out.data(), data, static_cast<int>(size));
            if (written < 0)
            {
                throw std::runtime_error("Failed to base64 encode buffer");
            }
            return std::string(reinterpret_cast<const char *>(out.data()), static_cast<size_t>(written));
        }

        std::string base64Encode(const std::string &data)
        {
            return base64Encode(reinterpret_cast<const unsigned char *>(data.data()), data.size());
        }

        std::string md5Digest(const char *data, size_t size)
        {
            unsigned char hash[EVP_MAX_MD_SIZE];
            unsigned int hashLength = 0;
            EVP_MD_CTX *ctx = EVP_MD_CTX_new();
            if (!ctx)
            {
                throw std::runtime_error("Failed to create EVP_MD_CTX");
            }

            if (EVP_DigestInit_ex(ctx, EVP_md5(), nullptr) != 1 ||
                EVP_DigestUpdate(ctx, data, size) != 1 ||
                EVP_DigestFinal_ex(ctx, hash, &hashLength) != 1)
            {
                EVP_MD_CTX_free(ctx);
                throw std::runtime_error("Failed to compute MD5 hash");
            }

            EVP_MD_CTX_free(ctx);
            return std::string(reinterpret_cast<const char *>(hash), hashLength);
        }

        std::string md5Base64(const char *data, size_t size)
        {
            return base64Encode(md5Digest(data, size));
        }
    }
}
