#pragma once

#include <string>
#include <vector>

#include "block_store_client.hpp"

namespace azupload
{
    namespace BlockListXml
    {
        // Request body of Put Block List, every id as <Latest>.
        std::string build(const std::vector<std::string> &blockIds);

        // Parses a Get Block List response. Committed blocks come first.
        // Throws std::runtime_error when the body is not a block list.
        std::vector<BlockListEntry> parse(const std::string &body);
    }
}
