#include "block_list_xml.hpp"

#include <memory>
#include <rapidxml/rapidxml.hpp>
#include <stdexcept>

namespace azupload
{
    namespace BlockListXml
    {
        namespace
        {
            constexpr const char *kUtf8Bom = "\xEF\xBB\xBF";

            void collect(rapidxml::xml_node<> *group, bool committed, std::vector<BlockListEntry> &out)
            {
                if (!group)
                {
                    return;
                }
                for (auto *block = group->first_node("Block"); block; block = block->next_sibling("Block"))
                {
                    auto *name = block->first_node("Name");
                    if (!name)
                    {
                        throw std::runtime_error("'Name' missing in 'Block'");
                    }
                    auto *size = block->first_node("Size");
                    if (!size)
                    {
                        throw std::runtime_error("'Size' missing in 'Block'");
                    }
                    BlockListEntry entry;
                    entry.name = name->value();
                    try
                    {
                        entry.size = std::stoull(size->value());
                    }
                    catch (const std::logic_error &)
                    {
                        throw std::runtime_error("Invalid block size '" + std::string(size->value()) + "'");
                    }
                    entry.committed = committed;
                    out.push_back(entry);
                }
            }
        }

        std::string build(const std::vector<std::string> &blockIds)
        {
            std::string body = "<?xml version=\"1.0\" encoding=\"utf-8\"?><BlockList>";
            for (const auto &id : blockIds)
            {
                // base64 ids never contain XML metacharacters
                body += "<Latest>" + id + "</Latest>";
            }
            body += "</BlockList>";
            return body;
        }

        std::vector<BlockListEntry> parse(const std::string &body)
        {
            std::string text = body;
            if (text.rfind(kUtf8Bom, 0) == 0)
            {
                text.erase(0, 3);
            }
            // rapidxml parses in place and needs a terminating NUL.
            std::vector<char> buffer(text.begin(), text.end());
            buffer.push_back('\0');

            auto doc = std::make_unique<rapidxml::xml_document<>>();
            try
            {
                doc->parse<0>(buffer.data());
            }
            catch (const rapidxml::parse_error &e)
            {
                throw std::runtime_error(std::string("cannot parse block list response: ") + e.what());
            }

            auto *root = doc->first_node("BlockList");
            if (!root)
            {
                throw std::runtime_error("'BlockList' is not found");
            }
            std::vector<BlockListEntry> blocks;
            collect(root->first_node("CommittedBlocks"), true, blocks);
            collect(root->first_node("UncommittedBlocks"), false, blocks);
            return blocks;
        }
    }
}
