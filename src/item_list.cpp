#include "bulkdl/item_list.hpp"

#include <optional>
#include <sstream>

#include <fmt/core.h>

#include "bulkdl/errors.hpp"

namespace bulkdl
{

std::vector<DownloadItem> parseItemList(std::istream &input, const std::string &sourceName)
{
    std::vector<DownloadItem> items;
    std::string line;
    std::size_t lineNumber = 0;

    while (std::getline(input, line))
    {
        ++lineNumber;
        std::istringstream fields(line);
        std::string url;
        if (!(fields >> url) || url[0] == '#')
        {
            continue;
        }

        std::optional<std::string> filename;
        std::optional<std::string> checksum;
        std::string field;
        while (fields >> field)
        {
            if (field.rfind("sha256:", 0) == 0 && !checksum)
            {
                checksum = field;
            }
            else if (!filename && !checksum)
            {
                filename = field;
            }
            else
            {
                throw InvalidItemError(
                    fmt::format("{}:{}: unexpected field '{}'", sourceName, lineNumber, field));
            }
        }

        try
        {
            items.push_back(DownloadItem::fromUrl(url, filename, std::nullopt, checksum));
        }
        catch (const InvalidItemError &e)
        {
            throw InvalidItemError(fmt::format("{}:{}: {}", sourceName, lineNumber, e.what()));
        }
    }

    if (input.bad())
    {
        throw InvalidItemError(fmt::format("Failed to read {}", sourceName));
    }
    return items;
}

} // namespace bulkdl
