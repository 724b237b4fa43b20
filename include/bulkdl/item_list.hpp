#pragma once

#include <istream>
#include <string>
#include <vector>

#include "bulkdl/download_item.hpp"

namespace bulkdl
{

/**
 * Read download items from a list, one per line:
 *
 *   URL [filename] [sha256:<hex>]
 *
 * Blank lines and lines starting with '#' are skipped.
 *
 * @param input Stream to read
 * @param sourceName Used in error messages (e.g. the file name)
 * @throws InvalidItemError naming the offending line
 */
std::vector<DownloadItem> parseItemList(std::istream &input, const std::string &sourceName);

} // namespace bulkdl
