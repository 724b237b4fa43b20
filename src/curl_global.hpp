#pragma once

namespace bulkdl
{

/**
 * Run curl_global_init once for the process, before any other libcurl call
 * that needs it. Safe to call from several threads.
 * @throws std::runtime_error if libcurl cannot be initialized
 */
void ensureCurlGlobalInit();

} // namespace bulkdl
