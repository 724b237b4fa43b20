#include <csignal>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <curl/curl.h>
#include <fmt/core.h>

#include "bulkdl/cancellation.hpp"
#include "bulkdl/config.hpp"
#include "bulkdl/downloader.hpp"
#include "bulkdl/errors.hpp"
#include "bulkdl/item_list.hpp"
#include "bulkdl/log.hpp"
#include "bulkdl/version.hpp"
#include "console_renderer.hpp"

namespace
{

// Exit codes
constexpr int kExitOk = 0;
constexpr int kExitItemsFailed = 1;
constexpr int kExitUsage = 2;

bulkdl::CancellationToken gCancel;

void onSignal(int)
{
    gCancel.cancel();
}

void printOutcomes(const std::vector<bulkdl::DownloadItem> &items, const std::vector<bulkdl::OutcomeRecord> &records)
{
    fmt::print("\n{:<4} {:<17} {:>9} {:>12}  {}\n", "#", "STATUS", "ATTEMPTS", "WRITTEN", "FILE");
    for (std::size_t i = 0; i < records.size(); ++i)
    {
        const auto &record = records[i];
        fmt::print("{:<4} {:<17} {:>9} {:>12}  {}\n", i + 1, bulkdl::toString(record.status), record.attempts,
                   bulkdl::formatBytes(record.bytesWritten), record.finalPath.string());
        if (record.errorMessage)
        {
            fmt::print("     {} ({})\n", *record.errorMessage, items[i].url());
        }
    }

    auto summary = bulkdl::RunSummary::of(records);
    fmt::print("\n{} succeeded, {} already complete, {} failed, {} cancelled\n", summary.succeeded,
               summary.alreadyComplete, summary.failed, summary.cancelled);
}

} // namespace

int main(int argc, char *argv[])
{
    // Quick check for --version before full parsing
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--version")
        {
            fmt::print("bulkdl v{}\n", BULKDL_VERSION);
            fmt::print("Built with:\n");
            fmt::print("  - libcurl {}: HTTP/HTTPS transfers\n", curl_version_info(CURLVERSION_NOW)->version);
            fmt::print("  - CLI11: Command-line parsing\n");
            fmt::print("  - fmt: String formatting\n");
            fmt::print("  - OpenSSL: Checksum verification\n");
            return kExitOk;
        }
    }

    CLI::App app{fmt::format("bulkdl v{} - Batch downloader with resume and retries", BULKDL_VERSION)};

    bulkdl::RunOptions options;
    std::vector<std::string> urls;
    std::string inputFile;
    std::string directory;
    std::vector<std::string> headerLines;
    std::string proxy;
    std::string progress = "both";
    bool noResume = false;
    long connectTimeout = 30;
    long requestTimeout = 0;
    long batchTimeout = 0;
    bool verbose = false;
    bool quiet = false;

    // ====================================================================
    // DEFINE ARGUMENTS
    // ====================================================================

    app.add_option("URL", urls, "HTTP/HTTPS URLs to download");
    app.add_option("-i,--input-file", inputFile, "File listing 'URL [filename] [sha256:<hex>]' per line")
        ->check(CLI::ExistingFile);
    app.add_option("-d,--directory", directory, "Directory to save files into (default: current directory)");
    app.add_option("-j,--concurrency", options.concurrency, "Maximum simultaneous downloads")->default_val(32);
    app.add_option("-r,--retries", options.retries, "Retries after the first attempt for transient errors")
        ->check(CLI::Range(0, 100))
        ->default_val(3);
    app.add_flag("--no-resume", noResume, "Always download from scratch instead of resuming partial files");
    app.add_option("-H,--header", headerLines, "Extra request header 'Name: value' (repeatable)");
    app.add_option("--proxy", proxy, "Proxy URL, e.g. http://host:3128 or socks5://host:1080");
    app.add_option("--progress", progress, "Progress display: hidden, item, aggregate or both")
        ->check(CLI::IsMember({"hidden", "item", "aggregate", "both"}))
        ->default_val("both");
    app.add_flag("--clear", options.clearOnFinish, "Clear the progress display when done");
    app.add_option("--connect-timeout", connectTimeout, "Connection timeout in seconds")
        ->check(CLI::PositiveNumber)
        ->default_val(30);
    app.add_option("--timeout", requestTimeout, "Per-request timeout in seconds (0 = none)")
        ->check(CLI::NonNegativeNumber)
        ->default_val(0);
    app.add_option("--batch-timeout", batchTimeout, "Cancel the whole batch after this many seconds (0 = none)")
        ->check(CLI::NonNegativeNumber)
        ->default_val(0);
    auto *verboseFlag = app.add_flag("-v,--verbose", verbose, "Log debug details");
    app.add_flag("-q,--quiet", quiet, "Only log errors")->excludes(verboseFlag);
    app.add_flag("--version", "Display version information");

    // ====================================================================
    // PARSE ARGUMENTS
    // ====================================================================

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        return app.exit(e);
    }

    if (verbose)
    {
        bulkdl::log::setLevel(bulkdl::log::Level::Debug);
    }
    else if (quiet)
    {
        bulkdl::log::setLevel(bulkdl::log::Level::Error);
    }

    // 1. Collect items from the command line and the input file
    std::vector<bulkdl::DownloadItem> items;
    try
    {
        for (const auto &url : urls)
        {
            items.push_back(bulkdl::DownloadItem::fromUrl(url));
        }
        if (!inputFile.empty())
        {
            std::ifstream input(inputFile);
            if (!input)
            {
                fmt::print(stderr, "✗ Cannot open input file {}\n", inputFile);
                return kExitUsage;
            }
            auto listed = bulkdl::parseItemList(input, inputFile);
            items.insert(items.end(), listed.begin(), listed.end());
        }
    }
    catch (const bulkdl::InvalidItemError &e)
    {
        fmt::print(stderr, "✗ Invalid item: {}\n", e.what());
        return kExitUsage;
    }

    if (items.empty())
    {
        fmt::print(stderr, "✗ Nothing to download: give URLs or --input-file\n");
        return kExitUsage;
    }

    // 2. Build the validated configuration
    std::optional<bulkdl::RunConfig> config;
    try
    {
        options.directory = directory;
        options.resumable = !noResume;
        for (const auto &line : headerLines)
        {
            auto [name, value] = bulkdl::parseHeader(line);
            options.headers[name] = value;
        }
        if (!proxy.empty())
        {
            options.proxy = proxy;
        }
        options.progressVisibility = bulkdl::parseProgressVisibility(progress);
        options.connectTimeout = std::chrono::seconds(connectTimeout);
        options.requestTimeout = std::chrono::seconds(requestTimeout);
        if (batchTimeout > 0)
        {
            options.batchTimeout = std::chrono::seconds(batchTimeout);
        }
        config = bulkdl::RunConfig::create(std::move(options));
    }
    catch (const bulkdl::ConfigError &e)
    {
        fmt::print(stderr, "✗ Configuration error: {}\n", e.what());
        return kExitUsage;
    }

    // ====================================================================
    // PERFORM DOWNLOADS
    // ====================================================================

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    try
    {
        bulkdl::Downloader downloader(*config);
        std::vector<std::string> names;
        for (const auto &item : items)
        {
            names.push_back(item.filename());
        }
        bulkdl::ConsoleRenderer renderer(names, config->progressVisibility(), config->clearOnFinish());

        auto records = downloader.run(items, &renderer, &gCancel);
        printOutcomes(items, records);

        return bulkdl::RunSummary::of(records).allSucceeded() ? kExitOk : kExitItemsFailed;
    }
    catch (const bulkdl::ConfigError &e)
    {
        fmt::print(stderr, "✗ Configuration error: {}\n", e.what());
        return kExitUsage;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Fatal error: {}\n", e.what());
        return kExitItemsFailed;
    }
}
