#include <transfer-hub/config_parser.hpp>
#include <transfer-hub/file_copy_transport_engine.hpp>
#include <transfer-hub/logger.hpp>
#include <transfer-hub/metrics_collector.hpp>
#include <transfer-hub/time_utils.hpp>
#include <transfer-hub/transfer_service.hpp>
#include <fmt/format.h>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

using namespace TransferHub;

// Command line parsing structure
struct ProgramOptions
{
    std::string config_file;
    std::string command;
    std::vector<std::string> arguments;
    bool show_help = false;

    TransferOptions transfer;

    // Command line logging overrides, applied on top of the config file
    std::optional<std::string> log_level;
    std::optional<std::string> log_output;
    std::optional<std::string> log_file;
};

void printUsage()
{
    std::string usage =
    "Usage: transfer-hub [OPTIONS] <command> [args]\n"
    "\n"
    "Commands:\n"
    "  fetch <source>...       Copy each source (path or file:// URL) into the transfer directory\n"
    "  push <dest> <file>      Copy a local file to the destination path\n"
    "  list [status]           List journaled transfers, optionally only one status\n"
    "  group <name>            List the transfers tagged with a group\n"
    "  resume-failed <id>      Continue a failed fetch from the bytes it already wrote\n"
    "  cached <resource>       Print the local copy of a fetched resource\n"
    "  reconcile               Re-queue transfers abandoned by an earlier run and wait for them\n"
    "  clean-cache             Drop cache entries whose files are gone\n"
    "\n"
    "Options:\n"
    "  -c, --config FILE       JSON configuration file\n"
    "  -p, --priority LEVEL    low, normal, high, urgent (default: normal)\n"
    "  -g, --group NAME        Tag new transfers with a group (default: default)\n"
    "  -h, --help              Show this help message\n"
    "\n"
    "Logging Options:\n"
    "  -l, --log-level LEVEL   trace, debug, info, warn, error, fatal, off (default: info)\n"
    "  -o, --log-output TYPE   console, file, both, disabled (default: console)\n"
    "  -f, --log-file FILE     Log file path (default: transfer-hub.log)\n"
    "\n"
    "Examples:\n"
    "  transfer-hub --config hub.json fetch /data/a.zip file:///data/b.iso\n"
    "  transfer-hub push /mnt/backup/ report.pdf\n"
    "  transfer-hub --config hub.json list failed\n"
    "  transfer-hub --log-level debug --log-output both reconcile";

    fmt::print("{}\n", usage);
}

// Returns the value following argv[i] and advances i, or nullptr when missing
const char *nextArg(char **argv, int &i, int argc)
{
    if (i + 1 < argc)
    {
        return argv[++i];
    }
    return nullptr;
}

ProgramOptions parseCommandLine(int argc, char **argv)
{
    ProgramOptions options;

    for (int i = 1; i < argc; i++)
    {
        std::string arg{ argv[i] };

        if (arg == "-c" || arg == "--config")
        {
            const char *config_path = nextArg(argv, i, argc);
            if (config_path)
            {
                options.config_file = config_path;
            }
            else
            {
                Logger::error("Error: --config requires a file path");
                options.show_help = true;
                break;
            }
        }
        else if (arg == "-l" || arg == "--log-level")
        {
            const char *log_level = nextArg(argv, i, argc);
            if (log_level)
            {
                options.log_level = log_level;
            }
            else
            {
                Logger::error("Error: --log-level requires a level (trace, debug, info, warn, error, fatal, off)");
                options.show_help = true;
                break;
            }
        }
        else if (arg == "-o" || arg == "--log-output")
        {
            const char *log_output = nextArg(argv, i, argc);
            if (log_output)
            {
                options.log_output = log_output;
            }
            else
            {
                Logger::error("Error: --log-output requires a type (console, file, both, disabled)");
                options.show_help = true;
                break;
            }
        }
        else if (arg == "-f" || arg == "--log-file")
        {
            const char *log_file = nextArg(argv, i, argc);
            if (log_file)
            {
                options.log_file = log_file;
            }
            else
            {
                Logger::error("Error: --log-file requires a file path");
                options.show_help = true;
                break;
            }
        }
        else if (arg == "-p" || arg == "--priority")
        {
            const char *priority = nextArg(argv, i, argc);
            std::optional<TransferPriority> parsed = priority ? priorityFromString(priority) : std::nullopt;
            if (parsed)
            {
                options.transfer.priority = *parsed;
            }
            else
            {
                Logger::error("Error: --priority requires a level (low, normal, high, urgent)");
                options.show_help = true;
                break;
            }
        }
        else if (arg == "-g" || arg == "--group")
        {
            const char *group = nextArg(argv, i, argc);
            if (group)
            {
                options.transfer.group = group;
            }
            else
            {
                Logger::error("Error: --group requires a name");
                options.show_help = true;
                break;
            }
        }
        else if (arg == "-h" || arg == "--help")
        {
            options.show_help = true;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            Logger::error("Unknown option: {}", arg);
            options.show_help = true;
            break;
        }
        else if (options.command.empty())
        {
            options.command = arg;
        }
        else
        {
            options.arguments.push_back(arg);
        }
    }

    if (!options.show_help && options.command.empty())
    {
        options.show_help = true;
    }

    return options;
}

void printRecord(const TransferRecord &record)
{
    std::string line = fmt::format("{:<24} {:<6} {:<14} {:>5.1f}%  {}", record.task_id, kindToString(record.kind),
                                   statusToString(record.status), record.progress * 100.0, record.resource_id);
    if (record.expected_size_bytes > 0)
    {
        line += fmt::format("  ({})", TimeUtils::formatBytes(record.expected_size_bytes));
    }
    if (record.last_error)
    {
        line += fmt::format("  error: {}", record.last_error->description);
    }
    fmt::print("{}\n", line);
}

// Runs the event loop until every channel has closed; returns the number that did not complete
size_t watchTransfers(FileCopyTransportEngine &engine, const std::vector<TransferChannelPtr> &channels)
{
    size_t open_channels = channels.size();
    size_t unsuccessful = 0;

    for (const auto &channel : channels)
    {
        auto last_status = std::make_shared<std::optional<TransferStatus>>();
        auto last_decile = std::make_shared<int>(-1);

        channel->subscribe(
        [last_status, last_decile, &unsuccessful](const TransferRecord &record) {
            int decile = static_cast<int>(record.progress * 10.0);
            if (*last_status != record.status || decile != *last_decile)
            {
                *last_status = record.status;
                *last_decile = decile;
                printRecord(record);
            }

            if (record.isTerminal())
            {
                if (record.status == TransferStatus::COMPLETED)
                {
                    fmt::print("{} -> {}\n", record.resource_id, record.local_path.string());
                }
                else
                {
                    ++unsuccessful;
                }
            }
        },
        [&open_channels] { --open_channels; });
    }

    while (open_channels > 0)
    {
        engine.waitForUpdates(std::chrono::milliseconds(200));
        engine.dispatchPendingUpdates();
    }

    return unsuccessful;
}

void reportFailure(const std::string &what, const Failure &failure)
{
    Logger::error("{}: {} ({})", what, failureMessage(failure), failureKindToString(failureKind(failure)));
}

int runCommand(const ProgramOptions &options, const Config &config)
{
    FileCopyTransportEngine engine(config.engine);
    TransferService service(config, engine);

    Result<void> ready = service.initialize();
    if (!ready)
    {
        reportFailure("Failed to start", ready.failure());
        return 1;
    }

    const std::string &command = options.command;
    const std::vector<std::string> &args = options.arguments;

    if (command == "fetch")
    {
        if (args.empty())
        {
            Logger::error("fetch requires at least one source");
            return 2;
        }

        std::vector<TransferChannelPtr> channels;
        size_t rejected = 0;
        for (const auto &source : args)
        {
            Result<TransferChannelPtr> channel = service.enqueueFetch(source, options.transfer);
            if (channel)
            {
                channels.push_back(channel.value());
            }
            else
            {
                reportFailure(fmt::format("Cannot fetch {}", source), channel.failure());
                ++rejected;
            }
        }

        size_t unsuccessful = watchTransfers(engine, channels);
        return (rejected + unsuccessful) == 0 ? 0 : 1;
    }

    if (command == "push")
    {
        if (args.size() != 2)
        {
            Logger::error("push requires a destination and a file");
            return 2;
        }

        Result<TransferChannelPtr> channel = service.enqueuePush(args[0], args[1], options.transfer);
        if (!channel)
        {
            reportFailure(fmt::format("Cannot push {}", args[1]), channel.failure());
            return 1;
        }
        return watchTransfers(engine, { channel.value() }) == 0 ? 0 : 1;
    }

    if (command == "list")
    {
        Result<std::vector<TransferRecord>> records = Result<std::vector<TransferRecord>>::success({});
        if (args.empty())
        {
            records = service.getAll();
        }
        else
        {
            std::optional<TransferStatus> status = statusFromString(args[0]);
            if (!status)
            {
                Logger::error("Unknown status '{}'", args[0]);
                return 2;
            }
            records = service.getByStatus(*status);
        }

        if (!records)
        {
            reportFailure("Cannot list transfers", records.failure());
            return 1;
        }
        for (const auto &record : records.value())
        {
            printRecord(record);
        }
        fmt::print("{} transfers\n", records.value().size());
        return 0;
    }

    if (command == "group")
    {
        if (args.size() != 1)
        {
            Logger::error("group requires a group name");
            return 2;
        }

        Result<std::vector<TransferRecord>> records = service.getByGroup(args[0]);
        if (!records)
        {
            reportFailure("Cannot list transfers", records.failure());
            return 1;
        }
        for (const auto &record : records.value())
        {
            printRecord(record);
        }
        fmt::print("{} transfers in {}\n", records.value().size(), args[0]);
        return 0;
    }

    if (command == "resume-failed")
    {
        if (args.size() != 1)
        {
            Logger::error("resume-failed requires a task or resource identifier");
            return 2;
        }

        Result<TransferChannelPtr> channel = service.resumeFailed(args[0]);
        if (!channel)
        {
            reportFailure(fmt::format("Cannot resume {}", args[0]), channel.failure());
            return 1;
        }
        return watchTransfers(engine, { channel.value() }) == 0 ? 0 : 1;
    }

    if (command == "cached")
    {
        if (args.size() != 1)
        {
            Logger::error("cached requires a resource identifier");
            return 2;
        }

        Result<std::optional<std::filesystem::path>> path = service.getCachedPath(args[0]);
        if (!path)
        {
            reportFailure("Cache lookup failed", path.failure());
            return 1;
        }
        if (!path.value())
        {
            fmt::print("{} is not cached\n", args[0]);
            return 1;
        }
        fmt::print("{}\n", path.value()->string());
        return 0;
    }

    if (command == "reconcile")
    {
        Result<ReconcileOutcome> outcome = service.reconcileAbandoned();
        if (!outcome)
        {
            reportFailure("Reconcile failed", outcome.failure());
            return 1;
        }

        for (const auto &record : outcome.value().failed)
        {
            printRecord(record);
        }

        std::vector<TransferChannelPtr> channels;
        for (const auto &record : outcome.value().succeeded)
        {
            Result<TransferChannelPtr> channel = service.channelFor(record.task_id);
            if (channel)
            {
                channels.push_back(channel.value());
            }
        }

        fmt::print("Re-queued {}, failed {}\n", outcome.value().succeeded.size(), outcome.value().failed.size());
        return watchTransfers(engine, channels) == 0 ? 0 : 1;
    }

    if (command == "clean-cache")
    {
        Result<size_t> removed = service.cleanStaleCacheEntries();
        if (!removed)
        {
            reportFailure("Cache cleanup failed", removed.failure());
            return 1;
        }
        CacheStats stats = service.cacheStats();
        fmt::print("Removed {} stale entries, {} of {} remain\n", removed.value(), stats.entries, stats.max_entries);
        return 0;
    }

    Logger::error("Unknown command: {}", command);
    printUsage();
    return 2;
}

int main(int argc, char **argv)
{
    // Initialize logger with basic settings for command line parsing
    Logger::initialize(LogLevel::INFO, LogOutput::CONSOLE);

    ProgramOptions options = parseCommandLine(argc, argv);
    if (options.show_help)
    {
        printUsage();
        return 0;
    }

    Config config;
    if (!options.config_file.empty())
    {
        std::optional<Config> loaded = ConfigParser::parseJsonFile(options.config_file);
        if (!loaded)
        {
            Logger::error("Failed to load configuration from {}", options.config_file);
            return 1;
        }
        config = *loaded;
    }

    if (options.log_level)
    {
        config.logging.level = *options.log_level;
    }
    if (options.log_output)
    {
        config.logging.output = *options.log_output;
    }
    if (options.log_file)
    {
        config.logging.file = *options.log_file;
    }
    ConfigParser::applyLogging(config.logging);

    GlobalMetrics::initialize(config.metrics);

    int exit_code = 1;
    try
    {
        exit_code = runCommand(options, config);
    }
    catch (const std::exception &e)
    {
        Logger::error("Fatal error: {}", e.what());
    }

    GlobalMetrics::shutdown();
    Logger::shutdown();
    return exit_code;
}
