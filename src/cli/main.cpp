/**
 * @file main.cpp
 * @brief ddsync command line: upload and download one project
 *
 * USAGE:
 *   ddsync [--config FILE] [--verbose] upload -p PROJECT [--follow-symlinks] [--dry-run] PATH...
 *   ddsync [--config FILE] [--verbose] download -p PROJECT [--include PATH...|--exclude PATH...] [FOLDER]
 *
 * EXIT STATUS:
 *   0  every node succeeded or was unchanged
 *   1  one or more nodes failed (successes are still reported)
 *   2  nothing was transferred: usage, config, validation, filesystem or auth problem
 */

#include "ddsync/app/sync_engine.hpp"
#include "ddsync/core/config.hpp"
#include "ddsync/events/components.hpp"
#include "ddsync/events/event_bus.hpp"
#include "ddsync/remote/http_service.hpp"
#include "ddsync/sync/progress.hpp"

#include <boost/program_options.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string>
#include <vector>

namespace po = boost::program_options;

using namespace ddsync;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitNodeFailures = 1;
constexpr int kExitPreflight = 2;

void setup_logging(bool verbose) {
    auto logger = spdlog::stderr_color_mt("ddsync");
    spdlog::set_default_logger(logger);
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
}

void print_usage(const po::options_description& global) {
    std::cerr << "Usage:\n"
              << "  ddsync [OPTIONS] upload -p PROJECT [--follow-symlinks] [--dry-run] PATH...\n"
              << "  ddsync [OPTIONS] download -p PROJECT [--include PATH...|--exclude PATH...] [FOLDER]\n\n"
              << global << "\n";
}

int print_report(const app::SyncOutcome& outcome) {
    for (const auto& node : outcome.report.outcomes()) {
        std::cout << sync::to_string(node.status) << ' ' << content::to_string(node.node_kind) << ' '
                  << (node.path.empty() ? "/" : node.path);
        if (node.error) {
            std::cout << ": " << node.error->describe();
        }
        std::cout << '\n';
    }

    const auto& report = outcome.report;
    std::cout << "total: " << report.size() << " node(s), "
              << report.count(sync::OutcomeStatus::Succeeded) << " ok, "
              << report.count(sync::OutcomeStatus::Skipped) << " unchanged, "
              << report.count(sync::OutcomeStatus::Planned) << " planned, "
              << report.count(sync::OutcomeStatus::Failed) << " failed, "
              << report.count(sync::OutcomeStatus::Cancelled) << " cancelled, "
              << report.bytes_transferred() << " bytes in " << report.duration.count() << " ms\n";

    if (!outcome.dry_run && !outcome.verified) {
        std::cout << "final state could not be verified\n";
    }
    return outcome.succeeded() ? kExitOk : kExitNodeFailures;
}

int finish(const Result<app::SyncOutcome>& outcome) {
    if (outcome.is_error()) {
        spdlog::error("{}", outcome.error().describe());
        return kExitPreflight;
    }
    return print_report(outcome.value());
}

Result<app::UploadOptions> parse_upload(const std::vector<std::string>& args) {
    app::UploadOptions options;
    std::vector<std::string> paths;

    po::options_description desc("upload options");
    desc.add_options()
        ("project,p", po::value<std::string>(&options.project)->required(), "project name")
        ("follow-symlinks", po::bool_switch(&options.follow_symlinks), "descend into symlinked directories")
        ("dry-run", po::bool_switch(&options.dry_run), "print the plan without transferring")
        ("path", po::value<std::vector<std::string>>(&paths), "file or directory to upload");
    po::positional_options_description positional;
    positional.add("path", -1);

    try {
        po::variables_map vm;
        po::store(po::command_line_parser(args).options(desc).positional(positional).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        return Err<app::UploadOptions>(Error::validation(std::string("upload: ") + e.what()));
    }

    if (paths.empty()) {
        return Err<app::UploadOptions>(Error::validation("upload: at least one PATH is required"));
    }
    for (const auto& path : paths) {
        options.paths.emplace_back(path);
    }
    return Ok(std::move(options));
}

Result<app::DownloadOptions> parse_download(const std::vector<std::string>& args) {
    app::DownloadOptions options;
    std::vector<std::string> folders;

    po::options_description desc("download options");
    desc.add_options()
        ("project,p", po::value<std::string>(&options.project)->required(), "project name")
        ("include", po::value<std::vector<std::string>>(&options.include)->multitoken(), "only fetch these paths")
        ("exclude", po::value<std::vector<std::string>>(&options.exclude)->multitoken(), "skip these paths")
        ("folder", po::value<std::vector<std::string>>(&folders), "destination directory");
    po::positional_options_description positional;
    positional.add("folder", -1);

    try {
        po::variables_map vm;
        po::store(po::command_line_parser(args).options(desc).positional(positional).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        return Err<app::DownloadOptions>(Error::validation(std::string("download: ") + e.what()));
    }

    if (folders.size() > 1) {
        return Err<app::DownloadOptions>(Error::validation("download: at most one FOLDER may be given"));
    }
    if (!folders.empty()) {
        options.destination = folders.front();
    }
    return Ok(std::move(options));
}

} // namespace

int main(int argc, char** argv) {
    std::string config_file;
    std::string command;
    bool verbose = false;

    po::options_description global("Options");
    global.add_options()
        ("help,h", "show this help")
        ("config", po::value<std::string>(&config_file), "extra YAML config file, read last")
        ("verbose,v", po::bool_switch(&verbose), "debug logging");

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::string>(&command), "upload or download")
        ("subargs", po::value<std::vector<std::string>>(), "command arguments");

    po::options_description all;
    all.add(global).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1).add("subargs", -1);

    po::variables_map vm;
    std::vector<std::string> subargs;
    try {
        po::parsed_options parsed = po::command_line_parser(argc, argv)
            .options(all)
            .positional(positional)
            .allow_unregistered()
            .run();
        po::store(parsed, vm);
        po::notify(vm);

        subargs = po::collect_unrecognized(parsed.options, po::include_positional);
        if (!subargs.empty() && subargs.front() == command) {
            subargs.erase(subargs.begin());
        }
    } catch (const po::error& e) {
        std::cerr << "ddsync: " << e.what() << "\n";
        print_usage(global);
        return kExitPreflight;
    }

    if (vm.count("help") || command.empty()) {
        print_usage(global);
        return vm.count("help") ? kExitOk : kExitPreflight;
    }

    setup_logging(verbose);

    const auto env = process_environment();
    auto files = default_config_files(env);
    if (!config_file.empty()) {
        files.push_back(config_file);
    }
    auto config = load_config(files, env);
    if (config.is_error()) {
        spdlog::error("{}", config.error().describe());
        return kExitPreflight;
    }
    if (!verbose) {
        spdlog::set_level(spdlog::level::from_str(config.value().log_level));
    }

    auto service = remote::HttpRemoteService::create(config.value());
    if (service.is_error()) {
        spdlog::error("{}", service.error().describe());
        return kExitPreflight;
    }

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    sync::ProgressAggregator progress(bus);
    app::SyncEngine engine(config.value(), *service.value(), bus);

    int status = kExitPreflight;
    if (command == "upload") {
        auto options = parse_upload(subargs);
        if (options.is_error()) {
            spdlog::error("{}", options.error().message);
            print_usage(global);
            return kExitPreflight;
        }
        status = finish(engine.upload(options.value()));
    } else if (command == "download") {
        auto options = parse_download(subargs);
        if (options.is_error()) {
            spdlog::error("{}", options.error().message);
            print_usage(global);
            return kExitPreflight;
        }
        status = finish(engine.download(options.value()));
    } else {
        spdlog::error("unknown command '{}'", command);
        print_usage(global);
        return kExitPreflight;
    }

    progress.print_stats();
    return status;
}
