#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"

#include "treewatch/common/logger.h"
#include "treewatch/common/path_utils.h"
#include "treewatch/config/watch_manager_config.h"
#include "treewatch/manager/logged_file_watch_manager.h"
#include "treewatch/watch/inotify_watch_service.h"

namespace {
std::atomic<bool> running{true};

void SignalHandler(int) {
    running.store(false);
}
}  // namespace

ABSL_FLAG(std::string, config, "", "Path to a JSON configuration file");
ABSL_FLAG(int, threads, 0, "Worker threads for event processing (0 keeps the configured value)");
ABSL_FLAG(std::string, log_level, "", "debug, info, warning, error or none");
ABSL_FLAG(bool, include_hidden, false, "Also watch entries whose name starts with '.'");
ABSL_FLAG(bool, save_config, false, "Write the effective configuration back to --config and exit");

int main(int argc, char** argv) {
    absl::SetProgramUsageMessage(
        "treewatch - report changes in directory trees.\n\n"
        "Usage:\n"
        "  treewatch [--config path] [--threads n] [--log_level level] [dir...]\n\n"
        "Directories given on the command line are watched in addition to the\n"
        "watch_roots of the configuration file. Press Ctrl+C to stop.");
    std::vector<char*> args = absl::ParseCommandLine(argc, argv);

    treewatch::WatchManagerConfig config;
    const std::filesystem::path config_path = treewatch::ExpandHomeDirectory(absl::GetFlag(FLAGS_config));
    if (!config_path.empty()) {
        auto load_status = config.Load(config_path);
        if (absl::IsNotFound(load_status)) {
            std::cout << "Config not found, using defaults" << std::endl;
        } else if (!load_status.ok()) {
            std::cerr << "Failed to load config: " << load_status.message() << std::endl;
            return 1;
        }
    }

    if (absl::GetFlag(FLAGS_threads) > 0) {
        config.SetMaxThreads(static_cast<size_t>(absl::GetFlag(FLAGS_threads)));
    }
    if (!absl::GetFlag(FLAGS_log_level).empty()) {
        config.SetLogLevel(absl::GetFlag(FLAGS_log_level));
    }
    if (absl::GetFlag(FLAGS_include_hidden)) {
        config.SetIncludeHidden(true);
    }
    for (size_t i = 1; i < args.size(); ++i) {
        config.AddWatchRoot(treewatch::ExpandHomeDirectory(args[i]));
    }

    if (absl::GetFlag(FLAGS_save_config)) {
        if (config_path.empty()) {
            std::cerr << "Error: --save_config requires --config" << std::endl;
            return 1;
        }
        auto save_status = config.Save(config_path);
        if (!save_status.ok()) {
            std::cerr << "Failed to save config: " << save_status.message() << std::endl;
            return 1;
        }
        std::cout << "Config written to " << config_path.string() << std::endl;
        return 0;
    }

    treewatch::Logger::Instance().SetLevel(treewatch::ParseLogLevel(config.GetLogLevel()));

    if (config.GetWatchRoots().empty()) {
        std::cerr << "Error: no directories to watch" << std::endl;
        return 1;
    }

    auto service = treewatch::InotifyWatchService::Create();
    if (!service.ok()) {
        std::cerr << "Failed to start watch service: " << service.status().message() << std::endl;
        return 1;
    }

    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    treewatch::LoggedFileWatchManager manager(std::shared_ptr<treewatch::IWatchService>(std::move(*service)),
                                              config);

    size_t watched = 0;
    for (const auto& root : config.GetWatchRoots()) {
        auto status = manager.Add(root);
        if (!status.ok()) {
            std::cerr << "Failed to watch " << root.string() << ": " << status.message() << std::endl;
            continue;
        }
        ++watched;
    }
    if (watched == 0) {
        return 1;
    }

    std::cout << "Watching " << watched << " director" << (watched == 1 ? "y" : "ies")
              << ". Press Ctrl+C to stop" << std::endl;

    while (running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\nShutting down..." << std::endl;
    auto status = manager.Close();
    if (!status.ok()) {
        std::cerr << "Close failed: " << status.message() << std::endl;
        return 1;
    }
    return 0;
}
