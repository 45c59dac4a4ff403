#include "batchdl/errors.hpp"
#include "batchdl/logging.hpp"
#include "batchdl/orchestrator.hpp"
#include "batchdl/progress_panel.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <pthread.h>

namespace {

std::mutex orchestrator_mutex;
batchdl::Orchestrator* active_orchestrator = nullptr;
std::atomic<bool> interrupted{false};

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName
              << " [-d <directory>] [-c <concurrency>] [-r <retries>] [-T <minutes>] [-p] [-q]"
                 " <url1> <file1> [<url2> <file2> ...]"
              << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>   Set download directory (default: current directory)\n"
              << "  -c <count>       Maximum concurrent transfers (default: 3)\n"
              << "  -r <count>       Retry count, accepted but not applied (default: 0)\n"
              << "  -T <minutes>     Batch timeout in minutes (default: 60)\n"
              << "  -p               Show detailed progress\n"
              << "  -q               Do not log\n"
              << "  -h, --help       Show this message" << std::endl;
}

int parseCount(const std::string& option, const char* value, int minimum) {
    int parsed = 0;
    try {
        parsed = std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + option + ": " + value);
    }
    if (parsed < minimum) {
        throw std::runtime_error("Value for " + option + " must be at least " + std::to_string(minimum));
    }
    return parsed;
}

// SIGINT is blocked in every thread and received here, so that an interrupt
// cancels the batch instead of killing the process mid-write.
void installInterruptHandler() {
    sigset_t sigset;
    sigemptyset(&sigset);
    sigaddset(&sigset, SIGINT);
    pthread_sigmask(SIG_BLOCK, &sigset, nullptr);

    std::thread receiver([sigset] {
        int signum = 0;
        for (;;) {
            if (sigwait(&sigset, &signum) != 0) {
                return;
            }
            interrupted.store(true);
            std::lock_guard<std::mutex> lock(orchestrator_mutex);
            if (active_orchestrator) {
                active_orchestrator->cancel();
            }
        }
    });
    receiver.detach();
}

} // namespace

int main(int argc, char** argv) {
    try {
        batchdl::Config config;
        std::filesystem::path download_dir = std::filesystem::current_path();
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (option == "-p") {
                config.detailed_progress = true;
                ++arg_index;
                continue;
            } else if (option == "-q") {
                config.log_sink = &batchdl::nullLogSink;
                ++arg_index;
                continue;
            } else if (option != "-d" && option != "-c" && option != "-r" && option != "-T") {
                printUsage(argv[0]);
                return 1;
            }

            if (arg_index + 1 >= argc) {
                printUsage(argv[0]);
                return 1;
            }
            const char* value = argv[arg_index + 1];

            if (option == "-d") {
                download_dir = value;
                std::error_code ec;
                std::filesystem::create_directories(download_dir, ec);
                if (ec) {
                    throw std::runtime_error("Failed to create download directory: "
                        + download_dir.string() + " - " + ec.message());
                }
            } else if (option == "-c") {
                config.max_concurrent_transfers = parseCount(option, value, 1);
            } else if (option == "-r") {
                config.max_retry = parseCount(option, value, 0);
            } else {
                config.timeout = std::chrono::minutes(parseCount(option, value, 1));
            }
            arg_index += 2;
        }

        if (argc - arg_index < 2 || (argc - arg_index) % 2 != 0) {
            printUsage(argv[0]);
            return 1;
        }

        std::vector<batchdl::DownloadRequest> requests;
        for (int i = arg_index; i < argc; i += 2) {
            std::filesystem::path destination = download_dir / argv[i + 1];
            requests.push_back({argv[i], destination.string()});
        }

        installInterruptHandler();

        batchdl::Orchestrator orchestrator(std::move(config));
        batchdl::ProgressPanel panel(
            "batchdl: " + std::to_string(requests.size()) + " file(s)",
            orchestrator.progress(),
            orchestrator.throughput(),
            std::cout);
        panel.start();

        {
            std::lock_guard<std::mutex> lock(orchestrator_mutex);
            active_orchestrator = &orchestrator;
        }
        int status = 0;
        try {
            orchestrator.runBatch(requests);
        } catch (const batchdl::ScopeError& ex) {
            std::cerr << "Download stopped: " << ex.what() << std::endl;
            status = interrupted.load() ? 130 : 1;
        } catch (const batchdl::Error& ex) {
            std::cerr << "Download failed: " << ex.what() << std::endl;
            status = 1;
        }
        {
            std::lock_guard<std::mutex> lock(orchestrator_mutex);
            active_orchestrator = nullptr;
        }
        panel.wait();

        for (const auto& outcome : orchestrator.outcomes()) {
            if (outcome.status == batchdl::TransferStatus::Failed) {
                std::cerr << outcome.request.url << ": " << outcome.error_message << std::endl;
                status = status == 0 ? 1 : status;
            }
        }
        return status;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
