/*
 * src/main_cli.cpp - Main entry point for the CLI application
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <csignal>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <filesystem>
#include <fstream>
#include <getopt.h>

#include "dlkeeper/common.h"
#include "dlkeeper/config.h"
#include "dlkeeper/cookie.h"
#include "dlkeeper/dispatcher.h"
#include "dlkeeper/http_session.h"
#include "dlkeeper/log.h"
#include "dlkeeper/partial_file.h"
#include "dlkeeper/range_backend.h"
#include "dlkeeper/thread_pool.h"
#include "dlkeeper/transfer_registry.h"

using namespace dlkeeper;

static std::atomic<bool> g_interrupted{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_interrupted = true;
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [OPTIONS] URL...\n\n";
    std::cout << "Options:\n";
    std::cout << "  -o, --output DIR       Output directory (default: XDG download directory)\n";
    std::cout << "  -A, --user-agent UA    User-Agent header to send\n";
    std::cout << "  -t, --timeout SECONDS  Connect timeout (default: " << CONNECT_TIMEOUT_SECONDS << ")\n";
    std::cout << "  -j, --jobs N           Parallel transfers (default: 4)\n";
    std::cout << "  -k, --cookies FILE     Netscape cookie file for authentication\n";
    std::cout << "  -b, --cookie STRING    Cookies (\"k=v; k2=v2\") sent to every URL's host\n";
    std::cout << "  -v, --verbose          Log debug messages\n";
    std::cout << "  -q, --quiet            Only log errors, no progress line\n";
    std::cout << "  -h, --help             Show this help message\n";
    std::cout << "\nInterrupting pauses resumable transfers (keeping a "
              << BACKUP_SUFFIX << " copy) and cancels the rest.\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program << " https://example.com/file.iso\n";
    std::cout << "  " << program << " -o /tmp -j 2 https://example.com/a.zip https://example.com/b.zip\n";
}

// Counts and aggregate bytes over every transfer
struct Summary {
    size_t active = 0;
    size_t paused = 0;
    size_t completed = 0;
    size_t failed = 0;
    size_t cancelled = 0;
    uint64_t received = 0;
    uint64_t total = 0;
    double speed_bps = 0;
};

Summary summarize(const TransferRegistry& registry) {
    Summary summary;
    for (const auto& transfer : registry.list(registry.size())) {
        switch (transfer.status) {
            case TransferStatus::IN_PROGRESS:
                summary.active++;
                summary.speed_bps += transfer.speed_bps();
                break;
            case TransferStatus::PAUSED: summary.paused++; break;
            case TransferStatus::COMPLETED: summary.completed++; break;
            case TransferStatus::FAILED: summary.failed++; break;
            case TransferStatus::CANCELLED: summary.cancelled++; break;
        }
        summary.received += transfer.received_bytes;
        summary.total += transfer.total_bytes;
    }
    return summary;
}

int main(int argc, char** argv) {
    TransferConfig config = make_default_config();
    size_t jobs = 4;
    bool quiet = false;
    std::string cookie_file;
    std::string cookie_string;

    static struct option long_options[] = {
        {"output", required_argument, nullptr, 'o'},
        {"user-agent", required_argument, nullptr, 'A'},
        {"timeout", required_argument, nullptr, 't'},
        {"jobs", required_argument, nullptr, 'j'},
        {"cookies", required_argument, nullptr, 'k'},
        {"cookie", required_argument, nullptr, 'b'},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    try {
        while ((opt = getopt_long(argc, argv, "o:A:t:j:k:b:vqh", long_options, nullptr)) != -1) {
            switch (opt) {
                case 'o':
                    config.download_dir = optarg;
                    break;
                case 'A':
                    config.user_agent = optarg;
                    break;
                case 't':
                    config.connect_timeout_seconds = std::stoi(optarg);
                    if (config.connect_timeout_seconds < 1) {
                        std::cerr << "Error: Timeout must be at least 1 second\n";
                        return 1;
                    }
                    break;
                case 'j':
                    jobs = std::stoul(optarg);
                    if (jobs < 1 || jobs > 64) {
                        std::cerr << "Error: Jobs must be between 1 and 64\n";
                        return 1;
                    }
                    break;
                case 'k':
                    cookie_file = optarg;
                    break;
                case 'b':
                    cookie_string = optarg;
                    break;
                case 'v':
                    set_log_level(LogLevel::DEBUG);
                    break;
                case 'q':
                    quiet = true;
                    set_log_level(LogLevel::ERROR);
                    break;
                case 'h':
                    print_usage(argv[0]);
                    return 0;
                default:
                    print_usage(argv[0]);
                    return 1;
            }
        }
    } catch (const std::exception&) {
        std::cerr << "Error: Invalid numeric argument '" << optarg << "'\n";
        return 1;
    }

    std::vector<std::string> urls(argv + optind, argv + argc);
    if (urls.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    std::error_code ec;
    std::filesystem::create_directories(config.download_dir, ec);
    if (ec) {
        std::cerr << "Error: Cannot create " << config.download_dir << ": " << ec.message() << "\n";
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto cookies = std::make_shared<CookieJar>();
    if (!cookie_file.empty() && cookies->load_netscape_file(cookie_file) < 0) {
        std::cerr << "Error: Cannot read cookie file " << cookie_file << "\n";
        return 1;
    }
    if (!cookie_string.empty()) {
        for (const auto& url : urls) {
            cookies->add_from_cookie_string(cookie_string, url_host(url));
        }
    }

    TransferRegistry registry;
    QueueDispatcher dispatcher;
    CurlSession http(config);
    http.set_cookie_jar(cookies);
    ThreadPool pool(jobs);
    RangeBackend backend(registry, dispatcher, http, pool, config);

    for (const auto& url : urls) {
        std::string destination = unique_destination(config.download_dir, filename_from_url(url),
                                                     config.max_name_attempts);
        // Reserve the name so a later URL with the same file name gets its own
        std::ofstream(destination, std::ios::binary);
        TransferId id = registry.add(url, file_name_of(destination), destination);
        if (!quiet) {
            std::cout << "[" << id << "] " << url << " -> " << destination << "\n";
        }
        backend.start(id);
    }

    auto last_print = std::chrono::steady_clock::now();

    while (registry.has_active() && !g_interrupted) {
        dispatcher.run_for(std::chrono::milliseconds(100));

        auto now = std::chrono::steady_clock::now();
        if (!quiet && now - last_print >= std::chrono::seconds(1)) {
            Summary summary = summarize(registry);
            double progress = summary.total > 0 ? 100.0 * summary.received / summary.total : 0;

            std::cout << "\r[Stats] "
                      << "Progress: " << std::fixed << std::setprecision(1) << progress << "% | "
                      << "Active: " << summary.active << " | "
                      << "Completed: " << summary.completed << " | "
                      << "Failed: " << summary.failed << " | "
                      << "Received: " << format_bytes(summary.received) << " | "
                      << "Speed: " << format_speed(summary.speed_bps)
                      << "          " << std::flush;
            last_print = now;
        }
    }

    if (g_interrupted) {
        std::cout << "\n[!] Interrupt received, stopping transfers...\n";
        for (const auto& transfer : registry.list(registry.size())) {
            if (!transfer.is_active()) continue;
            if (transfer.supports_resume) {
                registry.pause(transfer.id);
            } else {
                registry.cancel(transfer.id);
            }
        }
    }

    // Let workers observe their cancel tokens, then apply what they posted
    pool.shutdown();
    dispatcher.run_pending();

    Summary summary = summarize(registry);
    if (!quiet) {
        std::cout << "\n\n=== Final Statistics ===\n";
        for (const auto& transfer : registry.list(registry.size())) {
            std::cout << "[" << transfer.id << "] " << transfer.filename << ": "
                      << transfer.status_text() << "\n";
        }
        std::cout << "Completed: " << summary.completed << "\n";
        std::cout << "Failed: " << summary.failed << "\n";
        std::cout << "Paused: " << summary.paused << "\n";
        std::cout << "Cancelled: " << summary.cancelled << "\n";
        std::cout << "Total downloaded: " << format_bytes(summary.received) << "\n";
    }

    if (g_interrupted) return 130;
    return summary.failed > 0 ? 1 : 0;
}
