#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <sstream>
#include <chrono>
#include <thread>
#include <cstdlib>
#include <stdexcept>
#include "otpgen/base32.h"
#include "otpgen/code_refresher.h"
#include "otpgen/totp_engine.h"

using otpgen::core::Base32;
using otpgen::core::CodeRefresher;
using otpgen::core::TotpEngine;

namespace {

struct CliOptions {
    bool watch = false;
    uint32_t period = TotpEngine::DEFAULT_WINDOW;
    std::vector<std::string> entries;
};

uint32_t ParsePeriod(const std::string& value) {
    unsigned long period = std::stoul(value);
    if (period == 0 || period > 86400) {
        throw std::invalid_argument("Period out of range: " + value);
    }
    return static_cast<uint32_t>(period);
}

std::vector<std::string> SplitList(const std::string& list) {
    std::vector<std::string> items;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void PrintUsage() {
    std::cerr << "usage: otpgen_cli [--watch] [--period N] [label=SECRET | SECRET]...\n"
              << "       otpgen_cli --validate SECRET" << std::endl;
}

void PrintCodes(CodeRefresher& refresher) {
    for (const auto& entry : refresher.Refresh()) {
        std::cout << std::left << std::setw(20) << entry.label << std::right
                  << "  " << entry.result.ToDisplayString()
                  << "  (" << entry.time_remaining << "s left)" << std::endl;
    }
}

int RunCli(const CliOptions& options) {
    CodeRefresher refresher(options.period);

    size_t position = 0;
    for (const auto& entry : options.entries) {
        ++position;
        std::string label = "#" + std::to_string(position);
        std::string secret = entry;

        size_t eq = entry.find('=');
        // '=' at the end is Base32 padding, not a label separator
        if (eq != std::string::npos && eq > 0 && entry.find_first_not_of('=', eq) != std::string::npos) {
            label = entry.substr(0, eq);
            secret = entry.substr(eq + 1);
        }

        if (!refresher.Track(label, secret)) {
            std::cerr << "Skipping " << label << std::endl;
        }
    }

    if (refresher.Size() == 0) {
        std::cerr << "No valid secrets to generate codes for" << std::endl;
        return 1;
    }

    PrintCodes(refresher);
    if (!options.watch) {
        return 0;
    }

    std::cout << "Watching " << refresher.Size() << " secrets, period "
              << options.period << "s (Ctrl-C to stop)" << std::endl;

    while (true) {
        // Wake shortly after each second boundary
        auto now = std::chrono::system_clock::now();
        auto next = std::chrono::time_point_cast<std::chrono::seconds>(now) + std::chrono::seconds(1);
        std::this_thread::sleep_until(next + std::chrono::milliseconds(10));

        now = std::chrono::system_clock::now();
        if (refresher.IsNewWindow(now) || refresher.NeedsRefresh(now)) {
            std::cout << "--" << std::endl;
            PrintCodes(refresher);
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        // Load configuration from environment variables with defaults
        const char* secrets_env = std::getenv("OTPGEN_SECRETS");
        const char* period_env = std::getenv("OTPGEN_PERIOD");
        const char* watch_env = std::getenv("OTPGEN_WATCH");

        CliOptions options;
        options.watch = watch_env && std::string(watch_env) == "1";
        if (period_env) {
            options.period = ParsePeriod(period_env);
        }

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--watch") {
                options.watch = true;
            } else if (arg == "--period" && i + 1 < argc) {
                options.period = ParsePeriod(argv[++i]);
            } else if (arg == "--validate" && i + 1 < argc) {
                bool valid = Base32::IsValid(argv[++i]);
                std::cout << (valid ? "valid" : "invalid") << std::endl;
                return valid ? 0 : 1;
            } else if (arg == "--help" || arg == "-h") {
                PrintUsage();
                return 0;
            } else if (!arg.empty() && arg[0] == '-') {
                PrintUsage();
                return 1;
            } else {
                options.entries.push_back(arg);
            }
        }

        if (options.entries.empty() && secrets_env) {
            options.entries = SplitList(secrets_env);
        }

        if (options.entries.empty()) {
            PrintUsage();
            return 1;
        }

        return RunCli(options);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
