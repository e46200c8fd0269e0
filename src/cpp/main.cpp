/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <prioq/dsa/formatting/PriorityQueue.hpp>
#include <prioq/script/Script.hpp>
#include <prioq/script/ScriptRunner.hpp>
#include <prioq/script/TraceLogger.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>

#include <exception>
#include <filesystem>
#include <memory>
#include <utility>

//-------------------------------------------------------------------------

namespace fs = std::filesystem;

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    CLI::App app{"prioq-run: apply an operation script to a binary heap priority queue"};

    fs::path scriptPath;
    app.add_option("-f,--script-file", scriptPath, "Operation script (XML)")
        ->required()
        ->check(CLI::ExistingFile)
        ->transform([](auto&& p) { return fs::absolute(p); });

    fs::path tracePath;
    app.add_option("-t,--trace-file", tracePath, "CSV file receiving one line per executed step")
        ->transform([](auto&& p) { return fs::absolute(p); });

    std::string logLevel{"info"};
    app.add_option("--log-level", logLevel, "Console log level")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}))
        ->default_val("info");

    bool validate{};
    app.add_flag("--validate", validate, "Check the heap property after every step");

    CLI11_PARSE(app, argc, argv);

    spdlog::set_level(spdlog::level::from_str(logLevel));

    try {
        auto script = prioq::script::loadScript(scriptPath);
        spdlog::info("Loaded script '{}' from {}", script.name, scriptPath.c_str());

        std::unique_ptr<prioq::script::TraceLogger> traceLogger;
        if (!tracePath.empty()) {
            traceLogger = std::make_unique<prioq::script::TraceLogger>(tracePath);
            spdlog::info("Tracing steps to {}", tracePath.c_str());
        }

        prioq::script::ScriptRunner runner{{
            .script = std::move(script),
            .traceLogger = traceLogger.get(),
            .validate = validate
        }};

        for (const auto& res : runner.run()) {
            fmt::print(
                "{} {} -> {} [size={}]\n",
                res.step,
                res.op,
                res.result ? fmt::format("{}", *res.result) : "none",
                res.size);
        }

        fmt::print("final: {}\n", runner.queue());
    }
    catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    return 0;
}

//-------------------------------------------------------------------------
