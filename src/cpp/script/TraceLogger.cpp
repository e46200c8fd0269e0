/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <prioq/script/TraceLogger.hpp>

#include <fmt/format.h>

//-------------------------------------------------------------------------

namespace prioq::script
{

//-------------------------------------------------------------------------

TraceLogger::TraceLogger(const std::filesystem::path& filepath, bool truncate)
    : LoggerBase{{
        .name = "TraceLogger",
        .filepath = filepath,
        .header = s_header,
        .truncate = truncate
    }}
{}

//-------------------------------------------------------------------------

void TraceLogger::log(const StepResult& res)
{
    // Two-argument operations are written as "index:value" to keep one CSV column.
    const auto arg = [&] -> std::string {
        const auto& op = res.op;
        if (op.index && op.value) return fmt::format("{}:{}", *op.index, *op.value);
        if (op.index) return fmt::format("{}", *op.index);
        if (op.value) return fmt::format("{}", *op.value);
        return {};
    }();

    m_logger->trace(
        "{},{},{},{},{}",
        res.step,
        magic_enum::enum_name(res.op.type),
        arg,
        res.result ? fmt::format("{}", *res.result) : std::string{},
        res.size);
    m_logger->flush();
}

//-------------------------------------------------------------------------

}  // namespace prioq::script

//-------------------------------------------------------------------------
