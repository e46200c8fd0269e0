/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <prioq/logging/LoggerBase.hpp>
#include <prioq/script/StepResult.hpp>

#include <filesystem>

//-------------------------------------------------------------------------

namespace prioq::script
{

//-------------------------------------------------------------------------

class TraceLogger : public logging::LoggerBase
{
public:
    explicit TraceLogger(const std::filesystem::path& filepath, bool truncate = false);

    void log(const StepResult& res);

    static constexpr const char* s_header = "step,op,arg,result,size";
};

//-------------------------------------------------------------------------

}  // namespace prioq::script

//-------------------------------------------------------------------------
