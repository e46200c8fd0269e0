/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <filesystem>
#include <memory>
#include <string>

//-------------------------------------------------------------------------

namespace prioq::logging
{

//-------------------------------------------------------------------------

struct LoggerBaseDesc
{
    std::string name;
    std::filesystem::path filepath;
    std::string header;
    bool truncate{};
};

//-------------------------------------------------------------------------

/**
 * Plain-text file logger writing each record verbatim on its own line.
 *
 * The header is written only when the file is created, so appending runs share it.
 */
class LoggerBase
{
public:
    explicit LoggerBase(const LoggerBaseDesc& desc);

    [[nodiscard]] const std::filesystem::path& filepath() const noexcept { return m_filepath; }

    void flush() { m_logger->flush(); }

protected:
    std::unique_ptr<spdlog::logger> m_logger;
    std::filesystem::path m_filepath;
};

//-------------------------------------------------------------------------

}  // namespace prioq::logging

//-------------------------------------------------------------------------
