/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <prioq/logging/LoggerBase.hpp>

//-------------------------------------------------------------------------

namespace fs = std::filesystem;

//-------------------------------------------------------------------------

namespace prioq::logging
{

//-------------------------------------------------------------------------

LoggerBase::LoggerBase(const LoggerBaseDesc& desc)
    : m_filepath{desc.filepath}
{
    const bool writeHeader = desc.truncate || !fs::exists(m_filepath);

    m_logger = std::make_unique<spdlog::logger>(
        desc.name,
        std::make_shared<spdlog::sinks::basic_file_sink_st>(m_filepath.string(), desc.truncate));
    m_logger->set_level(spdlog::level::trace);
    m_logger->set_pattern("%v");

    if (!writeHeader || desc.header.empty()) return;

    m_logger->trace(desc.header);
    m_logger->flush();
}

//-------------------------------------------------------------------------

}  // namespace prioq::logging

//-------------------------------------------------------------------------
