/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <prioq/script/Script.hpp>

#include <cstdint>
#include <optional>

//-------------------------------------------------------------------------

namespace prioq::script
{

struct StepResult
{
    size_t step;
    Operation op;
    std::optional<int64_t> result;
    size_t size;
};

}  // namespace prioq::script

//-------------------------------------------------------------------------
