/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <prioq/dsa/PriorityQueue.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

//-------------------------------------------------------------------------

// Renders the backing array in storage order, not in pop order.
template<typename T, typename Container>
requires fmt::is_formattable<T>::value
struct fmt::formatter<prioq::dsa::PriorityQueue<T, Container>>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const prioq::dsa::PriorityQueue<T, Container>& pq, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "[{}]", fmt::join(pq.underlying(), ", "));
    }
};

//-------------------------------------------------------------------------
