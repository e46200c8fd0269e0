/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <prioq/dsa/PriorityQueue.hpp>

#include <vector>

//-------------------------------------------------------------------------

namespace prioq_tests::dsa
{

template<typename T, typename Container>
[[nodiscard]] std::vector<T> drainToVector(prioq::dsa::PriorityQueue<T, Container>& queue)
{
    std::vector<T> res;
    res.reserve(queue.size());
    queue.drain([&](T item) { res.push_back(std::move(item)); });
    return res;
}

}  // namespace prioq_tests::dsa

//-------------------------------------------------------------------------
