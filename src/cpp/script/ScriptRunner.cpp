/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <prioq/script/ScriptRunner.hpp>

#include <prioq/dsa/formatting/PriorityQueue.hpp>

#include <spdlog/spdlog.h>

#include <source_location>
#include <stdexcept>
#include <utility>

//-------------------------------------------------------------------------

namespace prioq::script
{

//-------------------------------------------------------------------------

ScriptRunner::ScriptRunner(ScriptRunnerDesc desc)
    : m_script{std::move(desc.script)},
      m_traceLogger{desc.traceLogger},
      m_validate{desc.validate || m_script.validate},
      m_queue{makeQueue(m_script)}
{}

//-------------------------------------------------------------------------

std::vector<StepResult> ScriptRunner::run()
{
    spdlog::debug(
        "Running script '{}' ({} ordering, {} items, {} operations)",
        m_script.name,
        magic_enum::enum_name(m_script.ordering),
        m_script.items.size(),
        m_script.operations.size());

    std::vector<StepResult> results;
    results.reserve(m_script.operations.size());

    for (size_t step = 0; step < m_script.operations.size(); ++step) {
        const auto& op = m_script.operations[step];
        execute(step, op, results);
        if (m_validate && !m_queue.satisfiesHeapProperty()) {
            throw ScriptError{fmt::format(
                "Heap property violated after step {} {}: {}", step, op, m_queue)};
        }
    }

    return results;
}

//-------------------------------------------------------------------------

ScriptRunner::QueueType ScriptRunner::makeQueue(const Script& script)
{
    switch (script.ordering) {
        case Ordering::MIN:
            return QueueType::minOrdering(script.items);
        case Ordering::MAX:
            return QueueType::maxOrdering(script.items);
    }
    throw std::invalid_argument{fmt::format(
        "{}: unrecognized ordering {}",
        std::source_location::current().function_name(),
        std::to_underlying(script.ordering))};
}

//-------------------------------------------------------------------------

void ScriptRunner::execute(size_t step, const Operation& op, std::vector<StepResult>& results)
{
    switch (op.type) {
        case OpType::PUSH:
            m_queue.push(op.value.value());
            record(step, op, {}, results);
            break;
        case OpType::POP:
            record(step, op, m_queue.pop(), results);
            break;
        case OpType::FIRST:
            record(step, op, m_queue.first(), results);
            break;
        case OpType::REMOVE_AT:
            record(step, op, m_queue.removeAt(op.index.value()), results);
            break;
        case OpType::REPLACE_AT:
            record(step, op, m_queue.replaceAt(op.index.value(), op.value.value()), results);
            break;
        case OpType::REPLACE_FIRST:
            record(step, op, m_queue.replaceFirst(op.value.value()), results);
            break;
        case OpType::CONTAINS:
            record(step, op, m_queue.contains(op.value.value()) ? 1 : 0, results);
            break;
        case OpType::SIZE:
            record(step, op, static_cast<int64_t>(m_queue.size()), results);
            break;
        case OpType::CLEAR:
            m_queue.clear();
            record(step, op, {}, results);
            break;
        case OpType::DRAIN:
            m_queue.drain([&](int64_t item) { record(step, op, item, results); });
            break;
    }
}

//-------------------------------------------------------------------------

void ScriptRunner::record(
    size_t step,
    const Operation& op,
    std::optional<int64_t> result,
    std::vector<StepResult>& results)
{
    const auto& res = results.emplace_back(StepResult{
        .step = step,
        .op = op,
        .result = result,
        .size = m_queue.size()
    });

    spdlog::trace(
        "{} #{} {} -> {} [size={}]",
        m_script.name,
        step,
        op,
        res.result ? fmt::format("{}", *res.result) : "none",
        res.size);

    if (m_traceLogger != nullptr) {
        m_traceLogger->log(res);
    }
}

//-------------------------------------------------------------------------

}  // namespace prioq::script

//-------------------------------------------------------------------------
