/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <prioq/dsa/PriorityQueue.hpp>
#include <prioq/script/Script.hpp>
#include <prioq/script/StepResult.hpp>
#include <prioq/script/TraceLogger.hpp>

#include <vector>

//-------------------------------------------------------------------------

namespace prioq::script
{

//-------------------------------------------------------------------------

struct ScriptRunnerDesc
{
    Script script;
    TraceLogger* traceLogger{};
    bool validate{};
};

//-------------------------------------------------------------------------

/**
 * Applies the operations of a script, in order, to a queue preloaded with the script items.
 *
 * Validation is on if either the script or the descriptor asks for it; a heap property
 * violation after any step raises ScriptError.
 */
class ScriptRunner
{
public:
    using QueueType = dsa::PriorityQueue<int64_t>;

    explicit ScriptRunner(ScriptRunnerDesc desc);

    [[nodiscard]] std::vector<StepResult> run();

    [[nodiscard]] const QueueType& queue() const noexcept { return m_queue; }
    [[nodiscard]] const Script& script() const noexcept { return m_script; }
    [[nodiscard]] bool validating() const noexcept { return m_validate; }

    [[nodiscard]] static QueueType makeQueue(const Script& script);

private:
    void execute(size_t step, const Operation& op, std::vector<StepResult>& results);
    void record(
        size_t step,
        const Operation& op,
        std::optional<int64_t> result,
        std::vector<StepResult>& results);

    Script m_script;
    TraceLogger* m_traceLogger;
    bool m_validate;
    QueueType m_queue;
};

//-------------------------------------------------------------------------

}  // namespace prioq::script

//-------------------------------------------------------------------------
