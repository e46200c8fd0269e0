/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <prioq/script/ScriptError.hpp>

#include <fmt/format.h>
#include <magic_enum/magic_enum.hpp>
#include <pugixml.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

//-------------------------------------------------------------------------

namespace prioq::script
{

//-------------------------------------------------------------------------

enum class Ordering : uint32_t
{
    MIN,
    MAX
};

enum class OpType : uint32_t
{
    PUSH,
    POP,
    FIRST,
    REMOVE_AT,
    REPLACE_AT,
    REPLACE_FIRST,
    CONTAINS,
    SIZE,
    CLEAR,
    DRAIN
};

//-------------------------------------------------------------------------

struct Operation
{
    OpType type;
    std::optional<int64_t> value{};
    std::optional<size_t> index{};

    [[nodiscard]] bool operator==(const Operation&) const noexcept = default;

    [[nodiscard]] static Operation fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

struct Script
{
    std::string name{"script"};
    Ordering ordering{Ordering::MIN};
    bool validate{};
    std::vector<int64_t> items;
    std::vector<Operation> operations;

    [[nodiscard]] static Script fromXML(pugi::xml_node node);
};

[[nodiscard]] Script loadScript(const std::filesystem::path& path);

//-------------------------------------------------------------------------

}  // namespace prioq::script

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<prioq::script::Operation>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const prioq::script::Operation& op, FormatContext& ctx) const
    {
        const auto name = magic_enum::enum_name(op.type);
        if (op.index && op.value) {
            return fmt::format_to(ctx.out(), "{}({}, {})", name, *op.index, *op.value);
        } else if (op.index) {
            return fmt::format_to(ctx.out(), "{}({})", name, *op.index);
        } else if (op.value) {
            return fmt::format_to(ctx.out(), "{}({})", name, *op.value);
        }
        return fmt::format_to(ctx.out(), "{}()", name);
    }
};

//-------------------------------------------------------------------------
