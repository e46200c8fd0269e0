/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <prioq/script/Script.hpp>

#include <boost/algorithm/string.hpp>
#include <fmt/ranges.h>

#include <charconv>
#include <limits>
#include <source_location>
#include <stdexcept>
#include <string_view>
#include <unordered_map>

//-------------------------------------------------------------------------

namespace fs = std::filesystem;

//-------------------------------------------------------------------------

namespace prioq::script
{

//-------------------------------------------------------------------------

namespace
{

template<typename T>
[[nodiscard]] std::optional<T> parseInteger(std::string_view str)
{
    T val{};
    const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), val);
    if (ec != std::errc{} || ptr != str.data() + str.size()) {
        return {};
    }
    return val;
}

template<typename T>
[[nodiscard]] T requireIntegerAttribute(
    pugi::xml_node node,
    const char* name,
    std::source_location sl = std::source_location::current())
{
    const pugi::xml_attribute attr = node.attribute(name);
    if (attr.empty()) {
        throw std::invalid_argument{fmt::format(
            "{}: '{}' is missing required attribute '{}'", sl.function_name(), node.name(), name)};
    }
    const auto val = parseInteger<T>(boost::algorithm::trim_copy(std::string{attr.as_string()}));
    if (!val) {
        throw std::invalid_argument{fmt::format(
            "{}: attribute '{}' of '{}' must be an integer in [{}, {}], was '{}'",
            sl.function_name(),
            name,
            node.name(),
            std::numeric_limits<T>::min(),
            std::numeric_limits<T>::max(),
            attr.as_string())};
    }
    return *val;
}

[[nodiscard]] std::vector<int64_t> parseItems(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    std::vector<std::string> tokens;
    boost::algorithm::split(
        tokens,
        boost::algorithm::trim_copy(std::string{node.text().as_string()}),
        boost::algorithm::is_any_of(" \t\r\n,"),
        boost::algorithm::token_compress_on);

    std::vector<int64_t> items;
    for (const auto& token : tokens) {
        if (token.empty()) continue;
        const auto item = parseInteger<int64_t>(token);
        if (!item) {
            throw std::invalid_argument{fmt::format(
                "{}: 'Items' contains a non-integer token '{}'", ctx, token)};
        }
        items.push_back(*item);
    }
    return items;
}

}  // namespace

//-------------------------------------------------------------------------

Operation Operation::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    static const std::unordered_map<std::string_view, OpType> s_opTypes{
        {"Push", OpType::PUSH},
        {"Pop", OpType::POP},
        {"First", OpType::FIRST},
        {"RemoveAt", OpType::REMOVE_AT},
        {"ReplaceAt", OpType::REPLACE_AT},
        {"ReplaceFirst", OpType::REPLACE_FIRST},
        {"Contains", OpType::CONTAINS},
        {"Size", OpType::SIZE},
        {"Clear", OpType::CLEAR},
        {"Drain", OpType::DRAIN}
    };

    const auto it = s_opTypes.find(node.name());
    if (it == s_opTypes.end()) {
        throw std::invalid_argument{fmt::format(
            "{}: unrecognized operation '{}'", ctx, node.name())};
    }

    Operation op{.type = it->second};

    switch (op.type) {
        case OpType::PUSH:
        case OpType::REPLACE_FIRST:
        case OpType::CONTAINS:
            op.value = requireIntegerAttribute<int64_t>(node, "value");
            break;
        case OpType::REMOVE_AT:
            op.index = requireIntegerAttribute<size_t>(node, "index");
            break;
        case OpType::REPLACE_AT:
            op.index = requireIntegerAttribute<size_t>(node, "index");
            op.value = requireIntegerAttribute<int64_t>(node, "value");
            break;
        default:
            break;
    }

    return op;
}

//-------------------------------------------------------------------------

Script Script::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (std::string_view{node.name()} != "Script") {
        throw std::invalid_argument{fmt::format(
            "{}: expected root element 'Script', got '{}'", ctx, node.name())};
    }

    Script script;

    script.name = node.attribute("name").as_string("script");

    if (auto attr = node.attribute("ordering")) {
        const auto ordering = magic_enum::enum_cast<Ordering>(
            std::string_view{attr.as_string()}, magic_enum::case_insensitive);
        if (!ordering) {
            throw std::invalid_argument{fmt::format(
                "{}: 'ordering' must be one of [{}], was '{}'",
                ctx,
                fmt::join(magic_enum::enum_names<Ordering>(), ", "),
                attr.as_string())};
        }
        script.ordering = *ordering;
    }

    script.validate = node.attribute("validate").as_bool();

    bool itemsSeen = false;
    for (pugi::xml_node child : node.children()) {
        if (child.type() != pugi::node_element) continue;
        if (std::string_view{child.name()} == "Items") {
            if (itemsSeen) {
                throw std::invalid_argument{fmt::format(
                    "{}: 'Items' may appear at most once", ctx)};
            }
            itemsSeen = true;
            script.items = parseItems(child);
            continue;
        }
        script.operations.push_back(Operation::fromXML(child));
    }

    return script;
}

//-------------------------------------------------------------------------

Script loadScript(const fs::path& path)
{
    pugi::xml_document doc;
    pugi::xml_parse_result res = doc.load_file(path.c_str());
    if (!res) {
        throw ScriptError{fmt::format(
            "Failed to load '{}': {} (offset {})", path.c_str(), res.description(), res.offset)};
    }
    return Script::fromXML(doc.document_element());
}

//-------------------------------------------------------------------------

}  // namespace prioq::script

//-------------------------------------------------------------------------
