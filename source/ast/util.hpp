#pragma once

#include <algorithm>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "expression.hpp"

template<typename Expression>
auto join(const std::vector<Expression*>& nodes, std::string_view sep = {}) -> std::string
{
    auto strs = std::vector<std::string>();
    std::transform(
        nodes.cbegin(), nodes.cend(), std::back_inserter(strs), [](const auto& node) { return node->string(); });
    return fmt::format("{}", fmt::join(strs.cbegin(), strs.cend(), sep));
}

auto number_to_string(double number) -> std::string;

auto quote_string(std::string_view str) -> std::string;

inline auto ast_equal(const expression* lhs, const expression* rhs) -> bool
{
    if (lhs == nullptr || rhs == nullptr) {
        return lhs == rhs;
    }
    return lhs->equals_to(rhs);
}

template<typename Expression>
auto ast_equal(const std::vector<Expression*>& lhs, const std::vector<Expression*>& rhs) -> bool
{
    return std::equal(lhs.cbegin(),
                      lhs.cend(),
                      rhs.cbegin(),
                      rhs.cend(),
                      [](const expression* left, const expression* right) { return ast_equal(left, right); });
}
