#pragma once

#include <optional>
#include <string>
#include <unordered_map>

#include "value.hpp"

struct environment final
{
    explicit environment(environment* parent_env = nullptr);

    /// nearest binding in the chain, throws reference_error when there is none
    [[nodiscard]] auto get(const std::string& name) const -> value;
    [[nodiscard]] auto find(const std::string& name) const -> std::optional<value>;

    /// overwrites the nearest binding or creates one in the root scope
    auto set(const std::string& name, value val) -> void;
    auto declare(const std::string& name, value val) -> void;
    [[nodiscard]] auto has_own(const std::string& name) const -> bool;
    [[nodiscard]] auto this_value() const -> value;

    void debug() const;

    std::unordered_map<std::string, value> store;
    environment* parent {};
};
