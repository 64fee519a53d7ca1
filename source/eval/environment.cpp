#include <map>
#include <optional>
#include <string>
#include <utility>

#include "environment.hpp"

#include <doctest/doctest.h>
#include <fmt/core.h>

#include "error.hpp"

environment::environment(environment* parent_env)
    : parent(parent_env)
{
}

auto environment::get(const std::string& name) const -> value
{
    if (auto val = find(name); val.has_value()) {
        return std::move(val).value();
    }
    throw_error<reference_error>("{} is not defined", name);
}

auto environment::find(const std::string& name) const -> std::optional<value>
{
    for (const auto* ptr = this; ptr != nullptr; ptr = ptr->parent) {
        if (const auto itr = ptr->store.find(name); itr != ptr->store.end()) {
            return itr->second;
        }
    }
    return std::nullopt;
}

auto environment::set(const std::string& name, value val) -> void
{
    if (const auto itr = store.find(name); itr == store.end() && parent != nullptr) {
        parent->set(name, std::move(val));
        return;
    }
    store[name] = std::move(val);
}

auto environment::declare(const std::string& name, value val) -> void
{
    store[name] = std::move(val);
}

auto environment::has_own(const std::string& name) const -> bool
{
    return store.contains(name);
}

auto environment::this_value() const -> value
{
    return get("this");
}

auto environment::debug() const -> void
{
    const std::map<std::string, value> sorted {store.cbegin(), store.cend()};
    for (const auto& [k, v] : sorted) {
        fmt::print("[{}] = {}\n", k, v.inspect());
    }
}

namespace
{
// NOLINTBEGIN(*)
TEST_SUITE_BEGIN("environment");

TEST_CASE("getWalksTheChain")
{
    environment globals;
    globals.declare("x", 1);
    environment locals {&globals};
    locals.declare("y", 2);
    CHECK_EQ(locals.get("x"), value {1});
    CHECK_EQ(locals.get("y"), value {2});
    CHECK_FALSE(globals.find("y").has_value());
}

TEST_CASE("getUnknownName")
{
    environment globals;
    CHECK_THROWS_AS((void)globals.get("nope"), reference_error);
    CHECK_THROWS_WITH((void)globals.get("nope"), "ReferenceError: nope is not defined");
}

TEST_CASE("setOverwritesNearestBinding")
{
    environment globals;
    globals.declare("x", 1);
    environment middle {&globals};
    middle.declare("x", 2);
    environment inner {&middle};

    inner.set("x", 3);
    CHECK_EQ(middle.get("x"), value {3});
    CHECK_EQ(globals.get("x"), value {1});
    CHECK_FALSE(inner.has_own("x"));
}

TEST_CASE("setUndeclaredCreatesGlobal")
{
    environment globals;
    environment inner {&globals};
    inner.set("fresh", "value");
    CHECK(globals.has_own("fresh"));
    CHECK_FALSE(inner.has_own("fresh"));
}

TEST_CASE("declareShadows")
{
    environment globals;
    globals.declare("x", 1);
    environment inner {&globals};
    inner.declare("x", 2);
    inner.set("x", 5);
    CHECK_EQ(inner.get("x"), value {5});
    CHECK_EQ(globals.get("x"), value {1});
}

TEST_CASE("thisBinding")
{
    environment globals;
    globals.declare("this", null_type {});
    environment inner {&globals};
    CHECK(inner.this_value().is_null());
}

TEST_SUITE_END();
// NOLINTEND(*)
}  // namespace
