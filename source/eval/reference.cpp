#include <cmath>
#include <cstddef>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "reference.hpp"

#include <doctest/doctest.h>
#include <gc.hpp>
#include <overloaded.hpp>

#include "error.hpp"

namespace
{
auto read_array(const array_value& arr, const std::string& key) -> value
{
    if (key == "length") {
        return static_cast<double>(arr.length());
    }
    if (const auto index = array_index(key); index.has_value()) {
        return arr.at(index.value());
    }
    return arr.properties.get(key).value_or(value {});
}

auto read_string(const std::string& str, const std::string& key) -> value
{
    if (key == "length") {
        return static_cast<double>(str.size());
    }
    if (const auto index = array_index(key); index.has_value() && index.value() < str.size()) {
        return str.substr(index.value(), 1);
    }
    return {};
}

auto write_array(array_value& arr, const std::string& key, value val) -> void
{
    if (key == "length") {
        const auto new_length = val.to_number();
        if (!std::isfinite(new_length) || new_length < 0 || new_length != std::trunc(new_length)
            || new_length > static_cast<double>(max_array_index) + 1)
        {
            throw_error<type_error>("invalid array length {}", val.inspect());
        }
        arr.truncate(static_cast<std::size_t>(new_length));
        return;
    }
    if (const auto index = array_index(key); index.has_value()) {
        arr.elements.insert_or_assign(index.value(), std::move(val));
        return;
    }
    arr.properties.set(key, std::move(val));
}
}  // namespace

auto get_property(const value& base, const std::string& key) -> value
{
    return std::visit(overloaded {[&](const undefined_type /*undefined*/) -> value
                                  { throw_error<type_error>("cannot read property '{}' of undefined", key); },
                                  [&](const null_type /*null*/) -> value
                                  { throw_error<type_error>("cannot read property '{}' of null", key); },
                                  [&](object_value* obj) { return obj->properties.get(key).value_or(value {}); },
                                  [&](array_value* arr) { return read_array(*arr, key); },
                                  [&](const std::string& str) { return read_string(str, key); },
                                  [](const auto& /*other*/) { return value {}; }},
                      base.data);
}

auto put_property(const value& base, const std::string& key, value val) -> void
{
    if (base.is<object_value*>()) {
        base.as<object_value*>()->properties.set(key, std::move(val));
        return;
    }
    if (base.is<array_value*>()) {
        write_array(*base.as<array_value*>(), key, std::move(val));
        return;
    }
    throw_error<type_error>("cannot set property '{}' of {}", key, base.type_name());
}

auto get_value(const reference& ref) -> value
{
    return std::visit(overloaded {[&](const unresolvable /*base*/) -> value
                                  { throw_error<reference_error>("{} is not defined", ref.name); },
                                  [&](const environment* env) { return env->get(ref.name); },
                                  [&](const value& base) { return get_property(base, ref.name); }},
                      ref.base);
}

auto put_value(const reference& ref, value val) -> void
{
    std::visit(overloaded {[&](const unresolvable /*base*/)
                           { throw_error<reference_error>("{} is not defined", ref.name); },
                           [&](environment* env) { env->set(ref.name, std::move(val)); },
                           [&](const value& base) { put_property(base, ref.name, std::move(val)); }},
               ref.base);
}

namespace
{
// NOLINTBEGIN(*)
TEST_SUITE_BEGIN("reference");

TEST_CASE("environmentReference")
{
    environment globals;
    globals.declare("x", 1);
    const reference ref {.name = "x", .base = &globals};
    CHECK_EQ(get_value(ref), value {1});
    put_value(ref, 5);
    CHECK_EQ(globals.get("x"), value {5});
}

TEST_CASE("unresolvableReference")
{
    const reference ref {.name = "ghost", .base = unresolvable {}};
    CHECK_THROWS_WITH((void)get_value(ref), "ReferenceError: ghost is not defined");
    CHECK_THROWS_AS(put_value(ref, 1), reference_error);
}

TEST_CASE("objectProperties")
{
    auto* obj = make<object_value>();
    const value base {obj};
    CHECK(get_property(base, "missing").is_undefined());
    put_property(base, "key", "val");
    CHECK_EQ(get_property(base, "key"), value {"val"});
    CHECK_EQ(obj->properties.size(), 1U);
}

TEST_CASE("arrayProperties")
{
    auto* arr = make<array_value>(std::vector<value> {1, 2});
    const value base {arr};
    CHECK_EQ(get_property(base, "length"), value {2});
    CHECK_EQ(get_property(base, "1"), value {2});
    CHECK(get_property(base, "7").is_undefined());

    put_property(base, "5", "sparse");
    CHECK_EQ(get_property(base, "length"), value {6});
    CHECK(get_property(base, "3").is_undefined());

    put_property(base, "name", "arr");
    CHECK_EQ(get_property(base, "name"), value {"arr"});
    CHECK_EQ(get_property(base, "length"), value {6});

    put_property(base, "length", 1);
    CHECK_EQ(get_property(base, "length"), value {1});
    CHECK_EQ(arr->elements.size(), 1U);
    CHECK_THROWS_AS(put_property(base, "length", -1), type_error);
    CHECK_THROWS_AS(put_property(base, "length", 1.5), type_error);
    CHECK_THROWS_WITH(put_property(base, "length", 1e300), "TypeError: invalid array length 1e+300");
    CHECK_THROWS_AS(put_property(base, "length", 4294967296.0), type_error);
    put_property(base, "length", 4294967295.0);
    CHECK_EQ(get_property(base, "length"), value {1});
}

TEST_CASE("stringProperties")
{
    const value base {"abc"};
    CHECK_EQ(get_property(base, "length"), value {3});
    CHECK_EQ(get_property(base, "1"), value {"b"});
    CHECK(get_property(base, "3").is_undefined());
    CHECK(get_property(base, "foo").is_undefined());
    CHECK_THROWS_WITH(put_property(base, "0", "x"), "TypeError: cannot set property '0' of string");
}

TEST_CASE("primitiveBases")
{
    CHECK(get_property(value {1}, "foo").is_undefined());
    CHECK(get_property(value {true}, "foo").is_undefined());
    CHECK_THROWS_WITH((void)get_property(value {}, "foo"), "TypeError: cannot read property 'foo' of undefined");
    CHECK_THROWS_WITH((void)get_property(value {null_type {}}, "foo"),
                      "TypeError: cannot read property 'foo' of null");
    CHECK_THROWS_AS(put_property(value {}, "foo", 1), type_error);
    CHECK_THROWS_AS(put_property(value {1}, "foo", 1), type_error);
}

TEST_SUITE_END();
// NOLINTEND(*)
}  // namespace
