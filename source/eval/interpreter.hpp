#pragma once

#include <string>
#include <utility>
#include <vector>

#include <ast/program.hpp>

#include "completion.hpp"
#include "environment.hpp"
#include "value.hpp"

using host_bindings = std::vector<std::pair<std::string, value>>;

/// root scope with `this` and `undefined` bound to undefined plus the given host values
auto make_global_environment(const host_bindings& bindings = {}) -> environment*;

struct execution_result final
{
    completion result;
    environment* globals {};
};

/// hoists the program's `var` names into `globals` and runs it there, keeps bindings already present
auto execute_program(const program* prgrm, environment* globals) -> execution_result;
