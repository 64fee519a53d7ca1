#pragma once

#include <cstddef>
#include <ostream>

#include <eval/value.hpp>

/// host `console` object whose `log` writes one line per call to `out`
auto make_console(std::ostream& out, std::size_t display_limit = default_display_limit) -> value;
