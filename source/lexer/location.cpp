#include <ostream>
#include <sstream>

#include "location.hpp"

#include <doctest/doctest.h>

auto operator<<(std::ostream& os, const location& l) -> std::ostream&
{
    return os << l.filename << ':' << l.line << ':' << l.column;
}

namespace
{
// NOLINTBEGIN(*)
TEST_CASE("locationPrintsFileLineColumn")
{
    const location loc {.filename = "fib.js", .line = 3, .column = 14};
    std::ostringstream out;
    out << loc;
    CHECK_EQ(out.str(), "fib.js:3:14");
    CHECK_EQ(fmt::format("{}", loc), "fib.js:3:14");
}
// NOLINTEND(*)
}  // namespace
