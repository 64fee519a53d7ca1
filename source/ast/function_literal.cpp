#include <string>

#include "function_literal.hpp"

#include <fmt/format.h>

#include "statements.hpp"
#include "util.hpp"
#include "visitor.hpp"

auto function_literal::string() const -> std::string
{
    return fmt::format("function({}) {}", join(parameters, ", "), body->string());
}

void function_literal::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto function_literal::equals_to(const expression* other) const -> bool
{
    const auto* rhs = dynamic_cast<const function_literal*>(other);
    return rhs != nullptr && ast_equal(parameters, rhs->parameters) && ast_equal(body, rhs->body);
}
