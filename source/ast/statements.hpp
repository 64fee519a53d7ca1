#pragma once

#include <set>
#include <string>
#include <vector>

#include "expression.hpp"
#include "identifier.hpp"

using statement = expression;

struct block_statement : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string override;
    void accept(struct visitor& visitor) const final;
    [[nodiscard]] auto declared_vars() const -> std::set<std::string> final;
    [[nodiscard]] auto equals_to(const expression* other) const -> bool final;

    expressions statements;
};

struct var_declaration final : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;
    [[nodiscard]] auto declared_vars() const -> std::set<std::string> final;
    [[nodiscard]] auto equals_to(const expression* other) const -> bool final;

    const identifier* name {};
    const expression* value {};
};

struct var_statement final : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;
    [[nodiscard]] auto declared_vars() const -> std::set<std::string> final;
    [[nodiscard]] auto equals_to(const expression* other) const -> bool final;

    std::vector<const var_declaration*> declarations;
};

struct empty_statement final : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;
    [[nodiscard]] auto equals_to(const expression* other) const -> bool final;
};

struct expression_statement final : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;
    [[nodiscard]] auto equals_to(const expression* other) const -> bool final;

    const expression* expr {};
};

struct if_statement final : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;
    [[nodiscard]] auto declared_vars() const -> std::set<std::string> final;
    [[nodiscard]] auto equals_to(const expression* other) const -> bool final;

    const expression* condition {};
    const statement* consequence {};
    const statement* alternative {};
};

struct while_statement final : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;
    [[nodiscard]] auto declared_vars() const -> std::set<std::string> final;
    [[nodiscard]] auto equals_to(const expression* other) const -> bool final;

    const expression* condition {};
    const statement* body {};
};

struct do_while_statement final : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;
    [[nodiscard]] auto declared_vars() const -> std::set<std::string> final;
    [[nodiscard]] auto equals_to(const expression* other) const -> bool final;

    const statement* body {};
    const expression* condition {};
};

struct continue_statement final : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;
    [[nodiscard]] auto equals_to(const expression* other) const -> bool final;
};

struct break_statement final : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;
    [[nodiscard]] auto equals_to(const expression* other) const -> bool final;
};

struct return_statement final : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;
    [[nodiscard]] auto equals_to(const expression* other) const -> bool final;

    const expression* value {};
};

struct debugger_statement final : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;
    [[nodiscard]] auto equals_to(const expression* other) const -> bool final;
};
