// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef QUIVER_SPECS_MARKER_HPP
#define QUIVER_SPECS_MARKER_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

namespace quiver::specs
{
    enum struct MarkerOperator
    {
        equal,
        not_equal,
        less,
        less_equal,
        greater,
        greater_equal,
        in,
        not_in,
    };

    [[nodiscard]] auto marker_operator_str(MarkerOperator op) -> std::string_view;

    /**
     * The values of the environment markers of a concrete interpreter and platform.
     *
     * @see https://packaging.python.org/en/latest/specifications/dependency-specifiers/
     */
    class MarkerEnvironment
    {
    public:

        using value_map = std::map<std::string, std::string>;

        MarkerEnvironment() = default;
        explicit MarkerEnvironment(value_map values);

        [[nodiscard]] auto get(std::string_view key) const -> std::optional<std::string>;
        void set(std::string key, std::string value);

        [[nodiscard]] auto values() const noexcept -> const value_map&;

    private:

        value_map m_values = {};
    };

    auto operator==(const MarkerEnvironment& left, const MarkerEnvironment& right) -> bool;

    /** A single ``key op 'value'`` marker, such as ``sys_platform == 'linux'``. */
    struct MarkerExpression
    {
        std::string key;
        MarkerOperator op = MarkerOperator::equal;
        std::string value;

        /** Evaluate the expression, comparing as versions for version keys. */
        [[nodiscard]] auto evaluate(const MarkerEnvironment& env) const -> bool;

        [[nodiscard]] auto to_string() const -> std::string;
    };

    auto operator==(const MarkerExpression& left, const MarkerExpression& right) -> bool;
    auto operator<(const MarkerExpression& left, const MarkerExpression& right) -> bool;

    /**
     * A boolean combination of marker expressions.
     *
     * The tree is kept in disjunctive normal form, a disjunction of conjunctions of
     * expressions, with duplicates removed and a sorted order so that equal markers
     * compare equal.
     */
    class MarkerTree
    {
    public:

        using conjunction = std::vector<MarkerExpression>;
        using disjunction = std::vector<conjunction>;

        [[nodiscard]] static auto always_true() -> MarkerTree;
        [[nodiscard]] static auto always_false() -> MarkerTree;
        [[nodiscard]] static auto expression(MarkerExpression expr) -> MarkerTree;
        [[nodiscard]] static auto
        expression(std::string key, MarkerOperator op, std::string value) -> MarkerTree;

        /** Construct the always true marker. */
        MarkerTree();

        [[nodiscard]] auto and_(const MarkerTree& other) const -> MarkerTree;
        [[nodiscard]] auto or_(const MarkerTree& other) const -> MarkerTree;

        [[nodiscard]] auto is_true() const noexcept -> bool;
        [[nodiscard]] auto is_false() const noexcept -> bool;

        [[nodiscard]] auto evaluate(const MarkerEnvironment& env) const -> bool;

        [[nodiscard]] auto clauses() const noexcept -> const disjunction&;

        /** A PEP 508 rendering, ``true`` and ``false`` for the constant markers. */
        [[nodiscard]] auto to_string() const -> std::string;

    private:

        explicit MarkerTree(disjunction clauses);

        disjunction m_clauses;
    };

    auto operator==(const MarkerTree& left, const MarkerTree& right) -> bool;
    auto operator!=(const MarkerTree& left, const MarkerTree& right) -> bool;
}

template <>
struct fmt::formatter<quiver::specs::MarkerTree> : fmt::formatter<std::string_view>
{
    auto format(const ::quiver::specs::MarkerTree& marker, format_context& ctx) const
        -> format_context::iterator
    {
        return fmt::format_to(ctx.out(), "{}", marker.to_string());
    }
};

#endif
