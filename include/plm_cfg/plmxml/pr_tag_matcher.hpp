#pragma once

#include <plm_cfg/core/types.hpp>

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace plm_cfg {

// ---------------------------------------------------------------------------
// PrTagPattern: a compiled PR-tag expression.
//
//   Expression = Clause (';' Clause)*   any clause matches
//   Clause     = Term ('+' Term)*       every term matches
//   Term       = Atom ('/' Atom)*       any atom matches
//
// An atom matches when it occurs case-insensitively in the configuration
// string with a word boundary on both sides (word characters are ASCII
// letters, digits and '_'). Whitespace around atoms is ignored; empty atoms,
// terms and clauses are dropped. An expression without atoms matches
// nothing.
//
// Example: "ABC/DEF+K11;X99" matches "+ABC+K11+" and "+X99+".
// ---------------------------------------------------------------------------
class PrTagPattern {
public:
    using Term = std::vector<std::string>;
    using Clause = std::vector<Term>;

    PrTagPattern() = default;
    explicit PrTagPattern(std::string_view expression);

    [[nodiscard]] bool Matches(std::string_view configuration) const;

    [[nodiscard]] const std::string& Expression() const noexcept { return expression_; }
    [[nodiscard]] const std::vector<Clause>& Clauses() const noexcept { return clauses_; }
    [[nodiscard]] bool IsEmpty() const noexcept { return clauses_.empty(); }

    // True if some atom contains characters other than letters, digits,
    // '_' and '-'. Such atoms are still matched literally.
    [[nodiscard]] bool HasLiteralAtoms() const noexcept { return has_literal_atoms_; }

private:
    std::string expression_;
    std::vector<Clause> clauses_;
    bool has_literal_atoms_ = false;
};

// Whole-word, case-insensitive occurrence test used for every atom.
[[nodiscard]] bool ContainsWord(std::string_view haystack, std::string_view word);

// ---------------------------------------------------------------------------
// PrTagMatcher: memoizing compiler. Sibling variants of a target and nodes
// in the same assembly usually share expressions, so each distinct string is
// compiled once. Safe to share between threads.
// ---------------------------------------------------------------------------
class PrTagMatcher {
public:
    PrTagMatcher() = default;

    PrTagMatcher(const PrTagMatcher&) = delete;
    PrTagMatcher& operator=(const PrTagMatcher&) = delete;

    [[nodiscard]] std::shared_ptr<const PrTagPattern> Compile(const std::string& expression);

    [[nodiscard]] bool Matches(const std::string& expression,
                               std::string_view configuration);

    [[nodiscard]] std::size_t CacheSize() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const PrTagPattern>> cache_;
};

// Join PR codes into a configuration string: {A, B} -> "+A+B".
[[nodiscard]] std::string BuildConfigurationString(const std::vector<PrCode>& codes);

} // namespace plm_cfg
