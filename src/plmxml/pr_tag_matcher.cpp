#include <plm_cfg/plmxml/pr_tag_matcher.hpp>

#include <plm_cfg/core/log.hpp>

#include <algorithm>
#include <cctype>

namespace plm_cfg {

namespace {

bool IsWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool IsPlainAtomChar(char c) {
    return IsWordChar(c) || c == '-';
}

// A word boundary sits between a word and a non-word character, string
// edges counting as non-word.
bool IsBoundary(std::string_view s, std::size_t pos) {
    const bool before = pos > 0 && IsWordChar(s[pos - 1]);
    const bool after = pos < s.size() && IsWordChar(s[pos]);
    return before != after;
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string_view Trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

std::vector<std::string_view> Split(std::string_view s, char sep) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = s.find(sep, start);
        if (pos == std::string_view::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

bool TermMatches(const PrTagPattern::Term& term, std::string_view configuration) {
    return std::any_of(term.begin(), term.end(), [&](const std::string& atom) {
        return ContainsWord(configuration, atom);
    });
}

bool ClauseMatches(const PrTagPattern::Clause& clause, std::string_view configuration) {
    return std::all_of(clause.begin(), clause.end(), [&](const PrTagPattern::Term& term) {
        return TermMatches(term, configuration);
    });
}

} // anonymous namespace

bool ContainsWord(std::string_view haystack, std::string_view word) {
    if (word.empty() || word.size() > haystack.size()) {
        return false;
    }
    for (std::size_t pos = 0; pos + word.size() <= haystack.size(); ++pos) {
        if (!IsBoundary(haystack, pos) || !IsBoundary(haystack, pos + word.size())) {
            continue;
        }
        if (EqualsIgnoreCase(haystack.substr(pos, word.size()), word)) {
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// PrTagPattern
// ---------------------------------------------------------------------------
PrTagPattern::PrTagPattern(std::string_view expression)
    : expression_(expression) {
    for (auto clause_text : Split(expression, ';')) {
        Clause clause;
        for (auto term_text : Split(clause_text, '+')) {
            Term term;
            for (auto atom_text : Split(term_text, '/')) {
                auto atom = Trim(atom_text);
                if (atom.empty()) {
                    continue;
                }
                if (!std::all_of(atom.begin(), atom.end(), IsPlainAtomChar)) {
                    has_literal_atoms_ = true;
                }
                term.emplace_back(atom);
            }
            if (!term.empty()) {
                clause.push_back(std::move(term));
            }
        }
        if (!clause.empty()) {
            clauses_.push_back(std::move(clause));
        }
    }
}

bool PrTagPattern::Matches(std::string_view configuration) const {
    return std::any_of(clauses_.begin(), clauses_.end(), [&](const Clause& clause) {
        return ClauseMatches(clause, configuration);
    });
}

// ---------------------------------------------------------------------------
// PrTagMatcher
// ---------------------------------------------------------------------------
std::shared_ptr<const PrTagPattern> PrTagMatcher::Compile(const std::string& expression) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(expression);
    if (it != cache_.end()) {
        return it->second;
    }

    auto pattern = std::make_shared<const PrTagPattern>(expression);
    if (pattern->HasLiteralAtoms()) {
        LogWarn(log_component::kPrTags, "Expression '" + expression +
                "' contains atoms with unexpected characters, matching them literally");
    }
    cache_.emplace(expression, pattern);
    return pattern;
}

bool PrTagMatcher::Matches(const std::string& expression,
                           std::string_view configuration) {
    return Compile(expression)->Matches(configuration);
}

std::size_t PrTagMatcher::CacheSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

std::string BuildConfigurationString(const std::vector<PrCode>& codes) {
    std::string configuration;
    for (const auto& code : codes) {
        configuration += '+';
        configuration += code.Value();
    }
    return configuration;
}

} // namespace plm_cfg
