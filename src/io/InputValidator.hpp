#pragma once
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "../Params.hpp"

namespace Annuity {

// Raw form/CLI values keyed by field_name()
using RawInput = std::map<std::string, std::string>;

struct ValidationResult {
    bool ok = false;
    SimulationInput input;
    std::vector<FieldError> errors;
};

class InputValidator {
public:
    static ValidationResult validate(const RawInput& raw, SolveFor kind) {
        ValidationResult res;

        for (Field f : required_fields(kind)) {
            const Rule& rule = rule_for(f);
            auto it = raw.find(field_name(f));
            if (it == raw.end() || is_blank(it->second)) {
                res.errors.push_back({f, std::string("The ") + rule.label + " must be provided."});
                continue;
            }

            std::optional<double> v = parse_number(it->second);
            if (!v) {
                res.errors.push_back({f, std::string("The ") + rule.label + " must be a number."});
                continue;
            }
            if (!check(rule, *v)) {
                res.errors.push_back({f, describe(rule)});
                continue;
            }
            res.input.set(f, *v);
        }

        // Compounding is never solved for; absent means monthly
        auto it = raw.find(field_name(Field::Compounding));
        if (it != raw.end() && !is_blank(it->second)) {
            std::optional<double> v = parse_number(it->second);
            // Must also fit in an int
            if (!v || *v < 1.0 || std::floor(*v) != *v
                || *v > static_cast<double>(std::numeric_limits<int>::max())) {
                res.errors.push_back({Field::Compounding,
                    "The compounding periods per year must be a natural number (1, 2, 3, ...)."});
            } else {
                res.input.compounding_per_year = static_cast<int>(*v);
            }
        }

        res.ok = res.errors.empty();
        return res;
    }

    // Accepts "1,000,000.50" style text; rejects anything with trailing garbage
    static std::optional<double> parse_number(const std::string& text) {
        std::string cleaned;
        cleaned.reserve(text.size());
        for (char c : text) {
            if (c == ',' || std::isspace(static_cast<unsigned char>(c))) continue;
            cleaned.push_back(c);
        }
        if (cleaned.empty()) return std::nullopt;

        char* end = nullptr;
        double v = std::strtod(cleaned.c_str(), &end);
        if (end != cleaned.c_str() + cleaned.size()) return std::nullopt;
        if (!std::isfinite(v)) return std::nullopt;
        return v;
    }

private:
    struct Rule {
        Field field;
        const char* label;
        double min;
        double max;
        bool min_exclusive;
    };

    static const Rule& rule_for(Field f) {
        static const Rule rules[] = {
            {Field::Principal,      "starting principal",        0.0, HUGE_VAL, true},
            {Field::Term,           "annuity term",              0.0, HUGE_VAL, true},
            {Field::Rate,           "interest rate",             0.0, 100.0,    false},
            {Field::Compounding,    "compounding periods",       1.0, HUGE_VAL, false},
            {Field::Withdrawal,     "monthly withdrawal",        0.0, HUGE_VAL, true},
            {Field::AnnualIncrease, "annual increase",           0.0, 100.0,    false},
        };
        return rules[static_cast<int>(f)];
    }

    static bool check(const Rule& r, double v) {
        if (r.min_exclusive ? v <= r.min : v < r.min) return false;
        return v <= r.max;
    }

    static std::string describe(const Rule& r) {
        if (r.max == 100.0) {
            return std::string("The ") + r.label + " must be a number between 0 and 100.";
        }
        return std::string("The ") + r.label + " must be greater than 0.";
    }

    static bool is_blank(const std::string& s) {
        for (char c : s) {
            if (!std::isspace(static_cast<unsigned char>(c))) return false;
        }
        return true;
    }
};

} // namespace Annuity
