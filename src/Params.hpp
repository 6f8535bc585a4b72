#pragma once
#include <optional>
#include <string>
#include <vector>
#include <stdexcept>

namespace Annuity {

constexpr int kMonthsPerYear = 12;
constexpr int kCalculationLimitYears = 1000;
constexpr double kZeroBalance = 0.01; // balances below this count as exhausted

// Order matches the calculator's calc-type index (0..3)
enum class SolveFor {
    Withdrawal = 0,
    Term = 1,
    Principal = 2,
    Rate = 3,
};

enum class Field {
    Principal,
    Term,
    Rate,
    Compounding,
    Withdrawal,
    AnnualIncrease,
};

inline const char* field_name(Field f) {
    switch (f) {
        case Field::Principal:      return "principal";
        case Field::Term:           return "term_years";
        case Field::Rate:           return "annual_rate_pct";
        case Field::Compounding:    return "compounding_per_year";
        case Field::Withdrawal:     return "monthly_withdrawal";
        case Field::AnnualIncrease: return "annual_increase_pct";
    }
    return "unknown";
}

inline const char* solve_for_name(SolveFor k) {
    switch (k) {
        case SolveFor::Withdrawal: return "withdrawal";
        case SolveFor::Term:       return "term";
        case SolveFor::Principal:  return "principal";
        case SolveFor::Rate:       return "rate";
    }
    return "unknown";
}

inline SolveFor solve_for_from_index(int index) {
    if (index < 0 || index > 3) {
        throw std::invalid_argument("Invalid calculation type index: " + std::to_string(index));
    }
    return static_cast<SolveFor>(index);
}

inline SolveFor solve_for_from_name(const std::string& name) {
    if (name == "withdrawal" || name == "income") return SolveFor::Withdrawal;
    if (name == "term") return SolveFor::Term;
    if (name == "principal") return SolveFor::Principal;
    if (name == "rate") return SolveFor::Rate;
    throw std::invalid_argument("Unknown calculation type: " + name);
}

// Fields each calculation type reads; the unknown is never among them
inline std::vector<Field> required_fields(SolveFor k) {
    switch (k) {
        case SolveFor::Withdrawal: return {Field::Principal, Field::Term, Field::Rate, Field::AnnualIncrease};
        case SolveFor::Term:       return {Field::Principal, Field::Rate, Field::Withdrawal, Field::AnnualIncrease};
        case SolveFor::Principal:  return {Field::Term, Field::Rate, Field::Withdrawal, Field::AnnualIncrease};
        case SolveFor::Rate:       return {Field::Principal, Field::Term, Field::Withdrawal, Field::AnnualIncrease};
    }
    return {};
}

struct FieldError {
    Field field;
    std::string message;
};

// Calculator input. Absent fields are either the unknown or a caller error.
struct SimulationInput {
    std::optional<double> principal;
    std::optional<double> term_years;
    std::optional<double> annual_rate_pct;
    int compounding_per_year = kMonthsPerYear;
    std::optional<double> monthly_withdrawal;
    std::optional<double> annual_increase_pct;

    std::optional<double> get(Field f) const {
        switch (f) {
            case Field::Principal:      return principal;
            case Field::Term:           return term_years;
            case Field::Rate:           return annual_rate_pct;
            case Field::Compounding:    return static_cast<double>(compounding_per_year);
            case Field::Withdrawal:     return monthly_withdrawal;
            case Field::AnnualIncrease: return annual_increase_pct;
        }
        return std::nullopt;
    }

    void set(Field f, double value) {
        switch (f) {
            case Field::Principal:      principal = value; break;
            case Field::Term:           term_years = value; break;
            case Field::Rate:           annual_rate_pct = value; break;
            case Field::Compounding:    compounding_per_year = static_cast<int>(value); break;
            case Field::Withdrawal:     monthly_withdrawal = value; break;
            case Field::AnnualIncrease: annual_increase_pct = value; break;
        }
    }

    std::vector<Field> missing_for(SolveFor k) const {
        std::vector<Field> missing;
        for (Field f : required_fields(k)) {
            if (!get(f).has_value()) missing.push_back(f);
        }
        return missing;
    }
};

// Fully resolved simulation parameters. term_years absent = open-ended run.
struct ScheduleParams {
    double principal = 0.0;
    std::optional<double> term_years;
    double annual_rate_pct = 0.0;
    int compounding_per_year = kMonthsPerYear;
    double initial_withdrawal = 0.0;
    double annual_increase_pct = 0.0;
};

} // namespace Annuity
