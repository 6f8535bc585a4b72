#pragma once
#include <algorithm>
#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include "../Params.hpp"
#include "../annuity/types.h"
#include "../kernel/AmortizationSimulator.hpp"
#include "../solver/ParameterSolver.hpp"
#include "../aggregator/annual.h"

namespace Annuity {

enum class SolveStatus {
    Ok,
    MissingInput,        // caller contract violation, nothing computed
    InvalidInput,        // raw input rejected by the validator
    SearchFailed,        // "check the input values are reasonable"
    CalculationTooLong,  // open-ended run passed 1000 years
};

inline const char* status_name(SolveStatus s) {
    switch (s) {
        case SolveStatus::Ok:                 return "ok";
        case SolveStatus::MissingInput:       return "missing_input";
        case SolveStatus::InvalidInput:       return "invalid_input";
        case SolveStatus::SearchFailed:       return "search_failed";
        case SolveStatus::CalculationTooLong: return "calculation_too_long";
    }
    return "unknown";
}

struct SolveResult {
    SolveStatus status = SolveStatus::Ok;
    SolveFor kind = SolveFor::Withdrawal;
    std::vector<Field> missing;
    std::vector<FieldError> field_errors;

    ScheduleParams resolved;            // inputs with the unknown filled in
    SimulationTrace trace;
    std::vector<AnnualRecord> annual;
    Summary summary;
    ParameterSolver::Result search;     // diagnostics; untouched for Term

    bool ok() const { return status == SolveStatus::Ok; }
};

// One row of the policy table. Term has no inverse search.
struct PolicyTraits {
    SolveFor kind;
    Field unknown;
    bool searched;
    SearchDirection direction;
    bool money;               // snap the root to cents
    int round_down_decimals;  // extra conservative rounding, -1 for none
};

struct SolverPolicyOptions {
    ParameterSolver::Options search;
    bool verbose = false;
};

class SolverPolicies {
public:
    using Options = SolverPolicyOptions;

    static const PolicyTraits& traits(SolveFor kind) {
        static const PolicyTraits table[] = {
            {SolveFor::Withdrawal, Field::Withdrawal, true,  SearchDirection::Decreasing, true,  -1},
            {SolveFor::Term,       Field::Term,       false, SearchDirection::Increasing, false, -1},
            {SolveFor::Principal,  Field::Principal,  true,  SearchDirection::Increasing, true,  -1},
            {SolveFor::Rate,       Field::Rate,       true,  SearchDirection::Increasing, false, 3},
        };
        return table[static_cast<int>(kind)];
    }

    static SolveResult solve(const SimulationInput& in, SolveFor kind, const Options& opts = Options()) {
        SolveResult res;
        res.kind = kind;

        res.missing = in.missing_for(kind);
        if (!res.missing.empty()) {
            res.status = SolveStatus::MissingInput;
            std::cerr << "[Annuity::Solver] Missing required input for '" << solve_for_name(kind) << "':";
            for (Field f : res.missing) std::cerr << " " << field_name(f);
            std::cerr << std::endl;
            return res;
        }

        const PolicyTraits& t = traits(kind);
        ScheduleParams params = resolve(in, kind);

        if (t.searched) {
            ParameterSolver::Options search = opts.search;
            search.verbose = search.verbose || opts.verbose;

            ObjectiveFunc f = objective(params, t.unknown);
            double step = initial_step(params, t.unknown);
            double start = initial_value(params, t.unknown);

            res.search = t.money
                ? ParameterSolver::find_money(f, t.direction, step, start, search)
                : ParameterSolver::find(f, t.direction, step, start, search);

            if (!res.search.ok()) {
                res.status = SolveStatus::SearchFailed;
                if (opts.verbose) {
                    std::cout << "[Annuity::Solver] No acceptable " << field_name(t.unknown) << " found" << std::endl;
                }
                return res;
            }

            double value = res.search.value;
            if (t.round_down_decimals >= 0) {
                value = ParameterSolver::round_down(value, t.round_down_decimals);
            }
            apply(params, t.unknown, value);
        }

        TraceResult full = AmortizationSimulator::run_full(params);
        if (full.status == SimStatus::TooLong) {
            res.status = SolveStatus::CalculationTooLong;
            return res;
        }
        if (full.status == SimStatus::Diverged) {
            res.status = SolveStatus::SearchFailed;
            return res;
        }

        res.resolved = params;
        res.trace = std::move(full.trace);
        res.annual = AnnualAggregator::to_annual(res.trace);
        res.summary = summarize(res.trace, params);
        res.summary.solved_value = t.searched ? value_of(params, t.unknown) : res.trace.actual_term_years;

        if (opts.verbose) {
            std::cout << "[Annuity::Solver] " << field_name(t.unknown) << " = " << res.summary.solved_value
                      << " (" << res.trace.period_count() << " months)" << std::endl;
        }
        return res;
    }

    static Summary summarize(const SimulationTrace& trace, const ScheduleParams& p) {
        Summary s;
        s.total_interest = trace.total_interest();
        s.total_withdrawn = trace.total_withdrawn();
        s.initial_annual_income = p.initial_withdrawal * std::min(kMonthsPerYear, trace.period_count());
        const double base = std::max(p.principal, s.initial_annual_income);
        s.draw_down_pct = base > 0.0 ? s.initial_annual_income / base * 100.0 : 0.0;
        return s;
    }

private:
    // Copy the known fields; the unknown stays at zero until solved.
    static ScheduleParams resolve(const SimulationInput& in, SolveFor kind) {
        ScheduleParams p;
        p.principal = in.principal.value_or(0.0);
        p.annual_rate_pct = in.annual_rate_pct.value_or(0.0);
        p.compounding_per_year = in.compounding_per_year;
        p.initial_withdrawal = in.monthly_withdrawal.value_or(0.0);
        p.annual_increase_pct = in.annual_increase_pct.value_or(0.0);
        if (kind != SolveFor::Term) p.term_years = in.term_years;
        if (kind == SolveFor::Principal) p.principal = 0.0;
        if (kind == SolveFor::Rate) p.annual_rate_pct = 0.0;
        if (kind == SolveFor::Withdrawal) p.initial_withdrawal = 0.0;
        return p;
    }

    static void apply(ScheduleParams& p, Field f, double value) {
        switch (f) {
            case Field::Principal:  p.principal = value; break;
            case Field::Rate:       p.annual_rate_pct = value; break;
            case Field::Withdrawal: p.initial_withdrawal = value; break;
            case Field::Term:       p.term_years = value; break;
            default: break;
        }
    }

    static double value_of(const ScheduleParams& p, Field f) {
        switch (f) {
            case Field::Principal:  return p.principal;
            case Field::Rate:       return p.annual_rate_pct;
            case Field::Withdrawal: return p.initial_withdrawal;
            case Field::Term:       return p.term_years.value_or(0.0);
            default: return 0.0;
        }
    }

    static ObjectiveFunc objective(const ScheduleParams& base, Field unknown) {
        const double target = *base.term_years;
        if (unknown == Field::Withdrawal) {
            return [base, target](double w) {
                ScheduleParams p = base;
                p.initial_withdrawal = w;
                FastSummary s = AmortizationSimulator::run_fast(p);
                if (s.actual_term_years == target) {
                    return s.final_applied_withdrawal / s.final_scheduled_withdrawal;
                }
                return s.actual_term_years / target;
            };
        }
        // Principal and rate both lengthen the term as they grow
        return [base, target, unknown](double v) {
            ScheduleParams p = base;
            apply(p, unknown, v);
            FastSummary s = AmortizationSimulator::run_fast(p);
            if (s.actual_term_years == target) {
                return s.final_scheduled_withdrawal / s.final_applied_withdrawal;
            }
            return target / s.actual_term_years;
        };
    }

    static double initial_step(const ScheduleParams& p, Field unknown) {
        switch (unknown) {
            case Field::Withdrawal: return 100.0;
            case Field::Principal:  return p.initial_withdrawal;
            default:                return 1.0;
        }
    }

    static double initial_value(const ScheduleParams& p, Field unknown) {
        switch (unknown) {
            case Field::Withdrawal:
                // first month's interest
                return p.principal * AmortizationSimulator::effective_monthly_rate(p.annual_rate_pct, p.compounding_per_year);
            case Field::Principal:  return p.initial_withdrawal;
            default:                return 0.0;
        }
    }
};

} // namespace Annuity
