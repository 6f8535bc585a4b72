#pragma once
#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>
#include "../Params.hpp"
#include "../annuity/types.h"

namespace Annuity {

enum class SimStatus {
    Ok,
    Diverged,  // ran past 2 x term; the search treats this as "far from converged"
    TooLong,   // open-ended run passed the 1000-year ceiling
};

// Terminal state only, no per-period storage (search hot loop)
struct FastSummary {
    SimStatus status = SimStatus::Ok;
    double actual_term_years = 0.0; // +inf unless Ok
    double final_scheduled_withdrawal = 0.0;
    double final_applied_withdrawal = 0.0;
    int periods = 0;
};

struct TraceResult {
    SimStatus status = SimStatus::Ok;
    SimulationTrace trace;

    bool ok() const { return status == SimStatus::Ok; }
};

class AmortizationSimulator {
public:
    // Nominal annual rate -> growth per month, for any compounding frequency
    static double effective_monthly_rate(double annual_rate_pct, int compounding_per_year) {
        double periodic = std::pow(1.0 + annual_rate_pct / 100.0, 1.0 / compounding_per_year) - 1.0;
        double cc = static_cast<double>(compounding_per_year) / kMonthsPerYear;
        return std::pow(1.0 + periodic, cc) - 1.0;
    }

    // Period cap: 2 x term when a term is known, otherwise the 1000-year ceiling.
    // A zero term counts as open-ended.
    static bool is_bounded(const ScheduleParams& p) {
        return p.term_years.has_value() && *p.term_years > 0.0;
    }

    static double period_limit(const ScheduleParams& p) {
        return is_bounded(p) ? 2.0 * (*p.term_years) * kMonthsPerYear
                             : static_cast<double>(kCalculationLimitYears) * kMonthsPerYear;
    }

    static FastSummary run_fast(const ScheduleParams& p) {
        FastSummary out;
        State st = advance(p, nullptr);
        out.status = st.status;
        out.periods = st.periods;
        if (st.status != SimStatus::Ok) {
            out.actual_term_years = std::numeric_limits<double>::infinity();
            return out;
        }
        out.actual_term_years = static_cast<double>(st.periods) / kMonthsPerYear;
        out.final_scheduled_withdrawal = st.scheduled;
        out.final_applied_withdrawal = st.last_applied;
        return out;
    }

    static TraceResult run_full(const ScheduleParams& p) {
        TraceResult out;
        State st = advance(p, &out.trace.periods);
        out.status = st.status;
        if (st.status != SimStatus::Ok) {
            out.trace.periods.clear();
            return out;
        }
        out.trace.actual_term_years = static_cast<double>(out.trace.periods.size()) / kMonthsPerYear;
        out.trace.final_scheduled_withdrawal = st.scheduled;
        return out;
    }

private:
    struct State {
        SimStatus status = SimStatus::Ok;
        int periods = 0;
        double scheduled = 0.0;
        double last_applied = 0.0;
    };

    static State advance(const ScheduleParams& p, std::vector<PeriodRecord>* trace) {
        const double rate = effective_monthly_rate(p.annual_rate_pct, p.compounding_per_year);
        const double growth = 1.0 + p.annual_increase_pct / 100.0;
        const double limit = period_limit(p);
        const bool bounded = is_bounded(p);

        State st;
        st.scheduled = p.initial_withdrawal;
        double balance = p.principal;

        int i = 0;
        while (balance >= kZeroBalance) {
            if (i > 0 && i % kMonthsPerYear == 0) {
                st.scheduled *= growth;
            }
            if (i > limit) {
                st.status = bounded ? SimStatus::Diverged : SimStatus::TooLong;
                st.periods = i;
                return st;
            }

            const double start = balance;
            const double interest = balance * rate;
            balance += interest;

            // Clip the final withdrawal so the balance never goes negative
            const double withdrawal = std::min(balance, st.scheduled);
            balance -= withdrawal;
            st.last_applied = withdrawal;

            if (trace) trace->push_back({start, balance, interest, withdrawal});
            ++i;
        }

        st.periods = i;
        return st;
    }
};

} // namespace Annuity
