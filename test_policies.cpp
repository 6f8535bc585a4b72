#include <iostream>
#include <cmath>
#include <cassert>
#include "src/annuity/engine.h"

using namespace Annuity;

static bool near(double a, double b, double tol) { return std::abs(a - b) <= tol; }

// R1,000,000 at 8% nominal, 20 years, income rising 5% a year
static SimulationInput retirement() {
    SimulationInput in;
    in.principal = 1000000.0;
    in.term_years = 20.0;
    in.annual_rate_pct = 8.0;
    in.annual_increase_pct = 5.0;
    return in;
}

void test_solve_withdrawal_scenario() {
    AnnuityEngine engine;
    SolveResult res = engine.solve(retirement(), SolveFor::Withdrawal);
    assert(res.ok());
    assert(near(res.summary.solved_value, 5601.44, 1e-9));
    assert(res.resolved.initial_withdrawal == res.summary.solved_value);
    assert(res.trace.period_count() == 240);
    assert(res.annual.size() == 20);

    const AnnualRecord& y1 = res.annual[0];
    assert(near(y1.end_balance, 1010352.33, 0.01));
    assert(near(y1.total_interest, 77569.61, 0.01));
    assert(near(y1.total_withdrawn, 67217.28, 0.01));

    const AnnualRecord& y20 = res.annual[19];
    assert(y20.end_balance < kZeroBalance);
    assert(near(y20.total_interest, 1222600.63, 0.01));
    assert(near(y20.total_withdrawn, 2222600.63, 0.01));

    assert(near(res.summary.total_interest, 1222600.63, 0.01));
    assert(near(res.summary.total_withdrawn, 2222600.63, 0.01));
    assert(near(res.summary.initial_annual_income, 67217.28, 1e-6));
    assert(near(res.summary.draw_down_pct, 6.721728, 1e-6));

    // Ceiling rounding never leaves the term short
    assert(res.trace.actual_term_years == 20.0);
    std::cout << "  withdrawal: " << res.summary.solved_value << std::endl;
}

void test_withdrawal_then_term_round_trip() {
    AnnuityEngine engine;
    SolveResult w = engine.solve(retirement(), SolveFor::Withdrawal);
    assert(w.ok());

    SimulationInput in = retirement();
    in.term_years.reset();
    in.monthly_withdrawal = w.summary.solved_value;
    SolveResult t = engine.solve(in, SolveFor::Term);
    assert(t.ok());
    assert(std::abs(t.summary.solved_value - 20.0) <= 1.0 / 12.0);
    assert(t.search.evaluations == 0);
    std::cout << "  term: " << t.summary.solved_value << " years" << std::endl;
}

void test_solve_principal() {
    SimulationInput in = retirement();
    in.principal.reset();
    in.monthly_withdrawal = 5601.44;

    SolveResult res = AnnuityEngine().solve(in, SolveFor::Principal);
    assert(res.ok());
    // Floor to the cent, just above the R1,000,000 that funds this income
    assert(res.summary.solved_value >= 1000000.0);
    assert(res.summary.solved_value - 1000000.0 < 1.0);
    assert(near(res.summary.solved_value * 100.0, std::round(res.summary.solved_value * 100.0), 1e-3));
    assert(res.trace.actual_term_years == 20.0);
    std::cout << "  principal: " << res.summary.solved_value << std::endl;
}

void test_solve_rate() {
    SimulationInput in = retirement();
    in.annual_rate_pct.reset();
    in.monthly_withdrawal = 5601.44;

    SolveResult res = AnnuityEngine().solve(in, SolveFor::Rate);
    assert(res.ok());
    // Rounded down to 3 decimals
    assert(near(res.summary.solved_value, 8.0, 1e-12));
    assert(res.resolved.annual_rate_pct == res.summary.solved_value);
    assert(res.trace.actual_term_years == 20.0);
    std::cout << "  rate: " << res.summary.solved_value << "%" << std::endl;
}

void test_missing_input() {
    SimulationInput in = retirement();
    in.term_years.reset();
    SolveResult res = AnnuityEngine().solve(in, SolveFor::Withdrawal);
    assert(res.status == SolveStatus::MissingInput);
    assert(res.missing.size() == 1);
    assert(res.missing[0] == Field::Term);
    assert(res.trace.empty());
    assert(res.search.evaluations == 0);
    assert(SolverPolicies::solve(in, SolveFor::Withdrawal).status == SolveStatus::MissingInput);

    SimulationInput empty;
    res = AnnuityEngine().solve(empty, SolveFor::Rate);
    assert(res.status == SolveStatus::MissingInput);
    assert(res.missing.size() == 4);
}

void test_calculation_too_long() {
    SimulationInput in = retirement();
    in.term_years.reset();
    in.monthly_withdrawal = 100.0;
    in.annual_increase_pct = 0.0;
    SolveResult res = AnnuityEngine().solve(in, SolveFor::Term);
    assert(res.status == SolveStatus::CalculationTooLong);
    assert(res.trace.empty());
}

// Even a zero rate outlasts the 5-year target, so only negative rates could match
void test_rate_search_failed() {
    SimulationInput in;
    in.principal = 1000000.0;
    in.term_years = 5.0;
    in.monthly_withdrawal = 10000.0;
    in.annual_increase_pct = 0.0;
    SolveResult res = AnnuityEngine().solve(in, SolveFor::Rate);
    assert(res.status == SolveStatus::SearchFailed);
    assert(!res.search.ok());
}

void test_term_ignores_supplied_term() {
    SimulationInput in = retirement();
    in.monthly_withdrawal = 5601.44;
    in.term_years = 3.0;
    SolveResult res = AnnuityEngine().solve(in, SolveFor::Term);
    assert(res.ok());
    assert(res.summary.solved_value == 20.0);
}

void test_draw_down_when_income_exceeds_principal() {
    SimulationInput in;
    in.principal = 1000.0;
    in.annual_rate_pct = 0.0;
    in.monthly_withdrawal = 2000.0;
    in.annual_increase_pct = 0.0;
    SolveResult res = AnnuityEngine().solve(in, SolveFor::Term);
    assert(res.ok());
    assert(res.trace.period_count() == 1);
    assert(res.summary.initial_annual_income == 2000.0);
    assert(res.summary.draw_down_pct == 100.0);
    assert(res.summary.total_withdrawn == 1000.0);
}

void test_solve_raw_rejects_bad_fields() {
    RawInput raw;
    raw["principal"] = "1,000,000";
    raw["term_years"] = "abc";
    raw["annual_rate_pct"] = "8";
    SolveResult res = AnnuityEngine().solve_raw(raw, SolveFor::Withdrawal);
    assert(res.status == SolveStatus::InvalidInput);
    assert(res.field_errors.size() == 2); // term not a number, increase missing

    raw["term_years"] = "20";
    raw["annual_increase_pct"] = "5";
    res = AnnuityEngine().solve_raw(raw, SolveFor::Withdrawal);
    assert(res.ok());
    assert(near(res.summary.solved_value, 5601.44, 1e-9));
}

// Forward simulation through the facade matches the solved trace
void test_engine_simulate() {
    AnnuityEngine::Options opts;
    opts.search.max_refinements = 500;
    AnnuityEngine engine(opts);
    assert(engine.options().search.max_refinements == 500);
    assert(!engine.options().verbose);

    SolveResult solved = AnnuityEngine().solve(retirement(), SolveFor::Withdrawal);
    assert(solved.ok());

    TraceResult r = engine.simulate(solved.resolved);
    assert(r.ok());
    assert(r.trace.period_count() == solved.trace.period_count());
    assert(r.trace.actual_term_years == 20.0);
    assert(r.trace.total_withdrawn() == solved.summary.total_withdrawn);

    ScheduleParams open_ended = solved.resolved;
    open_ended.term_years.reset();
    open_ended.initial_withdrawal = 100.0;
    open_ended.annual_increase_pct = 0.0;
    r = engine.simulate(open_ended);
    assert(r.status == SimStatus::TooLong);
    assert(r.trace.empty());
}

int main() {
    std::cout << "Testing SolverPolicies..." << std::endl;
    test_solve_withdrawal_scenario();
    test_withdrawal_then_term_round_trip();
    test_solve_principal();
    test_solve_rate();
    test_missing_input();
    test_calculation_too_long();
    test_rate_search_failed();
    test_term_ignores_supplied_term();
    test_draw_down_when_income_exceeds_principal();
    test_solve_raw_rejects_bad_fields();
    test_engine_simulate();
    std::cout << "SUCCESS: SolverPolicies verified." << std::endl;
    return 0;
}
