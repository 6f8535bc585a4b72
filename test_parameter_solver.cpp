#include <iostream>
#include <cmath>
#include <cassert>
#include "src/solver/ParameterSolver.hpp"

using namespace Annuity;

static bool near(double a, double b, double tol) { return std::abs(a - b) <= tol; }

// Ratio falls as the value grows (principal-like): step never halves on the way up
void test_increasing_exact_root() {
    auto f = [](double v) { return 10.0 / v; };
    ParameterSolver::Result r = ParameterSolver::find(f, SearchDirection::Increasing, 1.0, 1.0);
    assert(r.ok());
    assert(r.value == 10.0);
    assert(r.tier == 0);
    assert(r.restart == 0);
    assert(r.evaluations == 10);
}

// Withdrawal-like: overshoots are corrected with a halving step
void test_decreasing_converges_into_band() {
    auto f = [](double v) { return 7.3 / v; };
    ParameterSolver::Result r = ParameterSolver::find(f, SearchDirection::Decreasing, 1.0, 1.0);
    assert(r.ok());
    double ratio = f(r.value);
    assert(ratio <= 1.0);
    assert(ratio >= 1.0 - 1e-10);
    assert(near(r.value, 7.3, 1e-8));
    std::cout << "  decreasing root: " << r.value << " (restart " << r.restart << ")" << std::endl;
}

// Band is [1 - delta, 1]: anything above 1 is an overshoot, whatever the tier
void test_band_is_one_sided() {
    auto above = [](double) { return 1.0 + 1e-12; };
    ParameterSolver::Options opts;
    opts.delta_tiers = 3;
    opts.max_restart = 1;
    opts.max_refinements = 20;
    ParameterSolver::Result r = ParameterSolver::find(above, SearchDirection::Increasing, 1.0, 1.0, opts);
    assert(r.status == ParameterSolver::Status::Exhausted);
    assert(r.evaluations == 3 * 2 * 20);

    // Loose tiers eventually admit a ratio well below 1
    auto below = [](double) { return 0.5; };
    r = ParameterSolver::find(below, SearchDirection::Increasing, 1.0, 1.0);
    assert(r.ok());
    assert(r.tier == 10); // delta = 1e-10 * 10^10 = 1
}

void test_exhaustion_uses_every_bound() {
    auto never = [](double) { return 2.0; };
    ParameterSolver::Result r = ParameterSolver::find(never, SearchDirection::Increasing, 1.0, 1.0);
    assert(r.status == ParameterSolver::Status::Exhausted);
    assert(!r.ok());
    assert(r.evaluations == 18L * 11L * 1000L);
}

void test_negative_root_rejected() {
    auto f = [](double v) { return v >= 0.0 ? 0.0 : v / -4.0; };
    ParameterSolver::Result r = ParameterSolver::find(f, SearchDirection::Decreasing, 1.0, 0.0);
    assert(r.status == ParameterSolver::Status::NegativeRoot);
    assert(!r.ok());
    assert(r.value == -4.0);

    // find_money passes the failure through untouched
    r = ParameterSolver::find_money(f, SearchDirection::Decreasing, 1.0, 0.0);
    assert(r.status == ParameterSolver::Status::NegativeRoot);
}

// Money results land on the conservative side, within a cent
void test_money_rounding() {
    auto dec = [](double v) { return 7.3 / v; };
    ParameterSolver::Result raw = ParameterSolver::find(dec, SearchDirection::Decreasing, 1.0, 1.0);
    ParameterSolver::Result up = ParameterSolver::find_money(dec, SearchDirection::Decreasing, 1.0, 1.0);
    assert(up.ok());
    assert(up.value >= raw.value);
    assert(up.value - raw.value <= 0.01 + 1e-9);
    assert(near(up.value * 100.0, std::round(up.value * 100.0), 1e-6));

    auto inc = [](double v) { return 1234.567 / v; };
    ParameterSolver::Result raw_i = ParameterSolver::find(inc, SearchDirection::Increasing, 100.0, 100.0);
    ParameterSolver::Result down = ParameterSolver::find_money(inc, SearchDirection::Increasing, 100.0, 100.0);
    assert(down.ok());
    assert(down.value <= raw_i.value);
    assert(raw_i.value - down.value <= 0.01 + 1e-9);
    std::cout << "  money: up " << up.value << ", down " << down.value << std::endl;
}

void test_round_helpers() {
    assert(ParameterSolver::round_down(8.0000073, 3) == 8.0);
    assert(ParameterSolver::round_down(1.239, 2) == 1.23);
    assert(ParameterSolver::round_up(1.231, 2) == 1.24);
    assert(ParameterSolver::round_up(5.0, 2) == 5.0);
}

int main() {
    std::cout << "Testing ParameterSolver..." << std::endl;
    test_increasing_exact_root();
    test_decreasing_converges_into_band();
    test_band_is_one_sided();
    test_exhaustion_uses_every_bound();
    test_negative_root_rejected();
    test_money_rounding();
    test_round_helpers();
    std::cout << "SUCCESS: ParameterSolver verified." << std::endl;
    return 0;
}
