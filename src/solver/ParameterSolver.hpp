#pragma once
#include <functional>
#include <iostream>
#include <cmath>

namespace Annuity {

// Objective: trial value -> ratio. ratio == 1 means converged, ratio > 1 means overshot.
using ObjectiveFunc = std::function<double(double)>;

// How the step reacts to the ratio. Increasing halves the step after moving down,
// Decreasing halves it after moving up.
enum class SearchDirection {
    Increasing,
    Decreasing,
};

struct ParameterSolverOptions {
    double initial_delta = 1e-10;  // first tolerance tier
    double delta_growth = 10.0;
    int delta_tiers = 18;          // final delta ~1e7
    int max_restart = 10;          // restart index 0..max_restart, step doubles each time
    int max_refinements = 1000;
    bool verbose = false;
};

class ParameterSolver {
public:
    using Options = ParameterSolverOptions;

    enum class Status {
        Converged,
        Exhausted,     // every tier and restart used up
        NegativeRoot,  // accepted a value below zero
    };

    struct Result {
        Status status = Status::Exhausted;
        double value = 0.0;
        int tier = -1;
        int restart = -1;
        int iteration = -1;
        long evaluations = 0;

        bool ok() const { return status == Status::Converged; }
    };

    static Result find(const ObjectiveFunc& f, SearchDirection direction,
                       double initial_step, double initial_value = 0.1,
                       Options opts = Options()) {
        Result res;

        if (opts.verbose) {
            std::cout << "--- Annuity ParameterSolver ---" << std::endl;
            std::cout << "Direction: " << (direction == SearchDirection::Increasing ? "increasing" : "decreasing")
                      << ", Step: " << initial_step << ", Start: " << initial_value << std::endl;
        }

        double delta = opts.initial_delta;
        for (int d = 0; d < opts.delta_tiers; ++d) {
            // Upper bound is pinned at 1; only the lower side relaxes
            const double lower = 1.0 - delta;
            const double upper = 1.0;

            for (int r = 0; r <= opts.max_restart; ++r) {
                double value = initial_value;
                double step = initial_step * std::pow(2.0, r);

                for (int i = 0; i < opts.max_refinements; ++i) {
                    const double ratio = f(value);
                    ++res.evaluations;

                    if (ratio < lower) {
                        value -= step;
                        if (direction == SearchDirection::Increasing) step /= 2.0;
                    } else if (ratio >= lower && ratio <= upper) {
                        res.value = value;
                        res.tier = d;
                        res.restart = r;
                        res.iteration = i;
                        res.status = value < 0.0 ? Status::NegativeRoot : Status::Converged;
                        if (opts.verbose) report(res, delta);
                        return res;
                    } else {
                        value += step;
                        if (direction == SearchDirection::Decreasing) step /= 2.0;
                    }
                }
            }
            delta *= opts.delta_growth;
        }

        if (opts.verbose) {
            std::cout << "[FAIL] Search exhausted after " << res.evaluations << " evaluations." << std::endl;
        }
        return res;
    }

    // Money-valued unknowns snap to the cent on the conservative side of the root
    static Result find_money(const ObjectiveFunc& f, SearchDirection direction,
                             double initial_step, double initial_value = 0.1,
                             Options opts = Options()) {
        Result res = find(f, direction, initial_step, initial_value, opts);
        if (!res.ok()) return res;
        res.value = direction == SearchDirection::Increasing
            ? round_down(res.value, 2)
            : round_up(res.value, 2);
        return res;
    }

    static double round_down(double value, int decimals = 0) {
        const double e = std::pow(10.0, decimals);
        return std::floor(value * e) / e;
    }

    static double round_up(double value, int decimals = 0) {
        const double e = std::pow(10.0, decimals);
        return std::ceil(value * e) / e;
    }

private:
    static void report(const Result& res, double delta) {
        if (res.status == Status::NegativeRoot) {
            std::cout << "[FAIL] Converged to negative value " << res.value << std::endl;
            return;
        }
        std::cout << "[CONVERGED] value=" << res.value
                  << " | delta: " << std::scientific << delta << std::defaultfloat
                  << " | tier " << res.tier << ", restart " << res.restart
                  << ", iter " << res.iteration
                  << " | evals " << res.evaluations << std::endl;
    }
};

} // namespace Annuity
