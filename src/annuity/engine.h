#pragma once
#include "types.h"
#include "../Params.hpp"
#include "../policy/SolverPolicies.hpp"
#include "../io/InputValidator.hpp"

namespace Annuity {

class AnnuityEngine {
public:
    struct Options {
        ParameterSolver::Options search;
        bool verbose = false;
    };

    AnnuityEngine();
    explicit AnnuityEngine(const Options& opts);

    // Solve for `kind` given the other three parameters
    SolveResult solve(const SimulationInput& input, SolveFor kind) const;

    // Validate raw form/CLI values first; rejects surface as InvalidInput
    SolveResult solve_raw(const RawInput& raw, SolveFor kind) const;

    // Forward simulation only, no solving
    TraceResult simulate(const ScheduleParams& params) const;

    const Options& options() const { return opts_; }

private:
    Options opts_;
};

}
