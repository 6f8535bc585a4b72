#include "engine.h"
#include <iostream>

namespace Annuity {

AnnuityEngine::AnnuityEngine() : opts_() {}

AnnuityEngine::AnnuityEngine(const Options& opts) : opts_(opts) {}

SolveResult AnnuityEngine::solve(const SimulationInput& input, SolveFor kind) const {
    SolverPolicies::Options popts;
    popts.search = opts_.search;
    popts.verbose = opts_.verbose;

    if (opts_.verbose) {
        std::cout << "[Annuity::Engine] Solving for " << solve_for_name(kind) << std::endl;
    }

    SolveResult res = SolverPolicies::solve(input, kind, popts);

    if (!res.ok()) {
        std::cerr << "[Annuity::Engine] Solve ended with status: " << status_name(res.status) << std::endl;
    } else if (opts_.verbose) {
        std::cout << "[Annuity::Engine] " << res.trace.period_count() << " months, "
                  << res.annual.size() << " years" << std::endl;
    }
    return res;
}

SolveResult AnnuityEngine::solve_raw(const RawInput& raw, SolveFor kind) const {
    ValidationResult v = InputValidator::validate(raw, kind);
    if (!v.ok) {
        SolveResult res;
        res.kind = kind;
        res.status = SolveStatus::InvalidInput;
        res.field_errors = v.errors;
        for (const FieldError& e : v.errors) {
            std::cerr << "[Annuity::Engine] " << field_name(e.field) << ": " << e.message << std::endl;
        }
        return res;
    }
    return solve(v.input, kind);
}

TraceResult AnnuityEngine::simulate(const ScheduleParams& params) const {
    return AmortizationSimulator::run_full(params);
}

} // namespace Annuity
