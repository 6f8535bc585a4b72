#include "annual.h"
#include <algorithm>
#include "../Params.hpp"

namespace Annuity {

std::vector<AnnualRecord> AnnualAggregator::to_annual(const SimulationTrace& trace) {
    std::vector<AnnualRecord> annual;
    const int n = trace.period_count();
    if (n == 0) return annual;

    annual.reserve((n + kMonthsPerYear - 1) / kMonthsPerYear);

    double running_interest = 0.0;
    double running_withdrawn = 0.0;
    for (int start = 0; start < n; start += kMonthsPerYear) {
        int len = std::min(kMonthsPerYear, n - start);
        annual.push_back(bucket(trace, start, len, running_interest, running_withdrawn));
    }
    return annual;
}

AnnualRecord AnnualAggregator::bucket(const SimulationTrace& trace, int start, int len,
                                      double& running_interest, double& running_withdrawn) {
    const double interest = trace.interest().segment(start, len).sum();
    const double withdrawn = trace.withdrawals().segment(start, len).sum();
    running_interest += interest;
    running_withdrawn += withdrawn;

    AnnualRecord rec;
    rec.start_balance = trace.periods[start].start_balance;
    rec.end_balance = trace.periods[start + len - 1].end_balance;
    rec.interest_payment = interest;
    rec.withdrawal = withdrawn;
    rec.total_interest = running_interest;
    rec.total_withdrawn = running_withdrawn;
    return rec;
}

} // namespace Annuity
