#ifndef ANNUITY_ANNUAL_AGGREGATOR_H
#define ANNUITY_ANNUAL_AGGREGATOR_H

#include <vector>
#include "../annuity/types.h"

namespace Annuity {

class AnnualAggregator {
public:
    // Roll the monthly trace into 12-month buckets; the last bucket may be short.
    // Running totals accumulate from month 0.
    static std::vector<AnnualRecord> to_annual(const SimulationTrace& trace);

private:
    static AnnualRecord bucket(const SimulationTrace& trace, int start, int len,
                               double& running_interest, double& running_withdrawn);
};

}

#endif // ANNUITY_ANNUAL_AGGREGATOR_H
