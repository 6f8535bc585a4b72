#pragma once
#include <type_traits>
#include <vector>
#include <Eigen/Dense>

namespace Annuity {

struct PeriodRecord {
    double start_balance;
    double end_balance;
    double interest_payment;
    double withdrawal;
};

// TraceColumn walks a PeriodRecord array as a row-major (n x 4) block of doubles,
// so the record must stay four unpadded doubles with standard layout.
static_assert(sizeof(PeriodRecord) == 4 * sizeof(double), "PeriodRecord must stay a packed row of doubles");
static_assert(std::is_standard_layout<PeriodRecord>::value, "PeriodRecord must keep standard layout");

// Strided column view over a PeriodRecord array
using TraceColumn = Eigen::Map<const Eigen::VectorXd, 0, Eigen::InnerStride<4>>;

struct SimulationTrace {
    std::vector<PeriodRecord> periods; // chronological, one per month
    double actual_term_years = 0.0;
    double final_scheduled_withdrawal = 0.0;

    int period_count() const { return static_cast<int>(periods.size()); }
    bool empty() const { return periods.empty(); }

    TraceColumn start_balance() const { return column(&PeriodRecord::start_balance); }
    TraceColumn end_balance() const { return column(&PeriodRecord::end_balance); }
    TraceColumn interest() const { return column(&PeriodRecord::interest_payment); }
    TraceColumn withdrawals() const { return column(&PeriodRecord::withdrawal); }

    double total_interest() const { return empty() ? 0.0 : interest().sum(); }
    double total_withdrawn() const { return empty() ? 0.0 : withdrawals().sum(); }

private:
    TraceColumn column(double PeriodRecord::* member) const {
        if (periods.empty()) return TraceColumn(nullptr, 0);
        return TraceColumn(&(periods.front().*member), period_count());
    }
};

struct AnnualRecord {
    double start_balance;
    double end_balance;
    double interest_payment; // bucket sum
    double withdrawal;       // bucket sum
    double total_interest;   // cumulative since month 0
    double total_withdrawn;  // cumulative since month 0
};

struct Summary {
    double total_interest = 0.0;
    double total_withdrawn = 0.0;
    double initial_annual_income = 0.0;
    double draw_down_pct = 0.0;
    double solved_value = 0.0;
};

} // namespace Annuity
