#pragma once
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <stdexcept>
#include "../Params.hpp"
#include "../policy/SolverPolicies.hpp"

namespace Annuity {

const char* const kSearchFailedMessage = "Please check the input values are reasonable";
const char* const kTooLongMessage =
    "This annuity will last longer than 1000 years. Please increase the monthly withdrawal";

struct Currency {
    std::string symbol = "R";
    bool decimals = true;

    static Currency from_code(const std::string& code) {
        Currency c;
        if (code == "USD") c.symbol = "$";
        else if (code == "EUR") c.symbol = "€";
        else if (code == "GBP") c.symbol = "£";
        else if (code == "JPY") c.symbol = "¥";
        else if (code == "CHF") c.symbol = "CHF";
        else if (code == "CAD") c.symbol = "C$";
        else if (code == "AUD") c.symbol = "A$";
        else if (code == "CNY") c.symbol = "¥";
        else if (code == "INR") c.symbol = "₹";
        else if (code == "AED") c.symbol = "AED";
        else c.symbol = "R";
        c.decimals = code != "JPY";
        return c;
    }

    // "R 1,234,567.89"
    std::string format(double value) const {
        char buf[64];
        std::snprintf(buf, sizeof(buf), decimals ? "%.2f" : "%.0f", std::fabs(value));
        std::string digits(buf);
        std::string frac;
        auto dot = digits.find('.');
        if (dot != std::string::npos) {
            frac = digits.substr(dot);
            digits = digits.substr(0, dot);
        }
        std::string grouped;
        int count = 0;
        for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
            if (count > 0 && count % 3 == 0) grouped.insert(grouped.begin(), ',');
            grouped.insert(grouped.begin(), *it);
            ++count;
        }
        bool negative = value < 0.0 && std::string(buf).find_first_not_of("0.") != std::string::npos;
        return symbol + " " + (negative ? "-" : "") + grouped + frac;
    }
};

class Report {
public:
    static std::string fixed(double v, int decimals) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
        return buf;
    }

    static std::string headline(const SolveResult& res, const Currency& cur) {
        const Summary& s = res.summary;
        switch (res.kind) {
            case SolveFor::Withdrawal:
                return "Monthly Income: " + cur.format(s.solved_value) + ", increasing at "
                     + trim_number(res.resolved.annual_increase_pct) + "% per annum";
            case SolveFor::Term:
                return "Annuity Term: " + fixed(s.solved_value, 1) + " years";
            case SolveFor::Principal:
                return "Principal: " + cur.format(s.solved_value);
            case SolveFor::Rate:
                return "Interest Rate: " + trim_number(s.solved_value) + "%";
        }
        return "";
    }

    static std::string error_message(const SolveResult& res) {
        switch (res.status) {
            case SolveStatus::Ok:
                return "";
            case SolveStatus::SearchFailed:
                return kSearchFailedMessage;
            case SolveStatus::CalculationTooLong:
                return kTooLongMessage;
            case SolveStatus::MissingInput: {
                std::string msg = "Missing required input:";
                for (Field f : res.missing) msg += std::string(" ") + field_name(f);
                return msg;
            }
            case SolveStatus::InvalidInput: {
                std::string msg;
                for (const FieldError& e : res.field_errors) {
                    if (!msg.empty()) msg += "\n";
                    msg += e.message;
                }
                return msg;
            }
        }
        return "";
    }

    static void print_summary(std::ostream& os, const SolveResult& res, const Currency& cur) {
        const Summary& s = res.summary;
        os << headline(res, cur) << "\n";
        os << "Initial Annual Income: " << cur.format(s.initial_annual_income) << "\n";
        os << "Draw Down Percentage: " << fixed(s.draw_down_pct, 1) << "%\n";
        os << "Total Withdrawn: " << cur.format(s.total_withdrawn) << "\n";
        os << "Total Interest: " << cur.format(s.total_interest) << "\n";
    }

    static void print_annual(std::ostream& os, const SolveResult& res, const Currency& cur) {
        os << "Year | Start Balance | Interest | Withdrawal | End Balance\n";
        for (size_t y = 0; y < res.annual.size(); ++y) {
            const AnnualRecord& a = res.annual[y];
            os << (y + 1) << " | " << cur.format(a.start_balance) << " | " << cur.format(a.interest_payment)
               << " | " << cur.format(a.withdrawal) << " | " << cur.format(a.end_balance) << "\n";
        }
    }

    static void print_monthly(std::ostream& os, const SolveResult& res, const Currency& cur) {
        const auto& periods = res.trace.periods;
        const int n = static_cast<int>(periods.size());
        for (int i = 0; i < n; ++i) {
            const PeriodRecord& p = periods[i];
            os << (i + 1) << " | " << cur.format(p.start_balance) << " | " << cur.format(p.interest_payment)
               << " | " << cur.format(p.withdrawal) << " | " << cur.format(p.end_balance) << "\n";
            if ((i + 1) % kMonthsPerYear == 0 || i + 1 == n) {
                os << "-- Year #" << (i / kMonthsPerYear + 1) << " End --\n";
            }
        }
    }

    static void write_csv_annual(const std::string& filename, const SolveResult& res) {
        std::ofstream f(filename);
        if (!f.is_open()) throw std::runtime_error("Could not write " + filename);
        f << "year,start_balance,interest,withdrawal,end_balance,total_interest,total_withdrawn\n";
        for (size_t y = 0; y < res.annual.size(); ++y) {
            const AnnualRecord& a = res.annual[y];
            f << (y + 1) << "," << fixed(a.start_balance, 2) << "," << fixed(a.interest_payment, 2) << ","
              << fixed(a.withdrawal, 2) << "," << fixed(a.end_balance, 2) << ","
              << fixed(a.total_interest, 2) << "," << fixed(a.total_withdrawn, 2) << "\n";
        }
        std::cout << "[Annuity::IO] Wrote " << filename << std::endl;
    }

    static void write_csv_monthly(const std::string& filename, const SolveResult& res) {
        std::ofstream f(filename);
        if (!f.is_open()) throw std::runtime_error("Could not write " + filename);
        f << "month,year,start_balance,interest,withdrawal,end_balance\n";
        const auto& periods = res.trace.periods;
        for (size_t i = 0; i < periods.size(); ++i) {
            const PeriodRecord& p = periods[i];
            f << (i + 1) << "," << (i / kMonthsPerYear + 1) << "," << fixed(p.start_balance, 2) << ","
              << fixed(p.interest_payment, 2) << "," << fixed(p.withdrawal, 2) << ","
              << fixed(p.end_balance, 2) << "\n";
        }
        std::cout << "[Annuity::IO] Wrote " << filename << std::endl;
    }

    static nlohmann::json to_json(const SolveResult& res, bool include_monthly) {
        using json = nlohmann::json;
        json out;
        out["status"] = status_name(res.status);
        out["solve_for"] = solve_for_name(res.kind);

        if (!res.ok()) {
            out["message"] = error_message(res);
            json fields = json::array();
            for (Field f : res.missing) fields.push_back(field_name(f));
            for (const FieldError& e : res.field_errors) fields.push_back(field_name(e.field));
            out["fields"] = fields;
            return out;
        }

        const Summary& s = res.summary;
        out["summary"] = {
            {"solved_value", s.solved_value},
            {"total_interest", s.total_interest},
            {"total_withdrawn", s.total_withdrawn},
            {"initial_annual_income", s.initial_annual_income},
            {"draw_down_pct", s.draw_down_pct},
            {"term_years", res.trace.actual_term_years},
            {"final_monthly_withdrawal", res.trace.final_scheduled_withdrawal},
        };

        json annual = json::array();
        for (const AnnualRecord& a : res.annual) {
            annual.push_back({
                {"start_balance", a.start_balance},
                {"end_balance", a.end_balance},
                {"interest", a.interest_payment},
                {"withdrawal", a.withdrawal},
                {"total_interest", a.total_interest},
                {"total_withdrawn", a.total_withdrawn},
            });
        }
        out["annual"] = annual;

        if (include_monthly) {
            json monthly = json::array();
            for (const PeriodRecord& p : res.trace.periods) {
                monthly.push_back({p.start_balance, p.interest_payment, p.withdrawal, p.end_balance});
            }
            out["monthly"] = monthly;
        }
        return out;
    }

    static void write_json(const std::string& filename, const SolveResult& res, bool include_monthly) {
        std::ofstream f(filename);
        if (!f.is_open()) throw std::runtime_error("Could not write " + filename);
        f << to_json(res, include_monthly).dump(2) << "\n";
        std::cout << "[Annuity::IO] Wrote " << filename << std::endl;
    }

private:
    // 5 -> "5", 7.125 -> "7.125"
    static std::string trim_number(double v) {
        std::string s = fixed(v, 3);
        s.erase(s.find_last_not_of('0') + 1);
        if (!s.empty() && s.back() == '.') s.pop_back();
        return s;
    }
};

} // namespace Annuity
