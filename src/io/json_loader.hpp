#pragma once
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <string>
#include <stdexcept>
#include "../Params.hpp"
#include "InputValidator.hpp"

namespace Annuity {

struct ReportOptions {
    std::string currency = "ZAR";
    bool show_monthly = false;
    std::string annual_csv;   // empty = don't write
    std::string monthly_csv;
    std::string result_json;
};

struct ScenarioConfig {
    std::string name = "Unnamed";
    SolveFor kind = SolveFor::Withdrawal;
    RawInput inputs;
    ReportOptions report;
    bool verbose = false;
};

class JsonLoader {
public:
    using json = nlohmann::json;

    static ScenarioConfig load_scenario(const std::string& filepath) {
        std::ifstream f(filepath);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open scenario file: " + filepath);
        }
        json data = json::parse(f);
        return from_json(data);
    }

    static ScenarioConfig parse_scenario(const std::string& text) {
        return from_json(json::parse(text));
    }

    static ScenarioConfig from_json(const json& data) {
        ScenarioConfig cfg;
        cfg.name = data.value("scenario_name", "Unnamed");

        std::cout << "[Annuity::IO] Loading scenario: " << cfg.name << std::endl;

        // 1. Calculation type: name or calc-type index
        if (data.contains("solve_for")) {
            const json& k = data["solve_for"];
            if (k.is_number_integer()) {
                cfg.kind = solve_for_from_index(k.get<int>());
            } else if (k.is_string()) {
                cfg.kind = solve_for_from_name(k.get<std::string>());
            } else {
                throw std::invalid_argument("solve_for must be a name or an index");
            }
        }

        // 2. Raw inputs. Numbers are kept as text so the validator sees what the user typed.
        if (data.contains("inputs")) {
            for (auto& [key, val] : data["inputs"].items()) {
                if (val.is_null()) continue;
                if (val.is_string()) {
                    cfg.inputs[key] = val.get<std::string>();
                } else if (val.is_number()) {
                    cfg.inputs[key] = val.dump();
                } else {
                    std::cerr << "[Annuity::IO] Ignoring non-scalar input '" << key << "'" << std::endl;
                }
            }
        }

        // 3. Output options
        if (data.contains("output")) {
            const json& out = data["output"];
            cfg.report.currency = out.value("currency", cfg.report.currency);
            cfg.report.show_monthly = out.value("show_monthly", cfg.report.show_monthly);
            cfg.report.annual_csv = out.value("annual_csv", "");
            cfg.report.monthly_csv = out.value("monthly_csv", "");
            cfg.report.result_json = out.value("result_json", "");
        }

        if (data.contains("solver")) {
            cfg.verbose = data["solver"].value("verbose", false);
        }

        std::cout << "[Annuity::IO] Solving for " << solve_for_name(cfg.kind)
                  << " (" << cfg.inputs.size() << " inputs)" << std::endl;
        return cfg;
    }
};

} // namespace Annuity
