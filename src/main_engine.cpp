#include <iostream>
#include <string>
#include <filesystem>

// Core Components
#include "Params.hpp"
#include "annuity/engine.h"
#include "io/json_loader.hpp"
#include "io/report.hpp"

int main(int argc, char* argv[]) {
    try {
        // 1. Setup & Load Config
        std::string config_path = (argc > 1) ? argv[1] : "scenario.json";
        std::cout << "=== Annuity Engine v1.0 ===" << std::endl;
        std::cout << "Config: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cerr << "Error: Config file not found: " << config_path << std::endl;
            return 1;
        }

        Annuity::ScenarioConfig cfg = Annuity::JsonLoader::load_scenario(config_path);

        // 2. Validate & Solve
        Annuity::AnnuityEngine::Options opts;
        opts.verbose = cfg.verbose;
        Annuity::AnnuityEngine engine(opts);

        Annuity::SolveResult res = engine.solve_raw(cfg.inputs, cfg.kind);
        Annuity::Currency currency = Annuity::Currency::from_code(cfg.report.currency);

        if (!res.ok()) {
            std::cerr << "\n" << Annuity::Report::error_message(res) << std::endl;
            if (!cfg.report.result_json.empty()) {
                Annuity::Report::write_json(cfg.report.result_json, res, false);
            }
            return 2;
        }

        // 3. Output
        std::cout << "\n--- Result ---" << std::endl;
        Annuity::Report::print_summary(std::cout, res, currency);

        std::cout << "\n--- Annual Schedule ---" << std::endl;
        Annuity::Report::print_annual(std::cout, res, currency);

        if (cfg.report.show_monthly) {
            std::cout << "\n--- Monthly Schedule ---" << std::endl;
            Annuity::Report::print_monthly(std::cout, res, currency);
        }

        if (!cfg.report.annual_csv.empty()) {
            Annuity::Report::write_csv_annual(cfg.report.annual_csv, res);
        }
        if (!cfg.report.monthly_csv.empty()) {
            Annuity::Report::write_csv_monthly(cfg.report.monthly_csv, res);
        }
        if (!cfg.report.result_json.empty()) {
            Annuity::Report::write_json(cfg.report.result_json, res, cfg.report.show_monthly);
        }

        std::cout << "\n=== Finished Successfully ===" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
