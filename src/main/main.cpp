#include <iostream>
#include <string>
#include <vector>

#include "../core/errors.hpp"
#include "../system/evolution_system.hpp"
#include "../tools/scripted_capability.hpp"
#include "../utils/config_manager.hpp"
#include "../utils/logger.hpp"

using namespace Evo;

namespace {

void print_state(const SystemState& state) {
    std::cout << "  version:  " << state.current_version << " (" << state.version_count << " recorded)\n";
    std::cout << "  rules:    ";
    for (const auto& kv : state.rules_by_status) {
        std::cout << to_string(kv.first) << "=" << kv.second << " ";
    }
    std::cout << "\n  budget:   " << state.budget.patches_used << "/"
              << (state.budget.patches_used + state.budget.patches_available) << " patches, "
              << state.budget.rule_growth_used << "/"
              << (state.budget.rule_growth_used + state.budget.rule_growth_available) << " rule growth\n";
    std::cout << "  health:   avg confidence " << state.health.average_confidence << ", "
              << state.health.low_confidence.size() << " low-confidence rule(s)\n";
}

} // namespace

/**
 * Evo demo
 *
 * Runs the self-evolving loop against the scripted web environment.
 * The search task fails until the loop learns that the submit click must wait
 * for the form to be filled; extraction fails until it learns that the data
 * sits behind a login.
 *
 * Usage: evo_demo [cycles] [export_path]
 */
int main(int argc, char** argv) {
    int cycles = argc > 1 ? std::stoi(argv[1]) : 4;
    std::string export_path = argc > 2 ? argv[2] : "evo_model.json";

    ConfigManager config;
    config.load_config();
    if (config.has_key("log.level")) {
        Logger::getInstance().setLogLevel(config.get_string("log.level"));
    }
    EvolutionSystemConfig system_config = EvolutionSystemConfig::from_config(config);

    RuleSet seed;
    seed.add_rule(Rule::effect("effect-login", "auth.login", {{"loggedIn", "true"}},
                               "logging in establishes a session"));

    EvolutionSystem system(ScriptedCapability::web_environment(), seed, system_config);

    std::vector<TaskSpec> tasks = {
        {"browse-home", Goal{"browse to example.com"}, {}},
        {"search-docs", Goal{"search for evolution docs"}, {}},
        {"extract-prices", Goal{"extract prices from shop.example"}, {}},
    };

    std::cout << "=== Evo self-evolving loop ===" << std::endl;
    print_state(system.system_state());

    for (int i = 0; i < cycles; ++i) {
        CycleReport report = system.evolve_step(tasks);
        std::cout << "\n--- cycle " << report.cycle << ": " << report.start_version << " -> "
                  << report.end_version << " ---\n";
        for (const auto& r : report.reports) {
            std::cout << "  " << r.task_id << ": " << to_string(r.status) << "\n";
        }
        for (const auto& id : report.applied) {
            std::cout << "  applied " << id << "\n";
        }
        for (const auto& rejection : report.decision.rejected) {
            std::cout << "  rejected " << rejection.proposal_id << " (" << to_string(rejection.reason) << ")\n";
        }
        std::cout << "  stats: " << report.stats_summary << "\n";
    }

    std::cout << "\n=== Final state ===" << std::endl;
    print_state(system.system_state());

    try {
        system.export_model(export_path);
        std::cout << "Model exported to " << export_path << std::endl;
    } catch (const std::runtime_error& e) {
        Logger::getInstance().error(std::string("Export failed: ") + e.what());
        return 1;
    }
    return 0;
}
