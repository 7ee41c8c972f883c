#pragma once

#include <chrono>
#include "../engine/execution_engine.hpp"
#include "../evolution/evolution_controller.hpp"
#include "../evolution/rule_stats_updater.hpp"
#include "../simulation/simulator.hpp"
#include "../utils/config_manager.hpp"

namespace Evo {

struct EvolutionSystemConfig {
    EngineConfig engine;
    PatchBudget budget;
    bool require_improvement = true;
    RuleStatsConfig stats;
    SpecializationConfig specialization;
    std::chrono::milliseconds advisor_timeout{2000};

    // Missing keys keep their defaults. Throws std::invalid_argument on
    // negative counts or sizes.
    static EvolutionSystemConfig from_config(const ConfigManager& config);
    void save_to(ConfigManager& config) const;
};

} // namespace Evo
