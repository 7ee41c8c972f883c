#include "system_config.hpp"

namespace Evo {

EvolutionSystemConfig EvolutionSystemConfig::from_config(const ConfigManager& config) {
    EvolutionSystemConfig out;

    out.engine.parallel = config.get_bool("engine.parallel", out.engine.parallel);
    out.engine.max_workers = config.get_size("engine.max_workers", out.engine.max_workers);
    out.engine.node_timeout = std::chrono::milliseconds(
        config.get_size("engine.node_timeout_ms", static_cast<size_t>(out.engine.node_timeout.count())));

    out.budget.window_length = config.get_size("budget.window_length", out.budget.window_length);
    out.budget.max_patches_per_window =
        config.get_size("budget.max_patches_per_window", out.budget.max_patches_per_window);
    out.budget.max_rule_count_increase =
        config.get_size("budget.max_rule_count_increase", out.budget.max_rule_count_increase);
    out.require_improvement = config.get_bool("controller.require_improvement", out.require_improvement);

    out.stats.decay_rate = config.get_double("stats.decay_rate", out.stats.decay_rate);
    out.stats.reinforcement_rate = config.get_double("stats.reinforcement_rate", out.stats.reinforcement_rate);
    out.stats.cooldown_threshold = config.get_double("stats.cooldown_threshold", out.stats.cooldown_threshold);
    out.stats.deprecate_after_cycles = config.get_int("stats.deprecate_after_cycles", out.stats.deprecate_after_cycles);

    out.specialization.condition_weight =
        config.get_double("specialization.condition_weight", out.specialization.condition_weight);
    out.specialization.order_weight =
        config.get_double("specialization.order_weight", out.specialization.order_weight);

    out.advisor_timeout = std::chrono::milliseconds(
        config.get_size("advisor.timeout_ms", static_cast<size_t>(out.advisor_timeout.count())));
    return out;
}

void EvolutionSystemConfig::save_to(ConfigManager& config) const {
    config.set_bool("engine.parallel", engine.parallel);
    config.set_size("engine.max_workers", engine.max_workers);
    config.set_size("engine.node_timeout_ms", static_cast<size_t>(engine.node_timeout.count()));
    config.set_size("budget.window_length", budget.window_length);
    config.set_size("budget.max_patches_per_window", budget.max_patches_per_window);
    config.set_size("budget.max_rule_count_increase", budget.max_rule_count_increase);
    config.set_bool("controller.require_improvement", require_improvement);
    config.set_double("stats.decay_rate", stats.decay_rate);
    config.set_double("stats.reinforcement_rate", stats.reinforcement_rate);
    config.set_double("stats.cooldown_threshold", stats.cooldown_threshold);
    config.set_int("stats.deprecate_after_cycles", stats.deprecate_after_cycles);
    config.set_double("specialization.condition_weight", specialization.condition_weight);
    config.set_double("specialization.order_weight", specialization.order_weight);
    config.set_size("advisor.timeout_ms", static_cast<size_t>(advisor_timeout.count()));
}

} // namespace Evo
