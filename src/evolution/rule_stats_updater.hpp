#pragma once

#include <map>
#include <string>
#include <vector>
#include "../engine/execution_engine.hpp"
#include "../rules/rule_set.hpp"

namespace Evo {

struct RuleStatsConfig {
    double decay_rate = 0.05;            // confidence *= (1 - decay_rate) per unused cycle
    double reinforcement_rate = 0.2;     // confidence += rate * (outcome - confidence) per use
    double cooldown_threshold = 0.2;
    int deprecate_after_cycles = 3;      // consecutive below-threshold cycles in COOLDOWN
};

// Per-rule outcomes observed during one cycle. A rule succeeded in a report
// when every node it produced or constrained SUCCEEDED.
struct RuleUsage {
    std::map<std::string, int> successes;
    std::map<std::string, int> failures;

    bool used(const std::string& rule_id) const {
        return successes.count(rule_id) > 0 || failures.count(rule_id) > 0;
    }

    static RuleUsage collect(const std::vector<ExecutionReport>& reports);
};

struct StatsUpdate {
    RuleSet rules;
    bool changed = false;
    std::vector<std::string> reinforced;
    std::vector<std::string> decayed;
    std::vector<std::string> cooled_down;
    std::vector<std::string> deprecated;

    std::string summary() const;
};

struct RuleHealthReport {
    size_t total = 0;
    size_t active = 0;
    size_t cooldown = 0;
    size_t deprecated = 0;
    double average_confidence = 0.0;     // over non-deprecated rules
    std::vector<std::string> low_confidence;
};

class RuleStatsUpdater {
public:
    explicit RuleStatsUpdater(RuleStatsConfig config = RuleStatsConfig());

    // Returns the updated copy; `rules` is untouched.
    StatsUpdate update(const RuleSet& rules, const RuleUsage& usage) const;

    RuleHealthReport health_report(const RuleSet& rules) const;

    const RuleStatsConfig& config() const { return config_; }

private:
    RuleStatsConfig config_;
};

} // namespace Evo
