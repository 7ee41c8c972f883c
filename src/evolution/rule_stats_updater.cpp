#include "rule_stats_updater.hpp"
#include "../utils/logger.hpp"
#include <algorithm>
#include <set>
#include <sstream>
#include <stdexcept>

namespace Evo {

RuleUsage RuleUsage::collect(const std::vector<ExecutionReport>& reports) {
    RuleUsage usage;
    for (const auto& report : reports) {
        std::map<std::string, bool> outcome;
        for (const auto& entry : report.trace.entries) {
            if (!report.dag.has_node(entry.node_id)) continue;
            bool ok = report.dag.node(entry.node_id).status == NodeStatus::SUCCEEDED;
            auto it = outcome.find(entry.rule_id);
            if (it == outcome.end()) {
                outcome[entry.rule_id] = ok;
            } else {
                it->second = it->second && ok;
            }
        }
        for (const auto& kv : outcome) {
            if (kv.second) {
                usage.successes[kv.first]++;
            } else {
                usage.failures[kv.first]++;
            }
        }
    }
    return usage;
}

std::string StatsUpdate::summary() const {
    std::ostringstream out;
    out << reinforced.size() << " reinforced, " << decayed.size() << " decayed, "
        << cooled_down.size() << " cooled down, " << deprecated.size() << " deprecated";
    return out.str();
}

RuleStatsUpdater::RuleStatsUpdater(RuleStatsConfig config) : config_(config) {
    if (config_.decay_rate < 0.0 || config_.decay_rate > 1.0) {
        throw std::invalid_argument("decay_rate must lie in [0,1]");
    }
    if (config_.reinforcement_rate < 0.0 || config_.reinforcement_rate > 1.0) {
        throw std::invalid_argument("reinforcement_rate must lie in [0,1]");
    }
    if (config_.deprecate_after_cycles < 1) {
        throw std::invalid_argument("deprecate_after_cycles must be at least 1");
    }
}

StatsUpdate RuleStatsUpdater::update(const RuleSet& rules, const RuleUsage& usage) const {
    StatsUpdate result;
    std::vector<Rule> updated = rules.rules();
    auto now = std::chrono::system_clock::now();

    for (auto& rule : updated) {
        RuleMetadata& meta = rule.metadata;
        if (meta.status == RuleStatus::DEPRECATED) continue;
        const double before = meta.confidence;

        if (usage.used(rule.id)) {
            auto s = usage.successes.find(rule.id);
            auto f = usage.failures.find(rule.id);
            int wins = s == usage.successes.end() ? 0 : s->second;
            int losses = f == usage.failures.end() ? 0 : f->second;
            for (int i = 0; i < wins; ++i) {
                meta.confidence += config_.reinforcement_rate * (1.0 - meta.confidence);
            }
            for (int i = 0; i < losses; ++i) {
                meta.confidence += config_.reinforcement_rate * (0.0 - meta.confidence);
            }
            meta.success_count += wins;
            meta.failure_count += losses;
            result.reinforced.push_back(rule.id);
        } else {
            meta.confidence *= (1.0 - config_.decay_rate);
            if (meta.confidence != before) result.decayed.push_back(rule.id);
        }
        meta.confidence = std::min(1.0, std::max(0.0, meta.confidence));

        bool below = meta.confidence < config_.cooldown_threshold;
        bool lifecycle_changed = false;
        if (meta.status == RuleStatus::ACTIVE) {
            if (below) {
                meta.advance_status(RuleStatus::COOLDOWN);
                meta.below_threshold_cycles = 0;
                result.cooled_down.push_back(rule.id);
                lifecycle_changed = true;
            }
        } else if (meta.status == RuleStatus::COOLDOWN) {
            int previous = meta.below_threshold_cycles;
            meta.below_threshold_cycles = below ? previous + 1 : 0;
            lifecycle_changed = meta.below_threshold_cycles != previous;
            if (meta.below_threshold_cycles >= config_.deprecate_after_cycles) {
                meta.advance_status(RuleStatus::DEPRECATED);
                result.deprecated.push_back(rule.id);
                Logger::getInstance().info("Rule " + rule.id + " deprecated after " +
                                           std::to_string(meta.below_threshold_cycles) +
                                           " low-confidence cycles");
            }
        }

        if (meta.confidence != before || lifecycle_changed || usage.used(rule.id)) {
            meta.last_updated = now;
            result.changed = true;
        }
    }

    result.rules = RuleSet(updated);
    return result;
}

RuleHealthReport RuleStatsUpdater::health_report(const RuleSet& rules) const {
    RuleHealthReport report;
    report.total = rules.size();
    double confidence_sum = 0.0;
    size_t live = 0;
    for (const auto& rule : rules.rules()) {
        switch (rule.metadata.status) {
            case RuleStatus::ACTIVE: report.active++; break;
            case RuleStatus::COOLDOWN: report.cooldown++; break;
            case RuleStatus::DEPRECATED: report.deprecated++; break;
        }
        if (!rule.is_live()) continue;
        confidence_sum += rule.metadata.confidence;
        live++;
        if (rule.metadata.confidence < config_.cooldown_threshold * 2.0) {
            report.low_confidence.push_back(rule.id);
        }
    }
    report.average_confidence = live == 0 ? 0.0 : confidence_sum / static_cast<double>(live);
    return report;
}

} // namespace Evo
