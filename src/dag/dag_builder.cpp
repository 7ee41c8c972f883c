#include "dag_builder.hpp"
#include "../core/errors.hpp"
#include "../utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <map>

namespace Evo {

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool contains_any(const std::string& text, const std::vector<std::string>& words) {
    std::string lower = lowercase(text);
    return std::any_of(words.begin(), words.end(),
                       [&lower](const std::string& w) { return lower.find(w) != std::string::npos; });
}

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n";
    size_t begin = text.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}

// Text following the first occurrence of `marker`, or `fallback`.
std::string text_after(const std::string& text, const std::string& marker, const std::string& fallback) {
    std::string lower = lowercase(text);
    size_t pos = lower.find(marker);
    if (pos == std::string::npos) return fallback;
    std::string rest = trim(text.substr(pos + marker.size()));
    return rest.empty() ? fallback : rest;
}

std::string last_word(const std::string& text) {
    std::string t = trim(text);
    size_t pos = t.find_last_of(" ");
    return pos == std::string::npos ? t : t.substr(pos + 1);
}

} // namespace

bool BrowseDecomposer::matches(const Goal& goal) const {
    return contains_any(goal.description, {"browse", "navigate", "visit"});
}

std::vector<SeedStep> BrowseDecomposer::decompose(const Goal& goal) const {
    std::string url = text_after(goal.description, " to ", last_word(goal.description));
    return {SeedStep{Action{"browser.open", {{"url", url}}}, {}}};
}

bool SearchDecomposer::matches(const Goal& goal) const {
    return contains_any(goal.description, {"search", "look up"});
}

std::vector<SeedStep> SearchDecomposer::decompose(const Goal& goal) const {
    std::string query = text_after(goal.description, " for ", last_word(goal.description));
    // The submit click only waits for the page; field ordering is left to rules.
    return {
        SeedStep{Action{"browser.open", {{"url", "search"}}}, {}},
        SeedStep{Action{"browser.fill", {{"selector", "#search"}, {"value", query}}}, {0}},
        SeedStep{Action{"browser.click", {{"selector", "#search-button"}}}, {0}},
    };
}

bool ExtractDecomposer::matches(const Goal& goal) const {
    return contains_any(goal.description, {"extract", "scrape"});
}

std::vector<SeedStep> ExtractDecomposer::decompose(const Goal& goal) const {
    std::string url = text_after(goal.description, " from ", "data");
    return {
        SeedStep{Action{"browser.open", {{"url", url}}}, {}},
        SeedStep{Action{"browser.extract", {{"selector", ".data-container"}}}, {0}},
        SeedStep{Action{"filesystem.write", {{"path", "extracted.txt"}}}, {1}},
    };
}

std::vector<SeedStep> GenericDecomposer::decompose(const Goal& goal) const {
    return {SeedStep{Action{"generic.execute", {{"goal", goal.description}}}, {}}};
}

DagBuilder::DagBuilder() {
    builtin_.push_back(std::make_shared<BrowseDecomposer>());
    builtin_.push_back(std::make_shared<SearchDecomposer>());
    builtin_.push_back(std::make_shared<ExtractDecomposer>());
    builtin_.push_back(std::make_shared<GenericDecomposer>());
}

void DagBuilder::register_decomposer(std::shared_ptr<const GoalDecomposer> decomposer) {
    custom_.push_back(std::move(decomposer));
}

const GoalDecomposer& DagBuilder::select_decomposer(const Goal& goal) const {
    for (const auto& d : custom_) {
        if (d->matches(goal)) return *d;
    }
    for (const auto& d : builtin_) {
        if (d->matches(goal)) return *d;
    }
    return *builtin_.back();
}

namespace {

struct Requirement {
    Condition condition;
    std::string rule_id;
};

class BuildSession {
public:
    BuildSession(BuildResult& result, const std::vector<const Rule*>& applicable, const WorldState& state)
        : result_(result), applicable_(applicable), state_(state) {}

    void resolve_preconditions(const std::string& node_id) {
        const std::string action = result_.dag.node(node_id).action.name;
        for (const Rule* rule : applicable_) {
            if (rule->kind != RuleKind::PRECONDITION || rule->target_action != action) continue;
            for (const auto& requirement : rule->requirements) {
                register_requirement(requirement, rule->id);
                if (requirement.evaluate(state_)) continue;
                satisfy(node_id, action, requirement, *rule);
            }
        }
    }

    void apply_order_constraints() {
        for (const Rule* rule : applicable_) {
            if (rule->order.empty()) continue;
            for (const auto& target : result_.dag.nodes_for_action(rule->order.action)) {
                for (const auto& pred_action : rule->order.predecessors) {
                    for (const auto& pred : result_.dag.nodes_for_action(pred_action)) {
                        if (pred == target || result_.dag.has_edge(pred, target)) continue;
                        if (!result_.dag.add_edge(pred, target)) {
                            throw RuleConflict(rule->id, "goal",
                                               "Rule " + rule->id + " orders " + pred_action + " before " +
                                               rule->order.action + ", contradicting the planned sequence");
                        }
                        result_.trace.record(target, rule->id, TraceRelation::CONSTRAINED,
                                             "must run after " + pred_action + " (" + pred + ")");
                    }
                }
            }
        }
    }

private:
    void register_requirement(const Condition& condition, const std::string& rule_id) {
        auto& seen = requirements_[condition.key];
        for (const auto& existing : seen) {
            if (existing.rule_id != rule_id && existing.condition.contradicts(condition)) {
                throw RuleConflict(existing.rule_id, rule_id,
                                   "Rules " + existing.rule_id + " and " + rule_id +
                                   " impose contradictory requirements on '" + condition.key + "': " +
                                   existing.condition.to_string() + " vs " + condition.to_string());
            }
        }
        seen.push_back({condition, rule_id});
    }

    const Rule* find_producer(const Condition& requirement) const {
        for (const Rule* rule : applicable_) {
            if (rule->kind != RuleKind::EFFECT) continue;
            for (const auto& kv : rule->produces) {
                if (requirement.satisfied_by(kv.first, kv.second)) return rule;
            }
        }
        return nullptr;
    }

    void satisfy(const std::string& node_id, const std::string& action,
                 const Condition& requirement, const Rule& rule) {
        const Rule* producer = find_producer(requirement);
        if (!producer) {
            throw UnsatisfiableGoal("No action establishes " + requirement.to_string() + " required by rule " +
                                    rule.id + " before " + action);
        }

        // Reuse a planned producer unless it already depends on this node.
        for (const auto& existing : result_.dag.nodes_for_action(producer->target_action)) {
            if (existing == node_id || result_.dag.has_path(node_id, existing)) continue;
            if (!result_.dag.has_edge(existing, node_id)) {
                result_.dag.add_edge(existing, node_id);
            }
            result_.trace.record(node_id, rule.id, TraceRelation::CONSTRAINED,
                                 "needs " + requirement.to_string() + ", established by " + existing);
            return;
        }

        std::vector<std::string> chain = chains_[node_id];
        chain.push_back(action);
        if (std::find(chain.begin(), chain.end(), producer->target_action) != chain.end()) {
            throw UnsatisfiableGoal("Circular precondition: " + producer->target_action +
                                    " is needed to establish its own prerequisites");
        }

        std::string injected = result_.dag.add_node(Action{producer->target_action, {}});
        result_.dag.add_edge(injected, node_id);
        chains_[injected] = chain;

        result_.trace.record(injected, rule.id, TraceRelation::PRODUCED,
                             "injected to establish " + requirement.to_string() + " before " + action);
        result_.trace.record(injected, producer->id, TraceRelation::PRODUCED,
                             producer->target_action + " declares " + requirement.key);
        result_.trace.record(node_id, rule.id, TraceRelation::CONSTRAINED,
                             "needs " + requirement.to_string() + ", established by " + injected);
        Logger::getInstance().debug("Injected " + producer->target_action + " as " + injected +
                                    " for rule " + rule.id);
    }

    BuildResult& result_;
    const std::vector<const Rule*>& applicable_;
    const WorldState& state_;
    std::map<std::string, std::vector<Requirement>> requirements_;
    std::map<std::string, std::vector<std::string>> chains_;
};

} // namespace

BuildResult DagBuilder::build(const Goal& goal, const RuleSet& rules, const WorldState& initial_state) const {
    const GoalDecomposer& decomposer = select_decomposer(goal);
    std::vector<SeedStep> seeds = decomposer.decompose(goal);
    if (seeds.empty()) {
        throw UnsatisfiableGoal("Goal '" + goal.description + "' decomposes to no actions");
    }

    BuildResult result;
    result.decomposer = decomposer.name();

    std::vector<std::string> seed_ids;
    for (size_t i = 0; i < seeds.size(); ++i) {
        std::vector<std::string> preds;
        for (size_t dep : seeds[i].depends_on) {
            if (dep >= i) {
                throw UnsatisfiableGoal("Decomposer " + decomposer.name() + " produced a forward dependency");
            }
            preds.push_back(seed_ids[dep]);
        }
        seed_ids.push_back(result.dag.add_node(seeds[i].action, preds));
    }

    std::vector<const Rule*> applicable = rules.applicable_rules(initial_state);
    BuildSession session(result, applicable, initial_state);

    // The node list grows while injected producers are resolved in turn.
    for (size_t i = 0; i < result.dag.size(); ++i) {
        std::string node_id = result.dag.nodes()[i].id;
        session.resolve_preconditions(node_id);
    }
    session.apply_order_constraints();
    result.dag.validate();

    Logger::getInstance().debug("Built DAG for '" + goal.description + "' via " + decomposer.name() +
                                ": " + std::to_string(result.dag.size()) + " nodes, " +
                                std::to_string(result.trace.size()) + " trace entries");
    return result;
}

} // namespace Evo
