#pragma once

#include <memory>
#include <string>
#include <vector>
#include "action_dag.hpp"
#include "../rules/rule_set.hpp"

namespace Evo {

struct Goal {
    std::string description;
};

// One action of a decomposed goal and the indices of earlier steps it waits for.
struct SeedStep {
    Action action;
    std::vector<size_t> depends_on;
};

// Turns a goal into its seed action sequence. One implementation per goal kind.
class GoalDecomposer {
public:
    virtual ~GoalDecomposer() = default;
    virtual std::string name() const = 0;
    virtual bool matches(const Goal& goal) const = 0;
    virtual std::vector<SeedStep> decompose(const Goal& goal) const = 0;
};

class BrowseDecomposer : public GoalDecomposer {
public:
    std::string name() const override { return "browse"; }
    bool matches(const Goal& goal) const override;
    std::vector<SeedStep> decompose(const Goal& goal) const override;
};

class SearchDecomposer : public GoalDecomposer {
public:
    std::string name() const override { return "search"; }
    bool matches(const Goal& goal) const override;
    std::vector<SeedStep> decompose(const Goal& goal) const override;
};

class ExtractDecomposer : public GoalDecomposer {
public:
    std::string name() const override { return "extract"; }
    bool matches(const Goal& goal) const override;
    std::vector<SeedStep> decompose(const Goal& goal) const override;
};

class GenericDecomposer : public GoalDecomposer {
public:
    std::string name() const override { return "generic"; }
    bool matches(const Goal&) const override { return true; }
    std::vector<SeedStep> decompose(const Goal& goal) const override;
};

struct BuildResult {
    ActionDAG dag;
    BuildTrace trace;
    std::string decomposer;
};

// Compiles a goal plus the current rules into an executable ActionDAG.
//
// Precondition rules targeting a planned action inject producer nodes (found
// through EFFECT rules) for every requirement the initial state does not
// already satisfy. Order constraints then add edges between planned actions.
// Node ids are assigned in insertion order, so identical inputs always give
// identical graphs.
class DagBuilder {
public:
    DagBuilder();

    // Custom decomposers are consulted before the built-in ones, in registration order.
    void register_decomposer(std::shared_ptr<const GoalDecomposer> decomposer);

    // Throws UnsatisfiableGoal and RuleConflict.
    BuildResult build(const Goal& goal, const RuleSet& rules, const WorldState& initial_state) const;

    const GoalDecomposer& select_decomposer(const Goal& goal) const;

private:
    std::vector<std::shared_ptr<const GoalDecomposer>> custom_;
    std::vector<std::shared_ptr<const GoalDecomposer>> builtin_;
};

} // namespace Evo
