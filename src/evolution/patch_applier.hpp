#pragma once

#include <string>
#include "../world/world_model.hpp"

namespace Evo {

class EvolutionController;

// The only writer of a VersionStore. Every commit builds the complete new
// snapshot and audit record first; the store is touched only once nothing can
// fail any more, so a failed call leaves the store exactly as it was.
class PatchApplier {
public:
    // `controller` may be null; proposals are then applied without the
    // approval and budget re-check.
    explicit PatchApplier(VersionStore& store, EvolutionController* controller = nullptr);

    // Commits current rules + proposal edits as a new version.
    // Throws InvalidProposal (stale decision, bad edits), BudgetExceeded,
    // CyclicOrderConstraint and DuplicateRuleId.
    SnapshotPtr apply(const PatchProposal& proposal, const WorldModelDiff& diff);

    // Commits rule statistics / lifecycle changes as a new version.
    SnapshotPtr commit_maintenance(const RuleSet& rules, const std::string& note);

    // Repoints the current version. History is never deleted. Throws UnknownVersion.
    void rollback(const std::string& version);

    const VersionStore& store() const { return store_; }

private:
    SnapshotPtr commit(const RuleSet& rules, AuditRecord record);

    VersionStore& store_;
    EvolutionController* controller_;
};

} // namespace Evo
