#include "patch_applier.hpp"
#include "evolution_controller.hpp"
#include "../core/errors.hpp"
#include "../utils/logger.hpp"

namespace Evo {

PatchApplier::PatchApplier(VersionStore& store, EvolutionController* controller)
    : store_(store), controller_(controller) {}

SnapshotPtr PatchApplier::commit(const RuleSet& rules, AuditRecord record) {
    rules.validate();

    auto snapshot = std::make_shared<WorldModelSnapshot>();
    snapshot->version = store_.next_version_id();
    snapshot->parent_version = store_.current_version();
    snapshot->rules = rules;
    snapshot->created_at = std::chrono::system_clock::now();

    record.version = snapshot->version;
    record.parent_version = snapshot->parent_version;
    record.timestamp = snapshot->created_at;

    store_.insert_snapshot(snapshot);
    store_.append_audit(std::move(record));
    store_.set_current(snapshot->version);
    return snapshot;
}

SnapshotPtr PatchApplier::apply(const PatchProposal& proposal, const WorldModelDiff& diff) {
    if (controller_) {
        if (!controller_->is_approved(proposal)) {
            throw InvalidProposal("Proposal " + proposal.id + " is not an approved decision (stale or unselected)");
        }
        controller_->check_budget(diff);
    }

    SnapshotPtr base = store_.current();
    RuleSet patched = apply_edits(base->rules, proposal.edits);

    AuditRecord record;
    record.kind = AuditKind::PATCH;
    record.proposal = proposal;
    record.diff = diff;
    record.note = proposal.rationale;
    SnapshotPtr snapshot = commit(patched, std::move(record));

    if (controller_) {
        controller_->record_acceptance(proposal, diff);
    }
    Logger::getInstance().info("Applied " + proposal.id + " (" + proposal.provenance + "): " +
                               base->version + " -> " + snapshot->version);
    return snapshot;
}

SnapshotPtr PatchApplier::commit_maintenance(const RuleSet& rules, const std::string& note) {
    AuditRecord record;
    record.kind = AuditKind::MAINTENANCE;
    record.note = note;
    SnapshotPtr snapshot = commit(rules, std::move(record));
    Logger::getInstance().info("Maintenance commit " + snapshot->version + ": " + note);
    return snapshot;
}

void PatchApplier::rollback(const std::string& version) {
    if (!store_.contains(version)) {
        throw UnknownVersion(version);
    }
    AuditRecord record;
    record.kind = AuditKind::ROLLBACK;
    record.version = version;
    record.parent_version = store_.current_version();
    record.timestamp = std::chrono::system_clock::now();
    record.note = "rollback from " + store_.current_version();

    store_.append_audit(std::move(record));
    store_.set_current(version);
    Logger::getInstance().info("Rolled back to " + version);
}

} // namespace Evo
