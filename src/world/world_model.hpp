#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "../rules/patch.hpp"
#include "../rules/rule_set.hpp"

namespace Evo {

// Immutable once constructed. Changes always produce a new snapshot.
struct WorldModelSnapshot {
    std::string version;
    std::string parent_version;   // empty for the root "v0"
    RuleSet rules;
    std::chrono::system_clock::time_point created_at;

    bool is_root() const { return parent_version.empty(); }
};

using SnapshotPtr = std::shared_ptr<const WorldModelSnapshot>;

// Derived per-metric difference (patched - baseline). Never persisted on its own.
struct WorldModelDiff {
    int rule_count_delta = 0;
    double success_rate_delta = 0.0;
    double specialization_delta = 0.0;
    double stability_delta = 0.0;
    double execution_time_delta_ms = 0.0;
};

enum class AuditKind {
    PATCH,        // accepted proposal committed
    MAINTENANCE,  // rule statistics / lifecycle update
    ROLLBACK      // current pointer moved to an existing version
};

struct AuditRecord {
    uint64_t sequence = 0;
    AuditKind kind = AuditKind::PATCH;
    std::string version;          // version current after this record
    std::string parent_version;   // version current before this record
    PatchProposal proposal;       // PATCH only
    WorldModelDiff diff;          // PATCH only
    std::chrono::system_clock::time_point timestamp;
    std::string note;
};

const char* to_string(AuditKind kind);
bool parse_audit_kind(const std::string& text, AuditKind& out);

class PatchApplier;

// Arena of every snapshot ever committed, indexed by version id, plus the
// current-version pointer and the append-only audit trail. Readable by anyone;
// only PatchApplier can write.
class VersionStore {
public:
    // Creates the store holding the root snapshot "v0".
    explicit VersionStore(const RuleSet& seed_rules = RuleSet());

    SnapshotPtr current() const { return get(current_version_); }
    const std::string& current_version() const { return current_version_; }

    // Throws UnknownVersion.
    SnapshotPtr get(const std::string& version) const;
    bool contains(const std::string& version) const { return index_.count(version) > 0; }

    // Versions from `version` back to the root, inclusive. Throws UnknownVersion.
    std::vector<std::string> lineage(const std::string& version) const;
    std::vector<std::string> children(const std::string& version) const;
    std::vector<std::string> versions() const;
    size_t size() const { return snapshots_.size(); }

    const std::vector<AuditRecord>& audit_log() const { return audit_log_; }

    // Proposal ids of the PATCH records along the lineage of `version`, oldest first.
    std::vector<std::string> patch_lineage(const std::string& version) const;

    // Rebuilds a store from persisted data. Every parent must resolve and the
    // parent graph must terminate at a single root. Throws std::runtime_error.
    static std::unique_ptr<VersionStore> restore(const std::vector<WorldModelSnapshot>& snapshots,
                                                 const std::vector<AuditRecord>& audit,
                                                 const std::string& current_version);

private:
    friend class PatchApplier;

    struct RestoreTag {};
    explicit VersionStore(RestoreTag) {}

    std::string next_version_id() const;
    void insert_snapshot(SnapshotPtr snapshot);
    void set_current(const std::string& version) { current_version_ = version; }
    void append_audit(AuditRecord record);

    std::vector<SnapshotPtr> snapshots_;
    std::unordered_map<std::string, size_t> index_;
    std::unordered_map<std::string, std::vector<std::string>> children_;
    std::vector<AuditRecord> audit_log_;
    std::string current_version_;
    size_t next_number_ = 0;
};

} // namespace Evo
