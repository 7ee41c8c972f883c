#include "world_model.hpp"
#include "../core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

namespace Evo {

const char* to_string(AuditKind kind) {
    switch (kind) {
        case AuditKind::PATCH: return "PATCH";
        case AuditKind::MAINTENANCE: return "MAINTENANCE";
        case AuditKind::ROLLBACK: return "ROLLBACK";
    }
    return "PATCH";
}

bool parse_audit_kind(const std::string& text, AuditKind& out) {
    static const AuditKind all[] = {AuditKind::PATCH, AuditKind::MAINTENANCE, AuditKind::ROLLBACK};
    for (AuditKind kind : all) {
        if (text == to_string(kind)) { out = kind; return true; }
    }
    return false;
}

VersionStore::VersionStore(const RuleSet& seed_rules) {
    seed_rules.validate();
    auto root = std::make_shared<WorldModelSnapshot>();
    root->version = "v0";
    root->rules = seed_rules;
    root->created_at = std::chrono::system_clock::now();
    insert_snapshot(root);
    current_version_ = "v0";
}

SnapshotPtr VersionStore::get(const std::string& version) const {
    auto it = index_.find(version);
    if (it == index_.end()) {
        throw UnknownVersion(version);
    }
    return snapshots_[it->second];
}

std::vector<std::string> VersionStore::lineage(const std::string& version) const {
    std::vector<std::string> chain;
    std::set<std::string> seen;
    SnapshotPtr snapshot = get(version);
    while (snapshot) {
        if (!seen.insert(snapshot->version).second) {
            throw std::runtime_error("Version graph contains a cycle at " + snapshot->version);
        }
        chain.push_back(snapshot->version);
        snapshot = snapshot->is_root() ? nullptr : get(snapshot->parent_version);
    }
    return chain;
}

std::vector<std::string> VersionStore::children(const std::string& version) const {
    if (!contains(version)) throw UnknownVersion(version);
    auto it = children_.find(version);
    return it == children_.end() ? std::vector<std::string>() : it->second;
}

std::vector<std::string> VersionStore::versions() const {
    std::vector<std::string> ids;
    ids.reserve(snapshots_.size());
    for (const auto& snapshot : snapshots_) ids.push_back(snapshot->version);
    return ids;
}

std::vector<std::string> VersionStore::patch_lineage(const std::string& version) const {
    std::vector<std::string> chain = lineage(version);
    std::set<std::string> on_path(chain.begin(), chain.end());
    std::vector<std::string> proposals;
    for (const auto& record : audit_log_) {
        if (record.kind == AuditKind::PATCH && on_path.count(record.version)) {
            proposals.push_back(record.proposal.id);
        }
    }
    return proposals;
}

std::string VersionStore::next_version_id() const {
    // One past the largest "v<n>" ever stored, so ids stay monotonic across gaps.
    size_t n = next_number_;
    std::string id = "v" + std::to_string(n);
    while (contains(id)) {
        id = "v" + std::to_string(++n);
    }
    return id;
}

void VersionStore::insert_snapshot(SnapshotPtr snapshot) {
    const std::string& id = snapshot->version;
    if (id.size() > 1 && id.size() < 19 && id[0] == 'v' &&
        std::all_of(id.begin() + 1, id.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        size_t number = std::stoull(id.substr(1));
        next_number_ = std::max(next_number_, number + 1);
    }
    index_[snapshot->version] = snapshots_.size();
    if (!snapshot->is_root()) {
        children_[snapshot->parent_version].push_back(snapshot->version);
    }
    snapshots_.push_back(std::move(snapshot));
}

void VersionStore::append_audit(AuditRecord record) {
    record.sequence = audit_log_.size();
    audit_log_.push_back(std::move(record));
}

std::unique_ptr<VersionStore> VersionStore::restore(const std::vector<WorldModelSnapshot>& snapshots,
                                                    const std::vector<AuditRecord>& audit,
                                                    const std::string& current_version) {
    VersionStore store{RestoreTag{}};

    size_t roots = 0;
    for (const auto& snapshot : snapshots) {
        if (snapshot.version.empty()) {
            throw std::runtime_error("Snapshot without a version id");
        }
        if (store.contains(snapshot.version)) {
            throw std::runtime_error("Duplicate snapshot version " + snapshot.version);
        }
        if (snapshot.is_root()) ++roots;
        store.insert_snapshot(std::make_shared<WorldModelSnapshot>(snapshot));
    }
    if (roots != 1) {
        throw std::runtime_error("Exported model must contain exactly one root version");
    }
    for (const auto& snapshot : snapshots) {
        if (!snapshot.is_root() && !store.contains(snapshot.parent_version)) {
            throw std::runtime_error("Version " + snapshot.version + " has unknown parent " +
                                     snapshot.parent_version);
        }
        store.lineage(snapshot.version);  // throws on cycles
    }
    if (!store.contains(current_version)) {
        throw UnknownVersion(current_version);
    }
    store.audit_log_ = audit;
    store.current_version_ = current_version;
    return std::make_unique<VersionStore>(std::move(store));
}

} // namespace Evo
