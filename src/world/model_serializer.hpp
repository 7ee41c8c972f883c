#pragma once

#include <json/json.h>
#include <memory>
#include <string>
#include "world_model.hpp"

namespace Evo {

// JSON form of the persisted model: every version with its parent id and full
// rule list, the audit/patch lineage and the current pointer.
class ModelSerializer {
public:
    static Json::Value condition_to_json(const Condition& condition);
    static Condition condition_from_json(const Json::Value& value);

    static Json::Value rule_to_json(const Rule& rule);
    static Rule rule_from_json(const Json::Value& value);

    static Json::Value edit_to_json(const PatchEdit& edit);
    static Json::Value proposal_to_json(const PatchProposal& proposal);

    // Schema-checked. Throws InvalidProposal on any violation.
    static PatchEdit edit_from_json(const Json::Value& value);
    static PatchProposal proposal_from_json(const Json::Value& value);

    static Json::Value diff_to_json(const WorldModelDiff& diff);
    static WorldModelDiff diff_from_json(const Json::Value& value);

    static Json::Value snapshot_to_json(const WorldModelSnapshot& snapshot);
    static WorldModelSnapshot snapshot_from_json(const Json::Value& value);

    static Json::Value audit_to_json(const AuditRecord& record);
    static AuditRecord audit_from_json(const Json::Value& value);

    static Json::Value export_store(const VersionStore& store);
    static std::unique_ptr<VersionStore> import_store(const Json::Value& root);

    // Throw std::runtime_error on I/O or parse failures.
    static void write_file(const VersionStore& store, const std::string& path);
    static std::unique_ptr<VersionStore> read_file(const std::string& path);

    static int64_t to_millis(std::chrono::system_clock::time_point tp);
    static std::chrono::system_clock::time_point from_millis(int64_t ms);
};

} // namespace Evo
