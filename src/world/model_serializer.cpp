#include "model_serializer.hpp"
#include "../core/errors.hpp"
#include "../utils/logger.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace Evo {

namespace {

const char* kFormatName = "evo-world-model";
const int kFormatVersion = 1;

const Json::Value& require_member(const Json::Value& obj, const char* field, const std::string& context) {
    if (!obj.isObject() || !obj.isMember(field)) {
        throw std::runtime_error(context + ": missing field '" + field + "'");
    }
    return obj[field];
}

std::string require_string(const Json::Value& obj, const char* field, const std::string& context) {
    const Json::Value& v = require_member(obj, field, context);
    if (!v.isString()) {
        throw std::runtime_error(context + ": field '" + field + "' must be a string");
    }
    return v.asString();
}

std::string optional_string(const Json::Value& obj, const char* field) {
    if (obj.isObject() && obj.isMember(field) && obj[field].isString()) {
        return obj[field].asString();
    }
    return "";
}

double optional_double(const Json::Value& obj, const char* field, double fallback) {
    if (obj.isObject() && obj.isMember(field) && obj[field].isNumeric()) {
        return obj[field].asDouble();
    }
    return fallback;
}

int optional_int(const Json::Value& obj, const char* field, int fallback, const std::string& context) {
    if (!obj.isObject() || !obj.isMember(field)) {
        return fallback;
    }
    if (!obj[field].isInt()) {
        throw std::runtime_error(context + ": field '" + field + "' must be an integer");
    }
    return obj[field].asInt();
}

std::vector<std::string> string_list(const Json::Value& arr, const std::string& context) {
    if (!arr.isArray()) {
        throw std::runtime_error(context + ": expected an array of strings");
    }
    std::vector<std::string> out;
    for (const auto& item : arr) {
        if (!item.isString()) {
            throw std::runtime_error(context + ": expected an array of strings");
        }
        out.push_back(item.asString());
    }
    return out;
}

Json::Value order_to_json(const OrderConstraint& order) {
    Json::Value out(Json::objectValue);
    out["action"] = order.action;
    Json::Value preds(Json::arrayValue);
    for (const auto& p : order.predecessors) preds.append(p);
    out["predecessors"] = preds;
    return out;
}

OrderConstraint order_from_json(const Json::Value& value, const std::string& context) {
    OrderConstraint order;
    order.action = require_string(value, "action", context);
    order.predecessors = string_list(require_member(value, "predecessors", context), context);
    return order;
}

Json::Value conditions_to_json(const std::vector<Condition>& conditions) {
    Json::Value arr(Json::arrayValue);
    for (const auto& c : conditions) arr.append(ModelSerializer::condition_to_json(c));
    return arr;
}

std::vector<Condition> conditions_from_json(const Json::Value& arr, const std::string& context) {
    if (!arr.isArray()) {
        throw std::runtime_error(context + ": conditions must be an array");
    }
    std::vector<Condition> out;
    for (const auto& item : arr) out.push_back(ModelSerializer::condition_from_json(item));
    return out;
}

} // namespace

int64_t ModelSerializer::to_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point ModelSerializer::from_millis(int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

Json::Value ModelSerializer::condition_to_json(const Condition& condition) {
    Json::Value out(Json::objectValue);
    out["key"] = condition.key;
    out["op"] = to_string(condition.op);
    out["value"] = condition.value;
    return out;
}

Condition ModelSerializer::condition_from_json(const Json::Value& value) {
    Condition condition;
    condition.key = require_string(value, "key", "condition");
    if (condition.key.empty()) {
        throw std::runtime_error("condition: key must not be empty");
    }
    std::string op = require_string(value, "op", "condition");
    if (!parse_condition_op(op, condition.op)) {
        throw std::runtime_error("condition: unknown operator '" + op + "'");
    }
    condition.value = optional_string(value, "value");
    return condition;
}

Json::Value ModelSerializer::rule_to_json(const Rule& rule) {
    Json::Value out(Json::objectValue);
    out["id"] = rule.id;
    out["kind"] = to_string(rule.kind);
    out["description"] = rule.description;
    out["scope"] = conditions_to_json(rule.scope);
    out["target_action"] = rule.target_action;
    out["requirements"] = conditions_to_json(rule.requirements);
    Json::Value produces(Json::objectValue);
    for (const auto& kv : rule.produces) produces[kv.first] = kv.second;
    out["produces"] = produces;
    if (!rule.order.empty()) out["order"] = order_to_json(rule.order);

    Json::Value meta(Json::objectValue);
    meta["success_count"] = rule.metadata.success_count;
    meta["failure_count"] = rule.metadata.failure_count;
    meta["confidence"] = rule.metadata.confidence;
    meta["status"] = to_string(rule.metadata.status);
    meta["last_updated"] = Json::Int64(to_millis(rule.metadata.last_updated));
    meta["below_threshold_cycles"] = rule.metadata.below_threshold_cycles;
    out["metadata"] = meta;
    return out;
}

Rule ModelSerializer::rule_from_json(const Json::Value& value) {
    Rule rule;
    rule.id = require_string(value, "id", "rule");
    const std::string context = "rule " + rule.id;
    std::string kind = require_string(value, "kind", context);
    if (!parse_rule_kind(kind, rule.kind)) {
        throw std::runtime_error(context + ": unknown kind '" + kind + "'");
    }
    rule.description = optional_string(value, "description");
    if (value.isMember("scope")) rule.scope = conditions_from_json(value["scope"], context);
    rule.target_action = optional_string(value, "target_action");
    if (value.isMember("requirements")) {
        rule.requirements = conditions_from_json(value["requirements"], context);
    }
    if (value.isMember("produces")) {
        const Json::Value& produces = value["produces"];
        if (!produces.isObject()) throw std::runtime_error(context + ": produces must be an object");
        for (const auto& key : produces.getMemberNames()) {
            if (!produces[key].isString()) {
                throw std::runtime_error(context + ": produced values must be strings");
            }
            rule.produces[key] = produces[key].asString();
        }
    }
    if (value.isMember("order")) rule.order = order_from_json(value["order"], context);

    switch (rule.kind) {
        case RuleKind::PRECONDITION:
            if (rule.target_action.empty() || rule.requirements.empty()) {
                throw std::runtime_error(context + ": precondition rules need target_action and requirements");
            }
            break;
        case RuleKind::EFFECT:
            if (rule.target_action.empty() || rule.produces.empty()) {
                throw std::runtime_error(context + ": effect rules need target_action and produces");
            }
            break;
        case RuleKind::ORDER:
            if (rule.order.empty() || rule.order.predecessors.empty()) {
                throw std::runtime_error(context + ": order rules need an order constraint");
            }
            break;
    }

    if (value.isMember("metadata")) {
        const Json::Value& meta = value["metadata"];
        if (!meta.isObject()) throw std::runtime_error(context + ": metadata must be an object");
        rule.metadata.success_count = optional_int(meta, "success_count", 0, context);
        rule.metadata.failure_count = optional_int(meta, "failure_count", 0, context);
        rule.metadata.confidence = optional_double(meta, "confidence", rule.metadata.confidence);
        if (rule.metadata.confidence < 0.0 || rule.metadata.confidence > 1.0) {
            throw std::runtime_error(context + ": confidence must lie in [0,1]");
        }
        std::string status = optional_string(meta, "status");
        if (!status.empty() && !parse_rule_status(status, rule.metadata.status)) {
            throw std::runtime_error(context + ": unknown status '" + status + "'");
        }
        if (meta.isMember("last_updated")) {
            if (!meta["last_updated"].isInt64()) {
                throw std::runtime_error(context + ": field 'last_updated' must be an integer");
            }
            rule.metadata.last_updated = from_millis(meta["last_updated"].asInt64());
        }
        rule.metadata.below_threshold_cycles = optional_int(meta, "below_threshold_cycles", 0, context);
    }
    return rule;
}

Json::Value ModelSerializer::edit_to_json(const PatchEdit& edit) {
    Json::Value out(Json::objectValue);
    out["kind"] = to_string(edit.kind);
    out["rule_id"] = edit.rule_id;
    switch (edit.kind) {
        case EditKind::ADD_CONDITION:
        case EditKind::NARROW_SCOPE:
            out["condition"] = condition_to_json(edit.condition);
            break;
        case EditKind::ADD_ORDER_CONSTRAINT:
            out["order"] = order_to_json(edit.order);
            break;
        case EditKind::ADD_RULE:
            out["rule"] = rule_to_json(edit.new_rule);
            break;
        case EditKind::DEPRECATE_RULE:
            break;
    }
    return out;
}

PatchEdit ModelSerializer::edit_from_json(const Json::Value& value) {
    try {
        PatchEdit edit;
        std::string kind = require_string(value, "kind", "edit");
        if (!parse_edit_kind(kind, edit.kind)) {
            throw InvalidProposal("edit: unknown kind '" + kind + "'");
        }
        switch (edit.kind) {
            case EditKind::ADD_CONDITION:
            case EditKind::NARROW_SCOPE:
                edit.rule_id = require_string(value, "rule_id", "edit");
                edit.condition = condition_from_json(require_member(value, "condition", "edit"));
                break;
            case EditKind::ADD_ORDER_CONSTRAINT:
                edit.rule_id = require_string(value, "rule_id", "edit");
                edit.order = order_from_json(require_member(value, "order", "edit"), "edit");
                if (edit.order.action.empty() || edit.order.predecessors.empty()) {
                    throw InvalidProposal("edit: order constraint needs action and predecessors");
                }
                break;
            case EditKind::DEPRECATE_RULE:
                edit.rule_id = require_string(value, "rule_id", "edit");
                break;
            case EditKind::ADD_RULE:
                edit.new_rule = rule_from_json(require_member(value, "rule", "edit"));
                edit.rule_id = edit.new_rule.id;
                break;
        }
        if (edit.rule_id.empty()) {
            throw InvalidProposal("edit: rule_id must not be empty");
        }
        return edit;
    } catch (const InvalidProposal&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw InvalidProposal(e.what());
    } catch (const Json::Exception& e) {
        throw InvalidProposal(std::string("edit: ") + e.what());
    }
}

Json::Value ModelSerializer::proposal_to_json(const PatchProposal& proposal) {
    Json::Value out(Json::objectValue);
    out["id"] = proposal.id;
    out["provenance"] = proposal.provenance;
    out["rationale"] = proposal.rationale;
    Json::Value edits(Json::arrayValue);
    for (const auto& edit : proposal.edits) edits.append(edit_to_json(edit));
    out["edits"] = edits;
    return out;
}

PatchProposal ModelSerializer::proposal_from_json(const Json::Value& value) {
    if (!value.isObject()) {
        throw InvalidProposal("proposal must be a JSON object");
    }
    PatchProposal proposal;
    proposal.id = optional_string(value, "id");
    proposal.provenance = optional_string(value, "provenance");
    proposal.rationale = optional_string(value, "rationale");
    if (!value.isMember("edits") || !value["edits"].isArray() || value["edits"].empty()) {
        throw InvalidProposal("proposal " + proposal.id + ": 'edits' must be a non-empty array");
    }
    for (const auto& item : value["edits"]) {
        proposal.edits.push_back(edit_from_json(item));
    }
    return proposal;
}

Json::Value ModelSerializer::diff_to_json(const WorldModelDiff& diff) {
    Json::Value out(Json::objectValue);
    out["rule_count_delta"] = diff.rule_count_delta;
    out["success_rate_delta"] = diff.success_rate_delta;
    out["specialization_delta"] = diff.specialization_delta;
    out["stability_delta"] = diff.stability_delta;
    out["execution_time_delta_ms"] = diff.execution_time_delta_ms;
    return out;
}

WorldModelDiff ModelSerializer::diff_from_json(const Json::Value& value) {
    WorldModelDiff diff;
    if (!value.isObject()) return diff;
    diff.rule_count_delta = optional_int(value, "rule_count_delta", 0, "diff");
    diff.success_rate_delta = optional_double(value, "success_rate_delta", 0.0);
    diff.specialization_delta = optional_double(value, "specialization_delta", 0.0);
    diff.stability_delta = optional_double(value, "stability_delta", 0.0);
    diff.execution_time_delta_ms = optional_double(value, "execution_time_delta_ms", 0.0);
    return diff;
}

Json::Value ModelSerializer::snapshot_to_json(const WorldModelSnapshot& snapshot) {
    Json::Value out(Json::objectValue);
    out["version"] = snapshot.version;
    out["parent_version"] = snapshot.is_root() ? Json::Value(Json::nullValue)
                                               : Json::Value(snapshot.parent_version);
    out["created_at"] = Json::Int64(to_millis(snapshot.created_at));
    Json::Value rules(Json::arrayValue);
    for (const auto& rule : snapshot.rules.rules()) rules.append(rule_to_json(rule));
    out["rules"] = rules;
    return out;
}

WorldModelSnapshot ModelSerializer::snapshot_from_json(const Json::Value& value) {
    WorldModelSnapshot snapshot;
    snapshot.version = require_string(value, "version", "snapshot");
    snapshot.parent_version = optional_string(value, "parent_version");
    snapshot.created_at = from_millis(value.get("created_at", 0).asInt64());
    const Json::Value& rules = require_member(value, "rules", "snapshot " + snapshot.version);
    if (!rules.isArray()) {
        throw std::runtime_error("snapshot " + snapshot.version + ": rules must be an array");
    }
    std::vector<Rule> parsed;
    for (const auto& item : rules) parsed.push_back(rule_from_json(item));
    snapshot.rules = RuleSet(parsed);
    return snapshot;
}

Json::Value ModelSerializer::audit_to_json(const AuditRecord& record) {
    Json::Value out(Json::objectValue);
    out["sequence"] = Json::UInt64(record.sequence);
    out["kind"] = to_string(record.kind);
    out["version"] = record.version;
    out["parent_version"] = record.parent_version;
    out["timestamp"] = Json::Int64(to_millis(record.timestamp));
    out["note"] = record.note;
    if (record.kind == AuditKind::PATCH) {
        out["proposal"] = proposal_to_json(record.proposal);
        out["diff"] = diff_to_json(record.diff);
    }
    return out;
}

AuditRecord ModelSerializer::audit_from_json(const Json::Value& value) {
    AuditRecord record;
    record.sequence = value.get("sequence", 0).asUInt64();
    std::string kind = require_string(value, "kind", "audit record");
    if (!parse_audit_kind(kind, record.kind)) {
        throw std::runtime_error("audit record: unknown kind '" + kind + "'");
    }
    record.version = require_string(value, "version", "audit record");
    record.parent_version = optional_string(value, "parent_version");
    record.timestamp = from_millis(value.get("timestamp", 0).asInt64());
    record.note = optional_string(value, "note");
    if (record.kind == AuditKind::PATCH) {
        record.proposal = proposal_from_json(require_member(value, "proposal", "audit record"));
        record.diff = diff_from_json(value["diff"]);
    }
    return record;
}

Json::Value ModelSerializer::export_store(const VersionStore& store) {
    Json::Value root(Json::objectValue);
    root["format"] = kFormatName;
    root["format_version"] = kFormatVersion;
    root["current_version"] = store.current_version();

    Json::Value versions(Json::arrayValue);
    for (const auto& id : store.versions()) {
        Json::Value entry = snapshot_to_json(*store.get(id));
        Json::Value lineage(Json::arrayValue);
        for (const auto& proposal_id : store.patch_lineage(id)) lineage.append(proposal_id);
        entry["patch_lineage"] = lineage;
        versions.append(entry);
    }
    root["versions"] = versions;

    Json::Value audit(Json::arrayValue);
    for (const auto& record : store.audit_log()) audit.append(audit_to_json(record));
    root["audit"] = audit;
    return root;
}

std::unique_ptr<VersionStore> ModelSerializer::import_store(const Json::Value& root) {
    if (require_string(root, "format", "model") != kFormatName) {
        throw std::runtime_error("model: unrecognised format");
    }
    std::vector<WorldModelSnapshot> snapshots;
    const Json::Value& versions = require_member(root, "versions", "model");
    if (!versions.isArray()) throw std::runtime_error("model: versions must be an array");
    for (const auto& item : versions) snapshots.push_back(snapshot_from_json(item));

    std::vector<AuditRecord> audit;
    if (root.isMember("audit")) {
        for (const auto& item : root["audit"]) audit.push_back(audit_from_json(item));
    }
    return VersionStore::restore(snapshots, audit, require_string(root, "current_version", "model"));
}

void ModelSerializer::write_file(const VersionStore& store, const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot open model file for writing: " + path);
    }
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(export_store(store), &out);
    out << std::endl;
    if (!out) {
        throw std::runtime_error("Failed writing model file: " + path);
    }
    Logger::getInstance().info("Exported world model (" + std::to_string(store.size()) +
                               " versions) to " + path);
}

std::unique_ptr<VersionStore> ModelSerializer::read_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open model file for reading: " + path);
    }
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, in, &root, &errors)) {
        throw std::runtime_error("Malformed model file " + path + ": " + errors);
    }
    try {
        return import_store(root);
    } catch (const Json::Exception& e) {
        throw std::runtime_error("Malformed model file " + path + ": " + e.what());
    }
}

} // namespace Evo
