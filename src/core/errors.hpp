#pragma once

#include <stdexcept>
#include <string>

namespace Evo {

// Base of every error the evolution loop raises.
class EvoError : public std::runtime_error {
public:
    explicit EvoError(const std::string& message) : std::runtime_error(message) {}
};

class DuplicateRuleId : public EvoError {
public:
    explicit DuplicateRuleId(const std::string& rule_id)
        : EvoError("Duplicate rule id: " + rule_id), rule_id_(rule_id) {}
    const std::string& rule_id() const { return rule_id_; }

private:
    std::string rule_id_;
};

class CyclicOrderConstraint : public EvoError {
public:
    explicit CyclicOrderConstraint(const std::string& message) : EvoError(message) {}
};

class UnsatisfiableGoal : public EvoError {
public:
    explicit UnsatisfiableGoal(const std::string& message) : EvoError(message) {}
};

class RuleConflict : public EvoError {
public:
    RuleConflict(const std::string& first_rule, const std::string& second_rule, const std::string& message)
        : EvoError(message), first_rule_(first_rule), second_rule_(second_rule) {}
    const std::string& first_rule() const { return first_rule_; }
    const std::string& second_rule() const { return second_rule_; }

private:
    std::string first_rule_;
    std::string second_rule_;
};

enum class FailureKind {
    MISSING_PRECONDITION,
    ORDERING_VIOLATION,
    TIMEOUT,
    CANCELLED,
    OTHER
};

const char* to_string(FailureKind kind);

// Raised by capabilities. The signature fields feed blame assignment.
class ActionFailure : public EvoError {
public:
    ActionFailure(FailureKind kind, const std::string& reason,
                  const std::string& state_key = "",
                  const std::string& expected_value = "",
                  const std::string& required_action = "")
        : EvoError(reason), kind_(kind), state_key_(state_key),
          expected_value_(expected_value), required_action_(required_action) {}

    FailureKind kind() const { return kind_; }
    const std::string& state_key() const { return state_key_; }
    const std::string& expected_value() const { return expected_value_; }
    const std::string& required_action() const { return required_action_; }

private:
    FailureKind kind_;
    std::string state_key_;
    std::string expected_value_;
    std::string required_action_;
};

class InvalidProposal : public EvoError {
public:
    explicit InvalidProposal(const std::string& message) : EvoError(message) {}
};

class BudgetExceeded : public EvoError {
public:
    explicit BudgetExceeded(const std::string& message) : EvoError(message) {}
};

class UnknownVersion : public EvoError {
public:
    explicit UnknownVersion(const std::string& version)
        : EvoError("Unknown world model version: " + version), version_(version) {}
    const std::string& version() const { return version_; }

private:
    std::string version_;
};

inline const char* to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::MISSING_PRECONDITION: return "MISSING_PRECONDITION";
        case FailureKind::ORDERING_VIOLATION: return "ORDERING_VIOLATION";
        case FailureKind::TIMEOUT: return "TIMEOUT";
        case FailureKind::CANCELLED: return "CANCELLED";
        case FailureKind::OTHER: return "OTHER";
    }
    return "OTHER";
}

} // namespace Evo
