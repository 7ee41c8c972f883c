#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <string>
#include "../dag/action_dag.hpp"
#include "../rules/rule.hpp"

namespace Evo {

// Result of a successful capability call.
struct Observation {
    std::string kind;
    std::string payload;
    WorldState state_updates;   // merged into the running state once the wave completes
    double cost_ms = 0.0;       // logical cost reported by the capability
};

// Cooperative cancellation shared between the engine and one capability call.
class CancellationToken {
public:
    CancellationToken() = default;
    explicit CancellationToken(std::chrono::milliseconds timeout)
        : has_deadline_(true), deadline_(std::chrono::steady_clock::now() + timeout) {}

    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }
    bool expired() const {
        return has_deadline_ && std::chrono::steady_clock::now() >= deadline_;
    }
    bool stop_requested() const { return cancelled() || expired(); }

private:
    std::atomic<bool> cancelled_{false};
    bool has_deadline_ = false;
    std::chrono::steady_clock::time_point deadline_{};
};

struct ExecutionContext {
    WorldState state;                        // state as of the start of the node's wave
    std::set<std::string> completed_actions; // action names that already SUCCEEDED
    std::shared_ptr<CancellationToken> token;
};

// The external layer actions are delegated to. Implementations must tolerate
// concurrent calls for independent nodes and report failures by throwing
// ActionFailure.
class Capability {
public:
    virtual ~Capability() = default;
    virtual Observation execute(const Action& action, const ExecutionContext& context) = 0;
};

} // namespace Evo
