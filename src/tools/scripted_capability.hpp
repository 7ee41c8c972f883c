#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "../engine/capability.hpp"

namespace Evo {

// How one simulated action behaves.
struct ActionBehaviour {
    WorldState required_state;                  // key -> value; empty value means "must exist"
    std::vector<std::string> required_predecessors;
    WorldState effects;
    double cost_ms = 1.0;
    std::chrono::milliseconds delay{0};         // cooperative; aborts when the token stops
    std::string observation_kind = "ok";
};

// Deterministic stand-in for the browser and filesystem tools. Actions are
// matched by name; unknown actions succeed with cost 1 and no effects.
// Safe to call from concurrent engine workers.
class ScriptedCapability : public Capability {
public:
    ScriptedCapability() = default;

    void set_behaviour(const std::string& action, const ActionBehaviour& behaviour);

    Observation execute(const Action& action, const ExecutionContext& context) override;

    size_t call_count(const std::string& action) const;

    // Browser/filesystem behaviours used by the demo: opening pages, logging in,
    // filling and submitting search forms, extracting data and writing files.
    static std::shared_ptr<ScriptedCapability> web_environment();

private:
    mutable std::mutex mutex_;
    std::map<std::string, ActionBehaviour> behaviours_;
    std::map<std::string, size_t> calls_;
};

} // namespace Evo
