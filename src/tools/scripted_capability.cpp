#include "scripted_capability.hpp"
#include "../core/errors.hpp"
#include <thread>

namespace Evo {

void ScriptedCapability::set_behaviour(const std::string& action, const ActionBehaviour& behaviour) {
    std::lock_guard<std::mutex> lock(mutex_);
    behaviours_[action] = behaviour;
}

Observation ScriptedCapability::execute(const Action& action, const ExecutionContext& context) {
    ActionBehaviour behaviour;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_[action.name]++;
        auto it = behaviours_.find(action.name);
        if (it != behaviours_.end()) {
            behaviour = it->second;
        }
    }

    if (behaviour.delay.count() > 0) {
        auto until = std::chrono::steady_clock::now() + behaviour.delay;
        while (std::chrono::steady_clock::now() < until) {
            if (context.token && context.token->stop_requested()) {
                FailureKind kind = context.token->expired() ? FailureKind::TIMEOUT : FailureKind::CANCELLED;
                throw ActionFailure(kind, action.name + " interrupted");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    for (const auto& kv : behaviour.required_state) {
        auto found = context.state.find(kv.first);
        bool ok = found != context.state.end() && (kv.second.empty() || found->second == kv.second);
        if (!ok) {
            throw ActionFailure(FailureKind::MISSING_PRECONDITION,
                                action.name + " requires " + kv.first +
                                (kv.second.empty() ? std::string(" to be set") : "=" + kv.second),
                                kv.first, kv.second);
        }
    }

    for (const auto& pred : behaviour.required_predecessors) {
        if (context.completed_actions.count(pred) == 0) {
            throw ActionFailure(FailureKind::ORDERING_VIOLATION,
                                action.name + " ran before " + pred, "", "", pred);
        }
    }

    Observation observation;
    observation.kind = behaviour.observation_kind;
    observation.payload = action.name;
    for (const auto& kv : action.params) {
        observation.payload += " " + kv.first + "=" + kv.second;
    }
    observation.state_updates = behaviour.effects;
    observation.cost_ms = behaviour.cost_ms;
    return observation;
}

size_t ScriptedCapability::call_count(const std::string& action) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calls_.find(action);
    return it == calls_.end() ? 0 : it->second;
}

std::shared_ptr<ScriptedCapability> ScriptedCapability::web_environment() {
    auto capability = std::make_shared<ScriptedCapability>();

    ActionBehaviour open;
    open.effects = {{"page.loaded", "true"}};
    open.cost_ms = 20.0;
    open.observation_kind = "page";
    capability->set_behaviour("browser.open", open);

    ActionBehaviour login;
    login.effects = {{"loggedIn", "true"}};
    login.cost_ms = 30.0;
    login.observation_kind = "session";
    capability->set_behaviour("auth.login", login);

    ActionBehaviour fill;
    fill.required_state = {{"page.loaded", "true"}};
    fill.effects = {{"form.filled", "true"}};
    fill.cost_ms = 5.0;
    capability->set_behaviour("browser.fill", fill);

    // Submitting before the field is filled posts an empty form.
    ActionBehaviour click;
    click.required_predecessors = {"browser.fill"};
    click.effects = {{"results.visible", "true"}};
    click.cost_ms = 5.0;
    capability->set_behaviour("browser.click", click);

    // Members-only data.
    ActionBehaviour extract;
    extract.required_state = {{"page.loaded", "true"}, {"loggedIn", "true"}};
    extract.effects = {{"data.extracted", "true"}};
    extract.cost_ms = 15.0;
    extract.observation_kind = "data";
    capability->set_behaviour("browser.extract", extract);

    ActionBehaviour write;
    write.required_state = {{"data.extracted", "true"}};
    write.effects = {{"file.written", "true"}};
    write.cost_ms = 10.0;
    write.observation_kind = "file";
    capability->set_behaviour("filesystem.write", write);

    return capability;
}

} // namespace Evo
