#include "execution_engine.hpp"
#include "../utils/logger.hpp"
#include <algorithm>
#include <future>
#include <stdexcept>
#include <thread>

namespace Evo {

const char* to_string(ReportStatus status) {
    switch (status) {
        case ReportStatus::SUCCESS: return "SUCCESS";
        case ReportStatus::PARTIAL: return "PARTIAL";
        case ReportStatus::FAILURE: return "FAILURE";
    }
    return "FAILURE";
}

size_t ExecutionReport::count(NodeStatus node_status) const {
    return static_cast<size_t>(std::count_if(dag.nodes().begin(), dag.nodes().end(),
                                              [node_status](const ActionNode& n) { return n.status == node_status; }));
}

Engine::Engine(std::shared_ptr<Capability> capability, EngineConfig config)
    : capability_(std::move(capability)), config_(config) {
    if (!capability_) {
        throw std::invalid_argument("Engine requires a capability");
    }
    if (config_.max_workers == 0) {
        config_.max_workers = 1;
    }
}

Engine::NodeOutcome Engine::run_node(Capability& capability, const Action& action, const ExecutionContext& context) {
    NodeOutcome outcome;
    try {
        outcome.observation = capability.execute(action, context);
        outcome.succeeded = true;
    } catch (const ActionFailure& e) {
        outcome.failure = {e.kind(), e.what(), e.state_key(), e.expected_value(), e.required_action()};
    } catch (const std::exception& e) {
        outcome.failure.kind = FailureKind::OTHER;
        outcome.failure.reason = e.what();
    }
    return outcome;
}

std::vector<Engine::NodeOutcome> Engine::run_wave(const ActionDAG& dag, const std::vector<std::string>& wave,
                                                  const WorldState& state,
                                                  const std::set<std::string>& completed) const {
    std::vector<NodeOutcome> outcomes;
    outcomes.reserve(wave.size());
    const size_t batch = config_.parallel ? config_.max_workers : 1;
    const bool timed = config_.node_timeout.count() > 0;

    for (size_t start = 0; start < wave.size(); start += batch) {
        size_t end = std::min(start + batch, wave.size());
        std::vector<std::shared_ptr<CancellationToken>> tokens;
        std::vector<std::future<NodeOutcome>> futures;
        auto launched = std::chrono::steady_clock::now();

        for (size_t i = start; i < end; ++i) {
            ExecutionContext context;
            context.state = state;
            context.completed_actions = completed;
            context.token = timed ? std::make_shared<CancellationToken>(config_.node_timeout)
                                  : std::make_shared<CancellationToken>();
            tokens.push_back(context.token);
            Action action = dag.node(wave[i]).action;
            // Detached so that a call ignoring its token cannot hold the wave past the deadline.
            std::shared_ptr<Capability> capability = capability_;
            auto task = std::make_shared<std::packaged_task<NodeOutcome()>>(
                [capability, action, context]() { return run_node(*capability, action, context); });
            futures.push_back(task->get_future());
            std::thread([task]() { (*task)(); }).detach();
        }

        for (size_t i = 0; i < futures.size(); ++i) {
            NodeOutcome outcome;
            bool timed_out = false;
            if (timed &&
                futures[i].wait_until(launched + config_.node_timeout) != std::future_status::ready) {
                tokens[i]->cancel();
                timed_out = true;
            } else {
                outcome = futures[i].get();
                timed_out = !outcome.succeeded && tokens[i]->expired();
            }
            if (timed_out) {
                outcome.succeeded = false;
                outcome.failure = FailureInfo{};
                outcome.failure.kind = FailureKind::TIMEOUT;
                outcome.failure.reason = "Node " + wave[start + i] + " exceeded " +
                                         std::to_string(config_.node_timeout.count()) + "ms";
            }
            outcomes.push_back(outcome);
        }
    }
    return outcomes;
}

ExecutionReport Engine::execute(const std::string& task_id, const BuildResult& build,
                                const WorldState& initial_state, const std::string& version) const {
    ExecutionReport report;
    report.task_id = task_id;
    report.version = version;
    report.dag = build.dag;
    report.trace = build.trace;
    report.final_state = initial_state;

    ActionDAG& dag = report.dag;
    std::set<std::string> completed;

    auto transition = [&report, &dag](const std::string& node_id, NodeStatus status, const std::string& detail) {
        ActionNode& node = dag.node(node_id);
        node.status = status;
        report.events.push_back({std::chrono::system_clock::now(), node_id, node.action.name, status, detail});
    };

    while (true) {
        // Cascade skips until no pending node has a failed or skipped predecessor.
        bool skipped_any = true;
        while (skipped_any) {
            skipped_any = false;
            for (const auto& node : dag.nodes()) {
                if (node.status != NodeStatus::PENDING) continue;
                for (const auto& pred : node.predecessors) {
                    NodeStatus ps = dag.node(pred).status;
                    if (ps == NodeStatus::FAILED || ps == NodeStatus::SKIPPED) {
                        transition(node.id, NodeStatus::SKIPPED, "predecessor " + pred + " " + to_string(ps));
                        skipped_any = true;
                        break;
                    }
                }
            }
        }

        std::vector<std::string> wave;
        for (const auto& node : dag.nodes()) {
            if (node.status != NodeStatus::PENDING) continue;
            bool ready = std::all_of(node.predecessors.begin(), node.predecessors.end(),
                                     [&dag](const std::string& p) { return dag.node(p).status == NodeStatus::SUCCEEDED; });
            if (ready) wave.push_back(node.id);
        }
        if (wave.empty()) break;

        for (const auto& id : wave) {
            transition(id, NodeStatus::RUNNING, "");
        }

        std::vector<NodeOutcome> outcomes = run_wave(dag, wave, report.final_state, completed);

        for (size_t i = 0; i < wave.size(); ++i) {
            const NodeOutcome& outcome = outcomes[i];
            const std::string& id = wave[i];
            if (outcome.succeeded) {
                for (const auto& kv : outcome.observation.state_updates) {
                    report.final_state[kv.first] = kv.second;
                }
                completed.insert(dag.node(id).action.name);
                report.duration_ms += outcome.observation.cost_ms;
                transition(id, NodeStatus::SUCCEEDED, outcome.observation.kind);
            } else {
                report.failures[id] = outcome.failure;
                transition(id, NodeStatus::FAILED,
                           std::string(to_string(outcome.failure.kind)) + ": " + outcome.failure.reason);
                Logger::getInstance().warning("Task " + task_id + ": node " + id + " (" +
                                              dag.node(id).action.name + ") failed: " + outcome.failure.reason);
            }
        }
    }

    size_t succeeded = report.count(NodeStatus::SUCCEEDED);
    if (succeeded == dag.size()) {
        report.status = ReportStatus::SUCCESS;
    } else if (succeeded > 0) {
        report.status = ReportStatus::PARTIAL;
    } else {
        report.status = ReportStatus::FAILURE;
    }

    Logger::getInstance().debug("Task " + task_id + " on " + version + ": " + to_string(report.status) +
                                " (" + std::to_string(succeeded) + "/" + std::to_string(dag.size()) +
                                " nodes succeeded)");
    return report;
}

} // namespace Evo
