#pragma once

#include <kapla/action.hpp>
#include <kapla/dep_graph.hpp>
#include <kapla/synthesizer.hpp>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace kapla {

enum class TaskStatus { Pending, Ready, Running, Succeeded, Failed, Skipped };

const char* task_status_name(TaskStatus status);

struct TaskResult {
    std::string package;
    TaskStatus status = TaskStatus::Pending;
    int exit_code = 0;
    std::string message;
    std::chrono::milliseconds duration{0};
};

// One TaskResult per selected package, in plan order
struct RunReport {
    ExecutionPlan plan;
    std::vector<TaskResult> results;

    // True iff no package failed or was skipped
    bool success() const;
    size_t count(TaskStatus status) const;
    const TaskResult* find(const std::string& package) const;
};

enum class FailurePolicy {
    PerBranch,  // skip the failed package's dependents, keep the rest going
    FailFast,   // cancel the whole run on the first failure
};

// "fail-fast-per-branch" (or "continue-independent") and "fail-fast"
Result<FailurePolicy> parse_failure_policy(const std::string& name);
const char* failure_policy_name(FailurePolicy policy);

// Runs an action over a selected set of packages in dependency order with
// a bounded worker pool. A package is admitted only once every selected
// dependency has succeeded; per-package state lives behind one mutex.
class Orchestrator {
public:
    struct Options {
        size_t concurrency = 1;
        FailurePolicy failure_policy = FailurePolicy::PerBranch;
        // Dependents first: a package waits for every selected package that
        // depends on it (uninstall order)
        bool reverse = false;
        // Member paths are filled in from the graph when left empty
        SynthesisContext synthesis;
    };

    explicit Orchestrator(Options opts);

    // Fails with NotFound for an unknown selected name, or with Invariant
    // when the scheduler detects an inconsistent state. Action failures are
    // reported in the RunReport, never as an error.
    Result<RunReport> run(const DependencyGraph& graph,
                          const std::set<std::string>& selected,
                          Action& action);

    // Request cancellation from another thread: nothing new is admitted and
    // running actions are signalled. A request made before run() starts
    // working (while it plans and synthesizes) cancels that run; run()
    // consumes the request.
    void cancel();

    const Options& options() const { return opts_; }

private:
    struct Task {
        std::string name;
        std::string path;
        MergedManifest manifest;
        std::vector<size_t> deps;        // selected dependencies
        std::vector<size_t> dependents;  // selected dependents
        size_t waiting = 0;              // deps not yet succeeded
        TaskResult result;
    };

    Options opts_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Task> tasks_;
    std::set<size_t> ready_;   // ordered by plan position
    size_t running_ = 0;
    size_t finished_ = 0;
    bool active_ = false;
    bool aborted_ = false;
    bool cancel_pending_ = false;
    std::string invariant_error_;
    CancelToken* token_ = nullptr;

    void worker(Action& action);
    void complete_locked(size_t idx, const ActionOutcome& outcome,
                         std::chrono::milliseconds duration);
    void skip_dependents_locked(size_t idx, const std::string& reason);
    void abort_locked(const std::string& reason);
    bool admissible_locked(size_t idx, std::string& why) const;
};

} // namespace kapla
