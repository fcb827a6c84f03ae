#include <kapla/orchestrator.hpp>
#include <kapla/log.hpp>

#include <algorithm>
#include <exception>
#include <thread>
#include <unordered_map>
#include <utility>

namespace kapla {

const char* task_status_name(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending:   return "pending";
        case TaskStatus::Ready:     return "ready";
        case TaskStatus::Running:   return "running";
        case TaskStatus::Succeeded: return "succeeded";
        case TaskStatus::Failed:    return "failed";
        case TaskStatus::Skipped:   return "skipped";
    }
    return "unknown";
}

bool RunReport::success() const {
    for (const auto& r : results) {
        if (r.status != TaskStatus::Succeeded) return false;
    }
    return true;
}

size_t RunReport::count(TaskStatus status) const {
    return static_cast<size_t>(std::count_if(results.begin(), results.end(),
        [status](const TaskResult& r) { return r.status == status; }));
}

const TaskResult* RunReport::find(const std::string& package) const {
    for (const auto& r : results) {
        if (r.package == package) return &r;
    }
    return nullptr;
}

Result<FailurePolicy> parse_failure_policy(const std::string& name) {
    if (name == "fail-fast-per-branch" || name == "continue-independent") {
        return Result<FailurePolicy>::ok(FailurePolicy::PerBranch);
    }
    if (name == "fail-fast") {
        return Result<FailurePolicy>::ok(FailurePolicy::FailFast);
    }
    return KaplaError{KaplaError::Config,
        "unknown failure policy '" + name + "'",
        "expected 'fail-fast-per-branch', 'continue-independent' or 'fail-fast'"};
}

const char* failure_policy_name(FailurePolicy policy) {
    switch (policy) {
        case FailurePolicy::PerBranch: return "fail-fast-per-branch";
        case FailurePolicy::FailFast:  return "fail-fast";
    }
    return "unknown";
}

Orchestrator::Orchestrator(Options opts) : opts_(std::move(opts)) {
    if (opts_.concurrency == 0) opts_.concurrency = 1;
}

// ---------------------------------------------------------------------------
// run
// ---------------------------------------------------------------------------

Result<RunReport> Orchestrator::run(const DependencyGraph& graph,
                                    const std::set<std::string>& selected,
                                    Action& action) {
    KAPLA_TRY_ASSIGN(ExecutionPlan plan, graph.plan(selected));
    if (opts_.reverse) std::reverse(plan.batches.begin(), plan.batches.end());

    for (size_t i = 0; i < plan.batches.size(); ++i) {
        std::string line;
        for (const auto& name : plan.batches[i]) {
            if (!line.empty()) line += ", ";
            line += name;
        }
        log::debug("batch %zu: %s", i, line.c_str());
    }

    // Every manifest is synthesized before any action starts
    SynthesisContext ctx = opts_.synthesis;
    for (const auto& name : graph.names()) {
        if (!ctx.member_paths.count(name)) {
            ctx.member_paths[name] = graph.find(name)->path;
        }
    }

    std::vector<std::string> order = plan.flatten();
    std::unordered_map<std::string, size_t> position;
    std::vector<Task> tasks(order.size());
    for (size_t i = 0; i < order.size(); ++i) {
        const Manifest* pkg = graph.find(order[i]);
        position[order[i]] = i;
        tasks[i].name = order[i];
        tasks[i].path = pkg->path;
        tasks[i].manifest = synthesize(*pkg, ctx);
        tasks[i].result.package = order[i];
    }
    for (size_t i = 0; i < order.size(); ++i) {
        for (const auto& dep : graph.dependencies(order[i])) {
            auto it = position.find(dep);
            if (it == position.end()) continue;  // outside the selection: satisfied
            size_t before = it->second, after = i;
            if (opts_.reverse) std::swap(before, after);
            tasks[after].deps.push_back(before);
            tasks[before].dependents.push_back(after);
        }
    }
    for (auto& task : tasks) task.waiting = task.deps.size();

    CancelToken token;
    size_t workers = std::min(opts_.concurrency, std::max<size_t>(tasks.size(), 1));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_ = std::move(tasks);
        ready_.clear();
        running_ = 0;
        finished_ = 0;
        aborted_ = false;
        invariant_error_.clear();
        token_ = &token;
        active_ = true;
        for (size_t i = 0; i < tasks_.size(); ++i) {
            if (tasks_[i].waiting == 0) {
                tasks_[i].result.status = TaskStatus::Ready;
                ready_.insert(i);
            }
        }
        if (cancel_pending_) {
            cancel_pending_ = false;
            abort_locked("cancelled");
        }
    }

    log::info("%s: %zu package(s), %zu worker(s), policy %s",
              action.name().c_str(), order.size(), workers,
              failure_policy_name(opts_.failure_policy));

    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        pool.emplace_back([this, &action] { worker(action); });
    }
    for (auto& t : pool) t.join();

    RunReport report;
    std::string invariant;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_ = false;
        token_ = nullptr;
        invariant = invariant_error_;
        report.plan = std::move(plan);
        for (auto& task : tasks_) report.results.push_back(std::move(task.result));
        tasks_.clear();
    }

    if (!invariant.empty()) {
        return KaplaError{KaplaError::Invariant, invariant};
    }

    log::info("%s: %zu succeeded, %zu failed, %zu skipped",
              action.name().c_str(),
              report.count(TaskStatus::Succeeded),
              report.count(TaskStatus::Failed),
              report.count(TaskStatus::Skipped));
    return Result<RunReport>::ok(std::move(report));
}

void Orchestrator::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    log::warn("cancellation requested");
    if (!active_) {
        cancel_pending_ = true;
        return;
    }
    abort_locked("cancelled");
    cv_.notify_all();
}

// ---------------------------------------------------------------------------
// Worker loop
// ---------------------------------------------------------------------------

void Orchestrator::worker(Action& action) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        cv_.wait(lock, [this] {
            return !ready_.empty() || finished_ == tasks_.size() ||
                   aborted_ || running_ == 0;
        });
        if (ready_.empty()) {
            if (finished_ < tasks_.size() && running_ == 0 && !aborted_) {
                invariant_error_ = "scheduler stalled with " +
                    std::to_string(tasks_.size() - finished_) +
                    " package(s) neither ready nor running";
                abort_locked("cancelled: internal scheduling error");
                cv_.notify_all();
            }
            if (finished_ == tasks_.size() || aborted_) return;
            continue;
        }

        size_t idx = *ready_.begin();
        ready_.erase(ready_.begin());

        std::string why;
        if (!admissible_locked(idx, why)) {
            invariant_error_ = "package '" + tasks_[idx].name +
                "' admitted while " + why;
            log::error("%s", invariant_error_.c_str());
            // The popped task is still Ready, so the abort marks it Skipped
            abort_locked("cancelled: internal scheduling error");
            cv_.notify_all();
            continue;
        }

        Task& task = tasks_[idx];
        task.result.status = TaskStatus::Running;
        ++running_;
        const MergedManifest& manifest = task.manifest;
        const std::string& path = task.path;
        CancelToken& token = *token_;
        log::info("[%s] %s", task.name.c_str(), action.name().c_str());

        lock.unlock();
        auto start = std::chrono::steady_clock::now();
        ActionOutcome outcome;
        try {
            outcome = action.execute(manifest, path, token);
        } catch (const std::exception& e) {
            outcome = ActionOutcome::failure(-1, e.what());
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        lock.lock();

        --running_;
        complete_locked(idx, outcome, elapsed);
        cv_.notify_all();
    }
}

bool Orchestrator::admissible_locked(size_t idx, std::string& why) const {
    const Task& task = tasks_[idx];
    if (task.result.status != TaskStatus::Ready) {
        why = std::string("in state ") + task_status_name(task.result.status);
        return false;
    }
    for (size_t dep : task.deps) {
        if (tasks_[dep].result.status != TaskStatus::Succeeded) {
            why = "dependency '" + tasks_[dep].name + "' is " +
                  task_status_name(tasks_[dep].result.status);
            return false;
        }
    }
    return true;
}

// ---------------------------------------------------------------------------
// State transitions (mutex held)
// ---------------------------------------------------------------------------

void Orchestrator::complete_locked(size_t idx, const ActionOutcome& outcome,
                                   std::chrono::milliseconds duration) {
    Task& task = tasks_[idx];
    task.result.duration = duration;
    task.result.exit_code = outcome.exit_code;
    task.result.message = outcome.message;
    ++finished_;

    if (outcome.ok) {
        task.result.status = TaskStatus::Succeeded;
        log::info("[%s] done in %lldms", task.name.c_str(),
                  static_cast<long long>(duration.count()));
        for (size_t d : task.dependents) {
            Task& dependent = tasks_[d];
            if (dependent.result.status != TaskStatus::Pending) continue;
            if (--dependent.waiting == 0 && !aborted_) {
                dependent.result.status = TaskStatus::Ready;
                ready_.insert(d);
            }
        }
        return;
    }

    if (outcome.cancelled) {
        task.result.status = TaskStatus::Skipped;
        if (task.result.message.empty()) task.result.message = "cancelled";
        log::warn("[%s] cancelled", task.name.c_str());
        skip_dependents_locked(idx, "dependency '" + task.name + "' was cancelled");
        return;
    }

    task.result.status = TaskStatus::Failed;
    log::error("[%s] failed: %s", task.name.c_str(), outcome.message.c_str());
    if (opts_.failure_policy == FailurePolicy::FailFast) {
        abort_locked("cancelled after '" + task.name + "' failed");
    } else {
        skip_dependents_locked(idx, "dependency '" + task.name + "' failed");
    }
}

void Orchestrator::skip_dependents_locked(size_t idx, const std::string& reason) {
    std::vector<size_t> todo(tasks_[idx].dependents);
    while (!todo.empty()) {
        size_t d = todo.back();
        todo.pop_back();
        Task& dependent = tasks_[d];
        if (dependent.result.status != TaskStatus::Pending &&
            dependent.result.status != TaskStatus::Ready) {
            continue;
        }
        ready_.erase(d);
        dependent.result.status = TaskStatus::Skipped;
        dependent.result.message = reason;
        ++finished_;
        log::warn("[%s] skipped: %s", dependent.name.c_str(), reason.c_str());
        todo.insert(todo.end(), dependent.dependents.begin(), dependent.dependents.end());
    }
}

void Orchestrator::abort_locked(const std::string& reason) {
    if (token_) token_->cancel();
    if (aborted_) return;
    aborted_ = true;
    ready_.clear();
    for (auto& task : tasks_) {
        TaskStatus s = task.result.status;
        if (s != TaskStatus::Pending && s != TaskStatus::Ready) continue;
        task.result.status = TaskStatus::Skipped;
        task.result.message = reason;
        ++finished_;
    }
    log::warn("run aborted: %s", reason.c_str());
}

} // namespace kapla
