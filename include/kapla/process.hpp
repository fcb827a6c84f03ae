#pragma once

#include <kapla/result.hpp>
#include <atomic>
#include <string>
#include <vector>

namespace kapla {

// Shared stop request. The orchestrator cancels; actions and the
// subprocess runner poll.
class CancelToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

// Result of running an external command
struct CommandResult {
    int exit_code = 0;        // 128 + signal when the child was killed
    std::string stdout_str;
    std::string stderr_str;
    bool cancelled = false;   // stopped through the cancel token
};

// Run an external command, capturing stdout and stderr.
// Returns an error on fork/exec failure or timeout. When `cancel` fires the
// child receives SIGTERM, then SIGKILL if it is still alive after
// `grace_seconds`; the result is flagged cancelled.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60,
                                  const CancelToken* cancel = nullptr,
                                  int grace_seconds = 5);

} // namespace kapla
