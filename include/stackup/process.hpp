#pragma once

#include <stackup/result.hpp>
#include <stackup/command.hpp>
#include <atomic>
#include <filesystem>
#include <functional>
#include <list>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace stackup {

// Result of running an external command to completion
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

// Run an external command, capturing stdout and stderr.
// timeout_seconds <= 0 waits indefinitely. Failure to start is a Spawn error.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60);

// Resolve the build tool to an executable path. A bare name is searched in
// PATH. ExternalToolMissing if nothing runnable is found.
Result<std::string> locate_tool(const std::string& tool);

// A finished background run
struct ProcessOutcome {
    Command command;
    int exit_code = -1;       // -1 when killed by a signal
    std::string output;       // merged stdout and stderr
};

using FinishCallback = std::function<void(const ProcessOutcome&)>;

// Launches build-tool commands in the background, one child per run().
// Output of each run goes to its command's channel: kept in memory for the
// finish callback and, with a log directory, written to <log_dir>/<channel>.
// Runs are not queued or serialized; the finish callback is invoked on the
// run's reader thread.
class ProcessRunner {
public:
    ProcessRunner() = default;
    explicit ProcessRunner(std::filesystem::path log_dir);
    ~ProcessRunner();

    ProcessRunner(const ProcessRunner&) = delete;
    ProcessRunner& operator=(const ProcessRunner&) = delete;

    void on_finish(FinishCallback callback);

    // Returns once the child has started. Spawn failures (pipe, fork, chdir,
    // exec) are reported here and no callback fires for them.
    Status run(const Command& cmd);

    // Block until every run started so far has finished
    void wait_all();

    // Runs whose reader thread is still unjoined, after joining finished ones
    size_t pending();

    const std::filesystem::path& log_dir() const { return log_dir_; }

private:
    struct Reader {
        std::thread thread;
        std::atomic<bool> done{false};
    };

    std::filesystem::path log_dir_;
    FinishCallback on_finish_;
    std::mutex mutex_;
    std::list<Reader> readers_;   // list nodes keep done flags in place

    void collect(Command cmd, int pid, int out_fd, std::filesystem::path log_path,
                 std::atomic<bool>* done);
    // Join readers that have finished; mutex_ must be held
    void reap_finished();
};

} // namespace stackup
