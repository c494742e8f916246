#include <stackup/process.hpp>
#include <stackup/log.hpp>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace stackup {

namespace fs = std::filesystem;

static std::vector<const char*> make_argv(const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);
    return argv;
}

static int exit_code_of(int status) {
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

static void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// ---------------------------------------------------------------------------
// Spawning
// ---------------------------------------------------------------------------

// Reported by the child through the status pipe when it cannot start
struct SpawnFailure {
    int stage;   // 0 = chdir, 1 = exec
    int err;
};

struct Child {
    pid_t pid = -1;
    int out_fd = -1;
    int err_fd = -1;   // -1 when stderr goes to out_fd
};

static void report_and_exit(int fd, SpawnFailure failure) {
    ssize_t ignored = write(fd, &failure, sizeof(failure));
    (void)ignored;
    _exit(127);
}

// Fork and exec args in working_dir. Every pipe is close-on-exec, so EOF on
// the status pipe means exec succeeded; chdir and exec failures arrive as a
// SpawnFailure instead and are returned as Spawn errors.
static Status spawn_child(const std::vector<std::string>& args,
                          const fs::path& working_dir,
                          bool merge_stderr,
                          Child& child) {
    auto argv = make_argv(args);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    auto close_all = [&]() {
        for (int* p : {out_pipe, err_pipe, status_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    if (pipe2(out_pipe, O_CLOEXEC) != 0 ||
        (!merge_stderr && pipe2(err_pipe, O_CLOEXEC) != 0) ||
        pipe2(status_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close_all();
        return StackupError{StackupError::Spawn,
            std::string("pipe() failed: ") + strerror(err)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_all();
        return StackupError{StackupError::Spawn,
            std::string("fork() failed: ") + strerror(err)};
    }

    if (pid == 0) {
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(merge_stderr ? out_pipe[1] : err_pipe[1], STDERR_FILENO);

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            report_and_exit(status_pipe[1], SpawnFailure{0, errno});
        }
        execvp(argv[0], const_cast<char* const*>(argv.data()));
        report_and_exit(status_pipe[1], SpawnFailure{1, errno});
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(status_pipe[1]);

    SpawnFailure failure{};
    ssize_t n;
    do {
        n = read(status_pipe[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
        close_all();
        waitpid(pid, nullptr, 0);
        if (failure.stage == 0) {
            return StackupError{StackupError::Spawn,
                std::string("cannot enter working directory: ") + strerror(failure.err),
                "", working_dir.string()};
        }
        return StackupError{StackupError::Spawn,
            std::string("cannot execute ") + args[0] + ": " + strerror(failure.err)};
    }
    close_fd(status_pipe[0]);

    child.pid = pid;
    child.out_fd = out_pipe[0];
    child.err_fd = err_pipe[0];
    return ok_status();
}

static void kill_child(Child& child) {
    kill(child.pid, SIGKILL);
    waitpid(child.pid, nullptr, 0);
    close_fd(child.out_fd);
    close_fd(child.err_fd);
}

// ---------------------------------------------------------------------------
// Synchronous run
// ---------------------------------------------------------------------------

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds) {
    if (args.empty()) {
        return StackupError{StackupError::InvalidArg, "run_command: empty args"};
    }

    Child child;
    STACKUP_TRY(spawn_child(args, working_dir, false, child));

    std::string out_buf, err_buf;
    char buf[4096];
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);

    while (child.out_fd >= 0 || child.err_fd >= 0) {
        int wait_ms = -1;
        if (timeout_seconds > 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0) {
                kill_child(child);
                return StackupError{StackupError::IO,
                    args[0] + " timed out after " + std::to_string(timeout_seconds) + "s"};
            }
            wait_ms = static_cast<int>(left);
        }

        pollfd fds[2];
        int* owners[2];
        std::string* sinks[2];
        nfds_t count = 0;
        if (child.out_fd >= 0) {
            fds[count] = pollfd{child.out_fd, POLLIN, 0};
            owners[count] = &child.out_fd;
            sinks[count++] = &out_buf;
        }
        if (child.err_fd >= 0) {
            fds[count] = pollfd{child.err_fd, POLLIN, 0};
            owners[count] = &child.err_fd;
            sinks[count++] = &err_buf;
        }

        if (poll(fds, count, wait_ms) < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            kill_child(child);
            return StackupError{StackupError::IO,
                std::string("poll failed: ") + strerror(err)};
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t got = read(*owners[i], buf, sizeof(buf));
            if (got > 0) {
                sinks[i]->append(buf, static_cast<size_t>(got));
            } else if (got == 0 || errno != EINTR) {
                close_fd(*owners[i]);
            }
        }
    }

    int status = 0;
    pid_t w;
    do {
        w = waitpid(child.pid, &status, 0);
    } while (w < 0 && errno == EINTR);
    if (w < 0) {
        return StackupError{StackupError::IO,
            std::string("waitpid failed: ") + strerror(errno)};
    }

    return Result<CommandResult>::ok(
        CommandResult{exit_code_of(status), std::move(out_buf), std::move(err_buf)});
}

// ---------------------------------------------------------------------------
// Tool lookup
// ---------------------------------------------------------------------------

static bool is_executable_file(const fs::path& p) {
    struct stat st;
    if (stat(p.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && access(p.c_str(), X_OK) == 0;
}

Result<std::string> locate_tool(const std::string& tool) {
    if (tool.empty()) {
        return StackupError{StackupError::ExternalToolMissing, "no build tool configured",
            "set [tool] path in ~/.stackup/config.toml"};
    }

    if (tool.find('/') != std::string::npos) {
        if (is_executable_file(tool)) return Result<std::string>::ok(tool);
        return StackupError{StackupError::ExternalToolMissing,
            "build tool is not an executable file", "", tool};
    }

    const char* path_env = std::getenv("PATH");
    std::istringstream dirs(path_env ? path_env : "");
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        fs::path candidate = fs::path(dir) / tool;
        if (is_executable_file(candidate)) {
            return Result<std::string>::ok(candidate.string());
        }
    }

    return StackupError{StackupError::ExternalToolMissing,
        "cannot find '" + tool + "' in PATH",
        "install it or set [tool] path to its location"};
}

// ---------------------------------------------------------------------------
// ProcessRunner
// ---------------------------------------------------------------------------

ProcessRunner::ProcessRunner(fs::path log_dir)
    : log_dir_(std::move(log_dir)) {}

ProcessRunner::~ProcessRunner() {
    wait_all();
}

void ProcessRunner::on_finish(FinishCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_finish_ = std::move(callback);
}

Status ProcessRunner::run(const Command& cmd) {
    fs::path log_path;
    if (!log_dir_.empty()) {
        std::error_code ec;
        fs::create_directories(log_dir_, ec);
        if (ec) {
            return StackupError{StackupError::IO,
                "cannot create log directory: " + ec.message(), "", log_dir_.string()};
        }
        log_path = log_dir_ / cmd.channel_key;
    }

    Child child;
    STACKUP_TRY(spawn_child(cmd.argv(), cmd.working_dir, true, child));
    log::info("running: %s", cmd.text().c_str());

    std::lock_guard<std::mutex> lock(mutex_);
    reap_finished();
    readers_.emplace_back();
    Reader& reader = readers_.back();
    try {
        reader.thread = std::thread(&ProcessRunner::collect, this, cmd,
                                    static_cast<int>(child.pid), child.out_fd, log_path,
                                    &reader.done);
    } catch (const std::system_error& e) {
        readers_.pop_back();
        kill_child(child);
        return StackupError{StackupError::Spawn,
            std::string("cannot start output reader: ") + e.what()};
    }
    return ok_status();
}

void ProcessRunner::collect(Command cmd, int pid, int out_fd, fs::path log_path,
                            std::atomic<bool>* done) {
    std::ofstream log_file;
    if (!log_path.empty()) {
        log_file.open(log_path, std::ios::trunc);
        if (!log_file.is_open()) {
            log::warn("cannot write output log: %s", log_path.c_str());
        } else {
            log_file << "$ " << cmd.text() << "\n";
        }
    }

    ProcessOutcome outcome;
    char buf[4096];
    ssize_t n;
    while (true) {
        n = read(out_fd, buf, sizeof(buf));
        if (n > 0) {
            outcome.output.append(buf, static_cast<size_t>(n));
            if (log_file.is_open()) log_file.write(buf, n);
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    close(out_fd);
    if (log_file.is_open()) log_file.close();

    int status = 0;
    pid_t w;
    do {
        w = waitpid(static_cast<pid_t>(pid), &status, 0);
    } while (w < 0 && errno == EINTR);

    outcome.exit_code = w < 0 ? -1 : exit_code_of(status);
    outcome.command = std::move(cmd);
    log::debug("finished (%d): %s", outcome.exit_code, outcome.command.channel_key.c_str());

    FinishCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = on_finish_;
    }
    if (callback) callback(outcome);
    done->store(true);
}

void ProcessRunner::reap_finished() {
    for (auto it = readers_.begin(); it != readers_.end();) {
        if (it->done.load()) {
            if (it->thread.joinable()) it->thread.join();
            it = readers_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t ProcessRunner::pending() {
    std::lock_guard<std::mutex> lock(mutex_);
    reap_finished();
    return readers_.size();
}

void ProcessRunner::wait_all() {
    // A finish callback may start further runs, so drain until empty
    while (true) {
        std::list<Reader> batch;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            batch.swap(readers_);
        }
        if (batch.empty()) return;
        for (auto& r : batch) {
            if (r.thread.joinable()) r.thread.join();
        }
    }
}

} // namespace stackup
