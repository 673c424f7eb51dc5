#include "arbiter/process_runner.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace arbiter {
using namespace std;
namespace fs = std::filesystem;

const int BUF_SIZE = 4096;

// 等待子进程时每轮 poll 的最长时间，也是检查取消标记的间隔
const int POLL_INTERVAL_MS = 10;

// 子进程退出后等待其遗留的子孙进程关闭管道的最长时间
const int DRAIN_TIMEOUT_MS = 100;

string command::name() const {
    if (argv.empty()) return "";
    return fs::path(argv[0]).filename().string();
}

child_process::child_process() : id(-1), reaped(true), status(0) {}

child_process::child_process(pid_t pid) : id(pid), reaped(false), status(0) {}

child_process::child_process(child_process &&other) : child_process() {
    *this = move(other);
}

child_process::~child_process() {
    if (running()) {
        kill();
        wait();
    }
}

child_process &child_process::operator=(child_process &&other) {
    swap(id, other.id);
    swap(reaped, other.reaped);
    swap(status, other.status);
    return *this;
}

pid_t child_process::pid() const {
    return id;
}

bool child_process::running() const {
    return id > 0 && !reaped;
}

bool child_process::try_wait() {
    if (!running()) return reaped;
    siginfo_t info;
    info.si_pid = 0;
    // WNOWAIT 使已退出的子进程保持僵尸状态，由 reap 杀死残留进程后再回收
    if (waitid(P_PID, id, &info, WEXITED | WNOHANG | WNOWAIT) < 0) {
        if (errno == EINTR) return false;
        throw system_error(errno, system_category(), fmt::format("waiting on child {}", id));
    }
    if (info.si_pid == 0) return false;
    reap();
    return true;
}

void child_process::wait() {
    while (running()) {
        siginfo_t info;
        if (waitid(P_PID, id, &info, WEXITED | WNOWAIT) < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), fmt::format("waiting on child {}", id));
        }
        reap();
    }
}

void child_process::reap() {
    // 进程组 leader 还是僵尸进程时进程组 id 不会被其他进程占用，
    // 此时杀死选手程序 fork 出的残留进程不会误杀其他 worker 的子进程
    kill();
    pid_t r;
    do {
        r = waitpid(id, &status, 0);
    } while (r < 0 && errno == EINTR);
    if (r != id) throw system_error(errno, system_category(), fmt::format("reaping child {}", id));
    reaped = true;
}

void child_process::kill() {
    if (!running()) return;
    if (::kill(-id, SIGKILL) != 0 && errno != ESRCH) {
        LOG(WARNING) << "unable to send SIGKILL to process group " << id << ": " << strerror(errno);
    }
}

int child_process::wait_status() const {
    return status;
}

void pipe_reader::add(scoped_fd &&fd, string *sink) {
    streams.push_back({move(fd), sink});
}

void pipe_reader::pump(int timeout_ms) {
    vector<pollfd> fds;
    vector<size_t> index;
    for (size_t i = 0; i < streams.size(); ++i) {
        if (!streams[i].fd.valid()) continue;
        fds.push_back({streams[i].fd.get(), POLLIN, 0});
        index.push_back(i);
    }

    int r = poll(fds.data(), fds.size(), timeout_ms);
    if (r < 0) {
        if (errno == EINTR) return;
        throw system_error(errno, system_category(), "waiting for child data");
    }
    if (r == 0) return;

    char buf[BUF_SIZE];
    for (size_t k = 0; k < fds.size(); ++k) {
        if (!(fds[k].revents & (POLLIN | POLLHUP | POLLERR))) continue;
        stream &s = streams[index[k]];
        ssize_t nread = read(s.fd.get(), buf, BUF_SIZE);
        if (nread > 0) {
            s.sink->append(buf, nread);
        } else if (nread == 0) {
            // EOF
            s.fd.reset();
        } else if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
            throw system_error(errno, system_category(), "reading child output");
        }
    }
}

void pipe_reader::drain(int timeout_ms) {
    elapsed_time timer;
    while (!finished()) {
        int remaining = timeout_ms - (int)timer.duration<chrono::milliseconds>().count();
        if (remaining <= 0) break;
        pump(remaining);
    }
    for (auto &s : streams) {
        if (s.fd.valid()) {
            LOG(WARNING) << "output pipe still open after child exited, discarding remaining output";
            s.fd.reset();
        }
    }
}

bool pipe_reader::finished() const {
    for (auto &s : streams)
        if (s.fd.valid()) return false;
    return true;
}

child_process spawn_process(const command &cmd, int stdin_fd, int stdout_fd, int stderr_fd) {
    if (cmd.argv.empty()) throw spawn_error("empty command");

    // fork 之后子进程只能调用异步信号安全的函数，参数必须在 fork 之前准备好
    vector<char *> args;
    for (auto &arg : cmd.argv) args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);
    string cwd = cmd.cwd.string();

    // exec 成功时该管道因为 O_CLOEXEC 被关闭，父进程读到 EOF；
    // exec 失败时子进程将 errno 写入管道。
    scoped_fd status_read, status_write;
    make_pipe(status_read, status_write);

    pid_t pid = fork();
    switch (pid) {
        case -1:
            throw spawn_error(fmt::format("unable to fork for {}: {}", cmd.name(), strerror(errno)));
        case 0: {  // 子进程
            setpgid(0, 0);

            struct sigaction sigact;
            sigact.sa_handler = SIG_DFL;
            sigact.sa_flags = 0;
            sigemptyset(&sigact.sa_mask);
            sigaction(SIGPIPE, &sigact, nullptr);
            sigaction(SIGINT, &sigact, nullptr);

            int err = 0;
            if (stdin_fd >= 0 && dup2(stdin_fd, STDIN_FILENO) < 0) err = errno;
            if (!err && stdout_fd >= 0 && dup2(stdout_fd, STDOUT_FILENO) < 0) err = errno;
            if (!err && stderr_fd >= 0 && dup2(stderr_fd, STDERR_FILENO) < 0) err = errno;
            if (!err && !cwd.empty() && chdir(cwd.c_str()) != 0) err = errno;
            if (!err) {
                execvp(args[0], args.data());
                err = errno;
            }
            ssize_t ignored = write(status_write.get(), &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }
        default:  // 父进程
            break;
    }

    // 父进程也设置一次进程组，避免在子进程调用 setpgid 之前就需要杀死进程组
    setpgid(pid, pid);
    child_process child(pid);
    status_write.reset();

    int err = 0;
    ssize_t nread;
    do {
        nread = read(status_read.get(), &err, sizeof(err));
    } while (nread < 0 && errno == EINTR);

    if (nread == sizeof(err)) {
        child.wait();
        throw spawn_error(fmt::format("unable to start command {}: {}", cmd.argv[0], strerror(err)));
    }
    return child;
}

void fill_exit_status(execution_result &result, int wait_status) {
    if (WIFEXITED(wait_status)) {
        int code = WEXITSTATUS(wait_status);
        result.exit_code = code;
        result.status = code == 0 ? exec_status::OK : exec_status::NONZERO_EXIT;
    } else if (WIFSIGNALED(wait_status)) {
        result.exit_code = -WTERMSIG(wait_status);
        result.status = exec_status::CRASHED;
    } else {
        throw internal_error(fmt::format("unknown wait status: {:x}", wait_status));
    }
}

static scoped_fd open_file(const fs::path &path, int flags) {
    int fd = open(path.c_str(), flags | O_CLOEXEC, 0644);
    if (fd < 0) throw spawn_error(fmt::format("unable to open file {}: {}", path, strerror(errno)));
    return scoped_fd(fd);
}

execution_result run_process(const command &cmd, const process_io &io, double hard_timeout, const cancellation_token &token) {
    token.throw_if_cancelled();

    scoped_fd in = open_file(io.stdin_file.empty() ? fs::path("/dev/null") : io.stdin_file, O_RDONLY);
    scoped_fd out_file;
    if (io.stdout_file) out_file = open_file(*io.stdout_file, O_WRONLY | O_CREAT | O_TRUNC);

    string out, err;
    scoped_fd out_read, out_write, err_read, err_write;
    int stdout_fd = out_file.valid() ? out_file.get() : -1;
    int stderr_fd = -1;
    if (io.capture_output) {
        if (!io.stdout_file) {
            make_pipe(out_read, out_write);
            stdout_fd = out_write.get();
        }
        make_pipe(err_read, err_write);
        stderr_fd = err_write.get();
    }

    elapsed_time timer;
    child_process child = spawn_process(cmd, in.get(), stdout_fd, stderr_fd);

    // 关闭父进程持有的写端，否则读端永远读不到 EOF
    in.reset();
    out_file.reset();
    out_write.reset();
    err_write.reset();

    pipe_reader reader;
    if (out_read.valid()) reader.add(move(out_read), &out);
    if (err_read.valid()) reader.add(move(err_read), &err);

    execution_result result;
    while (true) {
        reader.pump(POLL_INTERVAL_MS);
        if (child.try_wait()) {
            result.duration = timer.seconds();
            break;
        }
        if (token.cancelled()) {
            child.kill();
            child.wait();
            throw judge_cancelled();
        }
        if (timer.seconds() >= hard_timeout) {
            LOG(INFO) << fmt::format("{} exceeded hard timeout {:.3f}s, killing", cmd.name(), hard_timeout);
            child.kill();
            child.wait();
            result.duration = timer.seconds();
            result.timeout_expired = true;
            break;
        }
    }

    // 回收子进程时进程组内残留的进程已经被杀死
    reader.drain(DRAIN_TIMEOUT_MS);

    if (result.timeout_expired) {
        result.status = exec_status::TIMED_OUT;
    } else {
        fill_exit_status(result, child.wait_status());
    }

    if (io.capture_output) {
        if (!io.stdout_file) result.out = io.crop ? crop_output(out) : out;
        result.err = io.crop ? crop_output(err) : err;
    }
    return result;
}

}  // namespace arbiter
