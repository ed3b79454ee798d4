#include "shellpipe/host/posix_command_host.hpp"
#include "shellpipe/core/format.hpp"
#include "shellpipe/debug/status_log.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <grp.h>
#include <poll.h>
#include <pwd.h>
#include <sys/eventfd.h>
#include <sys/wait.h>
#include <unistd.h>
namespace shellpipe::channel::host {
namespace {
    struct AccountSwitch {
        uid_t uid;
        gid_t gid;
        std::vector<gid_t> groups;
        std::string home;
    };

    std::string ErrnoMessage(std::string_view what, const int error) {
        return compat::format("{}: {}", what, std::strerror(error));
    }

    void CloseDescriptor(int& fd) noexcept {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    void IgnoreBrokenPipe() {
        static std::once_flag once;
        std::call_once(once, [] {
            struct sigaction action{};
            action.sa_handler = SIG_IGN;
            sigemptyset(&action.sa_mask);
            ::sigaction(SIGPIPE, &action, nullptr);
        });
    }

    Result<AccountSwitch, ChannelFailure> ResolveAccount(const std::string& username) {
        using ResolveResult = Result<AccountSwitch, ChannelFailure>;
        long buffer_size = ::sysconf(_SC_GETPW_R_SIZE_MAX);
        if (buffer_size <= 0) {
            buffer_size = 16384;
        }
        std::vector<char> buffer(static_cast<size_t>(buffer_size));
        passwd entry{};
        passwd* found = nullptr;
        const int rc = ::getpwnam_r(username.c_str(), &entry, buffer.data(), buffer.size(), &found);
        if (rc != 0) {
            return ResolveResult::Err(ChannelFailure::HostSpawn(
                ErrnoMessage(compat::format("Cannot look up account '{}'", username), rc)));
        }
        if (found == nullptr) {
            return ResolveResult::Err(ChannelFailure::HostSpawn(
                compat::format("Unknown account '{}'", username)));
        }
        AccountSwitch account{entry.pw_uid, entry.pw_gid, {}, entry.pw_dir ? entry.pw_dir : "/"};
        int group_count = 16;
        while (true) {
            account.groups.resize(static_cast<size_t>(group_count));
            int requested = group_count;
            if (::getgrouplist(username.c_str(), entry.pw_gid,
                               account.groups.data(), &requested) >= 0) {
                account.groups.resize(static_cast<size_t>(requested));
                break;
            }
            if (requested <= group_count) {
                return ResolveResult::Err(ChannelFailure::HostSpawn(
                    compat::format("Cannot list groups of account '{}'", username)));
            }
            group_count = requested;
        }
        return ResolveResult::Ok(std::move(account));
    }

    [[noreturn]] void FailChild(const int status_fd) noexcept {
        const int error = errno;
        ssize_t written;
        do {
            written = ::write(status_fd, &error, sizeof(error));
        } while (written < 0 && errno == EINTR);
        ::_exit(127);
    }
}

// ============================================================================
// PosixCommandHost
// ============================================================================

PosixCommandHost::PosixCommandHost(
    const pid_t pid,
    const int input_fd,
    const int output_fd,
    const int wake_fd) noexcept
    : pid_(pid)
    , input_fd_(input_fd)
    , output_fd_(output_fd)
    , wake_fd_(wake_fd) {
}

PosixCommandHost::~PosixCommandHost() {
    Terminate();
    CloseDescriptor(input_fd_);
    CloseDescriptor(output_fd_);
    CloseDescriptor(wake_fd_);
}

Result<size_t, ChannelFailure> PosixCommandHost::ReadOutput(std::span<uint8_t> buffer) {
    if (buffer.empty()) {
        return Result<size_t, ChannelFailure>::Ok(0);
    }
    pollfd fds[2] = {
        {output_fd_, POLLIN, 0},
        {wake_fd_, POLLIN, 0},
    };
    while (true) {
        const int ready = ::poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Result<size_t, ChannelFailure>::Err(
                ChannelFailure::HostIo(ErrnoMessage("poll host output", errno)));
        }
        if (fds[1].revents & POLLIN) {
            return Result<size_t, ChannelFailure>::Ok(0);
        }
        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            const ssize_t n = ::read(output_fd_, buffer.data(), buffer.size());
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) {
                    continue;
                }
                return Result<size_t, ChannelFailure>::Err(
                    ChannelFailure::HostIo(ErrnoMessage("read host output", errno)));
            }
            return Result<size_t, ChannelFailure>::Ok(static_cast<size_t>(n));
        }
    }
}

Result<Unit, ChannelFailure> PosixCommandHost::WriteInput(std::span<const uint8_t> data) {
    size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = ::write(input_fd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Result<Unit, ChannelFailure>::Err(
                ChannelFailure::HostIo(ErrnoMessage("write host input", errno)));
        }
        written += static_cast<size_t>(n);
    }
    return Result<Unit, ChannelFailure>::Ok(unit);
}

bool PosixCommandHost::ReapLocked(const bool block) noexcept {
    if (reaped_) {
        return true;
    }
    int status = 0;
    pid_t rc;
    do {
        rc = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (rc < 0 && errno == EINTR);
    if (rc == 0) {
        return false;
    }
    reaped_ = true;
    if (rc == pid_) {
        if (WIFEXITED(status)) {
            exit_status_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_status_ = 128 + WTERMSIG(status);
        }
    }
    return true;
}

bool PosixCommandHost::HasExited() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return ReapLocked(false);
}

std::optional<int> PosixCommandHost::ExitStatus() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ReapLocked(false);
    return exit_status_;
}

void PosixCommandHost::Terminate() noexcept {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (terminated_) {
        return;
    }
    terminated_ = true;
    // The group outlives a reaped leader while background jobs remain in it.
    ::kill(-pid_, SIGKILL);
    ReapLocked(true);
    const uint64_t wake = 1;
    ssize_t written;
    do {
        written = ::write(wake_fd_, &wake, sizeof(wake));
    } while (written < 0 && errno == EINTR);
}

// ============================================================================
// PosixHostLauncher
// ============================================================================

PosixHostLauncher::PosixHostLauncher(
    std::string shell_path,
    std::vector<std::string> shell_args,
    HostIdentity identity)
    : shell_path_(std::move(shell_path))
    , shell_args_(std::move(shell_args))
    , identity_(std::move(identity)) {
}

Result<std::unique_ptr<ICommandHost>, ChannelFailure> PosixHostLauncher::Launch() {
    using LaunchResult = Result<std::unique_ptr<ICommandHost>, ChannelFailure>;
    if (shell_path_.empty()) {
        return LaunchResult::Err(ChannelFailure::HostSpawn("No command host configured"));
    }
    if (!identity_.domain.empty()) {
        return LaunchResult::Err(ChannelFailure::HostSpawn(compat::format(
            "Domain accounts are not supported (domain '{}')", identity_.domain)));
    }
    if (::access(shell_path_.c_str(), X_OK) != 0) {
        return LaunchResult::Err(ChannelFailure::HostSpawn(
            ErrnoMessage(compat::format("Cannot execute '{}'", shell_path_), errno)));
    }
    std::optional<AccountSwitch> account;
    if (identity_.IsSet()) {
        auto resolved = ResolveAccount(identity_.username);
        SPP_TRY(resolved);
        account = std::move(resolved).Unwrap();
    }

    std::vector<char*> argv;
    argv.reserve(shell_args_.size() + 2);
    argv.push_back(shell_path_.data());
    for (auto& arg : shell_args_) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    IgnoreBrokenPipe();

    int input_pipe[2] = {-1, -1};
    int output_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    auto close_all = [&]() {
        for (int* fd : {&input_pipe[0], &input_pipe[1], &output_pipe[0],
                        &output_pipe[1], &status_pipe[0], &status_pipe[1]}) {
            CloseDescriptor(*fd);
        }
    };
    if (::pipe2(input_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(output_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(status_pipe, O_CLOEXEC) != 0) {
        const int error = errno;
        close_all();
        return LaunchResult::Err(ChannelFailure::HostSpawn(ErrnoMessage("pipe", error)));
    }
    int wake_fd = ::eventfd(0, EFD_CLOEXEC);
    if (wake_fd < 0) {
        const int error = errno;
        close_all();
        return LaunchResult::Err(ChannelFailure::HostSpawn(ErrnoMessage("eventfd", error)));
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int error = errno;
        close_all();
        CloseDescriptor(wake_fd);
        return LaunchResult::Err(ChannelFailure::HostSpawn(ErrnoMessage("fork", error)));
    }
    if (pid == 0) {
        // Child: async-signal-safe calls only until exec.
        ::setpgid(0, 0);
        ::signal(SIGPIPE, SIG_DFL);
        sigset_t unblocked;
        sigemptyset(&unblocked);
        ::sigprocmask(SIG_SETMASK, &unblocked, nullptr);
        if (::dup2(input_pipe[0], STDIN_FILENO) < 0 ||
            ::dup2(output_pipe[1], STDOUT_FILENO) < 0 ||
            ::dup2(output_pipe[1], STDERR_FILENO) < 0) {
            FailChild(status_pipe[1]);
        }
        if (account.has_value()) {
            if (::setgroups(account->groups.size(), account->groups.data()) != 0 ||
                ::setgid(account->gid) != 0 ||
                ::setuid(account->uid) != 0) {
                FailChild(status_pipe[1]);
            }
            if (::chdir(account->home.c_str()) != 0) {
                (void)::chdir("/");
            }
        }
        ::execv(argv[0], argv.data());
        FailChild(status_pipe[1]);
    }

    (void)::setpgid(pid, pid);
    CloseDescriptor(input_pipe[0]);
    CloseDescriptor(output_pipe[1]);
    CloseDescriptor(status_pipe[1]);

    int child_error = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &child_error, sizeof(child_error));
    } while (n < 0 && errno == EINTR);
    CloseDescriptor(status_pipe[0]);
    if (n == static_cast<ssize_t>(sizeof(child_error))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close_all();
        CloseDescriptor(wake_fd);
        return LaunchResult::Err(ChannelFailure::HostSpawn(
            ErrnoMessage(compat::format("Failed to start '{}'", shell_path_), child_error)));
    }

    SPP_TRACE(debug::Role::Server, "host", "spawned {} as pid {}", shell_path_, pid);
    return LaunchResult::Ok(std::make_unique<PosixCommandHost>(
        pid, input_pipe[1], output_pipe[0], wake_fd));
}
}
