#pragma once
#include "shellpipe/host/command_host.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>
namespace shellpipe::channel::host {

/**
 * Child process in its own process group with piped stdin and stdout.
 * stderr is merged into stdout.
 */
class PosixCommandHost final : public ICommandHost {
public:
    PosixCommandHost(pid_t pid, int input_fd, int output_fd, int wake_fd) noexcept;
    ~PosixCommandHost() override;

    PosixCommandHost(const PosixCommandHost&) = delete;
    PosixCommandHost& operator=(const PosixCommandHost&) = delete;

    [[nodiscard]] Result<size_t, ChannelFailure> ReadOutput(std::span<uint8_t> buffer) override;
    [[nodiscard]] Result<Unit, ChannelFailure> WriteInput(std::span<const uint8_t> data) override;
    [[nodiscard]] bool HasExited() override;

    /**
     * SIGKILL to the whole process group, then reap. The group is
     * signalled even when the shell itself already exited, so background
     * jobs it left behind do not outlive the session.
     */
    void Terminate() noexcept override;

    [[nodiscard]] pid_t Pid() const noexcept { return pid_; }

    /**
     * @return Exit status once reaped: the exit code, or 128 + signal
     */
    [[nodiscard]] std::optional<int> ExitStatus();

private:
    bool ReapLocked(bool block) noexcept;

    pid_t pid_;
    int input_fd_;
    int output_fd_;
    int wake_fd_;
    std::mutex state_mutex_;
    bool reaped_ = false;
    bool terminated_ = false;
    std::optional<int> exit_status_;
};

/**
 * Launches `shell_path` with `shell_args` through fork/execv.
 *
 * With an identity set, the child switches to that account's uid, gid and
 * supplementary groups before exec, which needs the privilege to do so.
 * The password is not used: POSIX account switching is decided by
 * privilege, not by credentials. A domain is rejected.
 */
class PosixHostLauncher final : public IHostLauncher {
public:
    explicit PosixHostLauncher(
        std::string shell_path,
        std::vector<std::string> shell_args = {},
        HostIdentity identity = {});

    [[nodiscard]] Result<std::unique_ptr<ICommandHost>, ChannelFailure> Launch() override;

private:
    std::string shell_path_;
    std::vector<std::string> shell_args_;
    HostIdentity identity_;
};
}
