#include "shellpipe/transport/tcp_channel.hpp"
#include "shellpipe/core/format.hpp"
#include "shellpipe/debug/status_log.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
namespace shellpipe::channel::transport {
namespace {
    std::string ErrnoMessage(std::string_view what) {
        return compat::format("{}: {}", what, std::strerror(errno));
    }

    void CloseDescriptor(int& fd) noexcept {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    void SetNoDelay(const int fd) noexcept {
        int one = 1;
        // Interactive traffic is one small record per keystroke or output byte.
        (void)::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    }

    Result<int, ChannelFailure> OpenListener(const std::string& bind_address, const uint16_t port) {
        sockaddr_in address{};
        address.sin_family = AF_INET;
        address.sin_port = htons(port);
        if (::inet_pton(AF_INET, bind_address.c_str(), &address.sin_addr) != 1) {
            return Result<int, ChannelFailure>::Err(ChannelFailure::InvalidInput(
                compat::format("Invalid bind address '{}'", bind_address)));
        }
        const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd < 0) {
            return Result<int, ChannelFailure>::Err(
                ChannelFailure::Transport(ErrnoMessage("socket")));
        }
        int one = 1;
        if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) != 0 ||
            ::bind(fd, reinterpret_cast<sockaddr*>(&address), sizeof(address)) != 0 ||
            ::listen(fd, TransportConstants::LISTEN_BACKLOG) != 0) {
            auto failure = ChannelFailure::Transport(ErrnoMessage(
                compat::format("listen on {}:{}", bind_address, port)));
            ::close(fd);
            return Result<int, ChannelFailure>::Err(std::move(failure));
        }
        return Result<int, ChannelFailure>::Ok(fd);
    }
}

// ============================================================================
// TcpChannel
// ============================================================================

TcpChannel::TcpChannel(const int fd, std::string name) noexcept
    : fd_(fd), name_(std::move(name)) {
}

TcpChannel::~TcpChannel() {
    Close();
    CloseDescriptor(fd_);
}

Result<Unit, ChannelFailure> TcpChannel::Write(std::span<const uint8_t> data) {
    size_t sent = 0;
    while (sent < data.size()) {
        if (closed_.load(std::memory_order_acquire)) {
            return Result<Unit, ChannelFailure>::Err(ChannelFailure::Transport(
                compat::format("{}: {}", name_, ErrorMessages::CHANNEL_CLOSED)));
        }
        const ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Result<Unit, ChannelFailure>::Err(
                ChannelFailure::Transport(ErrnoMessage(compat::format("send on {}", name_))));
        }
        sent += static_cast<size_t>(n);
    }
    return Result<Unit, ChannelFailure>::Ok(unit);
}

Result<size_t, ChannelFailure> TcpChannel::Receive(uint8_t* data, const size_t size) {
    while (true) {
        const ssize_t n = ::recv(fd_, data, size, 0);
        if (n >= 0) {
            return Result<size_t, ChannelFailure>::Ok(static_cast<size_t>(n));
        }
        if (errno == EINTR) {
            continue;
        }
        if (closed_.load(std::memory_order_acquire)) {
            return Result<size_t, ChannelFailure>::Ok(0);
        }
        return Result<size_t, ChannelFailure>::Err(
            ChannelFailure::Transport(ErrnoMessage(compat::format("recv on {}", name_))));
    }
}

Result<size_t, ChannelFailure> TcpChannel::Read(std::span<uint8_t> buffer) {
    if (buffer.empty()) {
        return Result<size_t, ChannelFailure>::Ok(0);
    }
    if (!pending_.empty()) {
        const size_t count = std::min(buffer.size(), pending_.size());
        std::memcpy(buffer.data(), pending_.data(), count);
        pending_.erase(0, count);
        return Result<size_t, ChannelFailure>::Ok(count);
    }
    if (eof_) {
        return Result<size_t, ChannelFailure>::Ok(0);
    }
    auto received = Receive(buffer.data(), buffer.size());
    if (received.IsOk() && received.Unwrap() == 0) {
        eof_ = true;
    }
    return received;
}

Result<std::optional<std::string>, ChannelFailure> TcpChannel::ReadLine() {
    using LineResult = Result<std::optional<std::string>, ChannelFailure>;
    uint8_t chunk[RelayConstants::READ_BUFFER_SIZE];
    while (true) {
        const size_t newline = pending_.find(RelayConstants::RECORD_DELIMITER);
        if (newline != std::string::npos) {
            if (discarding_) {
                pending_.erase(0, newline + 1);
                discarding_ = false;
                return LineResult::Err(OversizedRecord());
            }
            std::string line = pending_.substr(0, newline);
            pending_.erase(0, newline + 1);
            return LineResult::Ok(std::move(line));
        }
        if (eof_) {
            if (discarding_) {
                pending_.clear();
                discarding_ = false;
                return LineResult::Err(OversizedRecord());
            }
            if (pending_.empty()) {
                return LineResult::Ok(std::nullopt);
            }
            std::string line = std::move(pending_);
            pending_.clear();
            return LineResult::Ok(std::move(line));
        }
        if (discarding_ || pending_.size() > Constants::MAX_BUNDLE_LINE_SIZE) {
            pending_.clear();
            discarding_ = true;
        }
        auto received = Receive(chunk, sizeof(chunk));
        if (received.IsErr()) {
            return LineResult::Err(std::move(received).UnwrapErr());
        }
        const size_t count = received.Unwrap();
        if (count == 0) {
            eof_ = true;
            continue;
        }
        pending_.append(reinterpret_cast<const char*>(chunk), count);
    }
}

ChannelFailure TcpChannel::OversizedRecord() const {
    return ChannelFailure::Decode(compat::format(
        "{}: dropped record longer than {} bytes", name_, Constants::MAX_BUNDLE_LINE_SIZE));
}

bool TcpChannel::IsConnected() const noexcept {
    if (fd_ < 0 || closed_.load(std::memory_order_acquire)) {
        return false;
    }
    pollfd pfd{fd_, POLLRDHUP, 0};
    const int ready = ::poll(&pfd, 1, 0);
    if (ready < 0) {
        return errno == EINTR;
    }
    return (pfd.revents & (POLLRDHUP | POLLHUP | POLLERR | POLLNVAL)) == 0;
}

void TcpChannel::Close() noexcept {
    if (!closed_.exchange(true, std::memory_order_acq_rel) && fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

// ============================================================================
// TcpChannelAcceptor
// ============================================================================

TcpChannelAcceptor::TcpChannelAcceptor(
    const int output_listener,
    const int input_listener,
    const uint16_t port) noexcept
    : output_listener_(output_listener)
    , input_listener_(input_listener)
    , port_(port) {
}

Result<std::unique_ptr<TcpChannelAcceptor>, ChannelFailure> TcpChannelAcceptor::Listen(
    std::string_view bind_address,
    const uint16_t port) {
    using ListenResult = Result<std::unique_ptr<TcpChannelAcceptor>, ChannelFailure>;
    if (port == 0 || port == UINT16_MAX) {
        return ListenResult::Err(ChannelFailure::InvalidInput(
            compat::format("Port {} leaves no room for the input channel", port)));
    }
    const std::string address(bind_address);
    auto output_listener = OpenListener(address, port);
    SPP_TRY(output_listener);
    auto input_listener = OpenListener(address, static_cast<uint16_t>(port + 1));
    if (input_listener.IsErr()) {
        ::close(output_listener.Unwrap());
        return ListenResult::Err(std::move(input_listener).UnwrapErr());
    }
    SPP_TRACE(debug::Role::Server, "transport", "listening on {}:{} and {}:{}",
              address, port, address, port + 1);
    return ListenResult::Ok(std::unique_ptr<TcpChannelAcceptor>(
        new TcpChannelAcceptor(output_listener.Unwrap(), input_listener.Unwrap(), port)));
}

TcpChannelAcceptor::~TcpChannelAcceptor() {
    CloseDescriptor(output_listener_);
    CloseDescriptor(input_listener_);
}

Result<std::unique_ptr<IChannel>, ChannelFailure> TcpChannelAcceptor::AcceptOne(
    const int listener,
    std::string_view name) {
    using AcceptResult = Result<std::unique_ptr<IChannel>, ChannelFailure>;
    while (true) {
        if (interrupted_.load(std::memory_order_acquire)) {
            return AcceptResult::Err(ChannelFailure::Transport("Accept interrupted"));
        }
        const int fd = ::accept4(listener, nullptr, nullptr, SOCK_CLOEXEC);
        if (fd >= 0) {
            SetNoDelay(fd);
            return AcceptResult::Ok(std::make_unique<TcpChannel>(fd, std::string(name)));
        }
        if (errno == EINTR || errno == ECONNABORTED) {
            continue;
        }
        if (interrupted_.load(std::memory_order_acquire)) {
            return AcceptResult::Err(ChannelFailure::Transport("Accept interrupted"));
        }
        return AcceptResult::Err(
            ChannelFailure::Transport(ErrnoMessage(compat::format("accept on {}", name))));
    }
}

Result<ChannelPair, ChannelFailure> TcpChannelAcceptor::AcceptPair() {
    ChannelPair pair;
    auto output = AcceptOne(output_listener_, TransportConstants::STDOUT_CHANNEL_NAME);
    SPP_TRY(output);
    pair.output = std::move(output).Unwrap();
    auto input = AcceptOne(input_listener_, TransportConstants::STDIN_CHANNEL_NAME);
    if (input.IsErr()) {
        pair.Close();
        return Result<ChannelPair, ChannelFailure>::Err(std::move(input).UnwrapErr());
    }
    pair.input = std::move(input).Unwrap();
    return Result<ChannelPair, ChannelFailure>::Ok(std::move(pair));
}

void TcpChannelAcceptor::Interrupt() noexcept {
    interrupted_.store(true, std::memory_order_release);
    // A shut down listening socket makes a blocked accept() fail with EINVAL.
    if (output_listener_ >= 0) {
        ::shutdown(output_listener_, SHUT_RDWR);
    }
    if (input_listener_ >= 0) {
        ::shutdown(input_listener_, SHUT_RDWR);
    }
}

// ============================================================================
// TcpChannelConnector
// ============================================================================

TcpChannelConnector::TcpChannelConnector(std::string host, const uint16_t port)
    : host_(std::move(host)), port_(port) {
}

Result<std::unique_ptr<IChannel>, ChannelFailure> TcpChannelConnector::ConnectOne(
    const uint16_t port,
    std::string_view name) const {
    using ConnectResult = Result<std::unique_ptr<IChannel>, ChannelFailure>;
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* resolved = nullptr;
    const std::string service = std::to_string(port);
    const int rc = ::getaddrinfo(host_.c_str(), service.c_str(), &hints, &resolved);
    if (rc != 0) {
        return ConnectResult::Err(ChannelFailure::Transport(compat::format(
            "Cannot resolve '{}': {}", host_, ::gai_strerror(rc))));
    }
    std::string last_error = "no usable address";
    for (const addrinfo* candidate = resolved; candidate != nullptr; candidate = candidate->ai_next) {
        const int fd = ::socket(candidate->ai_family, candidate->ai_socktype | SOCK_CLOEXEC,
                                candidate->ai_protocol);
        if (fd < 0) {
            last_error = ErrnoMessage("socket");
            continue;
        }
        if (::connect(fd, candidate->ai_addr, candidate->ai_addrlen) == 0) {
            ::freeaddrinfo(resolved);
            SetNoDelay(fd);
            return ConnectResult::Ok(std::make_unique<TcpChannel>(fd, std::string(name)));
        }
        last_error = ErrnoMessage("connect");
        ::close(fd);
    }
    ::freeaddrinfo(resolved);
    return ConnectResult::Err(ChannelFailure::Transport(compat::format(
        "{} at {}:{}: {}", name, host_, port, last_error)));
}

Result<ChannelPair, ChannelFailure> TcpChannelConnector::ConnectPair() {
    if (port_ == 0 || port_ == UINT16_MAX) {
        return Result<ChannelPair, ChannelFailure>::Err(ChannelFailure::InvalidInput(
            compat::format("Port {} leaves no room for the input channel", port_)));
    }
    ChannelPair pair;
    auto output = ConnectOne(port_, TransportConstants::STDOUT_CHANNEL_NAME);
    SPP_TRY(output);
    pair.output = std::move(output).Unwrap();
    auto input = ConnectOne(static_cast<uint16_t>(port_ + 1), TransportConstants::STDIN_CHANNEL_NAME);
    if (input.IsErr()) {
        pair.Close();
        return Result<ChannelPair, ChannelFailure>::Err(std::move(input).UnwrapErr());
    }
    pair.input = std::move(input).Unwrap();
    return Result<ChannelPair, ChannelFailure>::Ok(std::move(pair));
}
}
