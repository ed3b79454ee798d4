#pragma once
#include "shellpipe/transport/channel.hpp"
#include "shellpipe/core/constants.hpp"
#include <atomic>
#include <string>
#include <string_view>
namespace shellpipe::channel::transport {

/**
 * IChannel over a connected TCP socket. Owns the descriptor.
 */
class TcpChannel final : public IChannel {
public:
    TcpChannel(int fd, std::string name) noexcept;
    ~TcpChannel() override;

    TcpChannel(const TcpChannel&) = delete;
    TcpChannel& operator=(const TcpChannel&) = delete;

    [[nodiscard]] Result<Unit, ChannelFailure> Write(std::span<const uint8_t> data) override;
    [[nodiscard]] Result<size_t, ChannelFailure> Read(std::span<uint8_t> buffer) override;
    [[nodiscard]] Result<std::optional<std::string>, ChannelFailure> ReadLine() override;

    /**
     * False once Close() ran or the peer hung up (POLLRDHUP / POLLHUP).
     */
    [[nodiscard]] bool IsConnected() const noexcept override;

    /**
     * Shuts the socket down in both directions. The descriptor itself is
     * released by the destructor so a concurrent reader never sees a
     * recycled fd.
     */
    void Close() noexcept override;

private:
    [[nodiscard]] Result<size_t, ChannelFailure> Receive(uint8_t* data, size_t size);
    [[nodiscard]] ChannelFailure OversizedRecord() const;

    int fd_;
    std::string name_;
    std::atomic<bool> closed_{false};
    std::string pending_;
    // Set while skipping the rest of a record that outgrew the line limit.
    bool discarding_ = false;
    bool eof_ = false;
};

/**
 * Listens on `port` for the output channel and on `port + 1` for the input
 * channel, and hands out one connected pair per AcceptPair call.
 */
class TcpChannelAcceptor final : public IChannelAcceptor {
public:
    [[nodiscard]] static Result<std::unique_ptr<TcpChannelAcceptor>, ChannelFailure> Listen(
        std::string_view bind_address,
        uint16_t port);

    ~TcpChannelAcceptor() override;

    TcpChannelAcceptor(const TcpChannelAcceptor&) = delete;
    TcpChannelAcceptor& operator=(const TcpChannelAcceptor&) = delete;

    [[nodiscard]] Result<ChannelPair, ChannelFailure> AcceptPair() override;

    void Interrupt() noexcept override;

    [[nodiscard]] uint16_t Port() const noexcept { return port_; }

private:
    TcpChannelAcceptor(int output_listener, int input_listener, uint16_t port) noexcept;

    [[nodiscard]] Result<std::unique_ptr<IChannel>, ChannelFailure> AcceptOne(
        int listener, std::string_view name);

    int output_listener_;
    int input_listener_;
    uint16_t port_;
    std::atomic<bool> interrupted_{false};
};

class TcpChannelConnector final : public IChannelConnector {
public:
    TcpChannelConnector(std::string host, uint16_t port);

    [[nodiscard]] Result<ChannelPair, ChannelFailure> ConnectPair() override;

private:
    [[nodiscard]] Result<std::unique_ptr<IChannel>, ChannelFailure> ConnectOne(
        uint16_t port, std::string_view name) const;

    std::string host_;
    uint16_t port_;
};
}
