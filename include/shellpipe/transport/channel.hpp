#pragma once
#include "shellpipe/core/result.hpp"
#include "shellpipe/core/failures.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
namespace shellpipe::channel::transport {

/**
 * One direction-agnostic, reliable, ordered byte stream.
 *
 * Reads and writes block. Close() may be called from another thread and
 * must unblock a pending Read or ReadLine, which then report end of stream.
 */
class IChannel {
public:
    virtual ~IChannel() = default;

    [[nodiscard]] virtual Result<Unit, ChannelFailure> Write(std::span<const uint8_t> data) = 0;

    /**
     * @return Bytes read, 0 on end of stream
     */
    [[nodiscard]] virtual Result<size_t, ChannelFailure> Read(std::span<uint8_t> buffer) = 0;

    /**
     * @return One line without its '\n', std::nullopt on end of stream.
     *         A final unterminated line is returned before end of stream.
     *         A Decode failure reports a record that was skipped because it
     *         outgrew the line limit; the stream stays usable after it.
     */
    [[nodiscard]] virtual Result<std::optional<std::string>, ChannelFailure> ReadLine() = 0;

    [[nodiscard]] virtual bool IsConnected() const noexcept = 0;

    virtual void Close() noexcept = 0;
};

/**
 * The two channels of a session, named from the server's point of view:
 * the server writes host output to `output` and reads host input from
 * `input`. The client uses them the other way round.
 */
struct ChannelPair {
    std::unique_ptr<IChannel> output;
    std::unique_ptr<IChannel> input;

    [[nodiscard]] bool IsConnected() const noexcept {
        return output && input && output->IsConnected() && input->IsConnected();
    }

    void Close() noexcept {
        if (output) {
            output->Close();
        }
        if (input) {
            input->Close();
        }
    }
};

class IChannelAcceptor {
public:
    virtual ~IChannelAcceptor() = default;

    /**
     * Block until a peer has connected both channels.
     */
    [[nodiscard]] virtual Result<ChannelPair, ChannelFailure> AcceptPair() = 0;

    /**
     * Make a pending or future AcceptPair fail with a Transport failure.
     * Safe to call from another thread or a signal-driven stop path.
     */
    virtual void Interrupt() noexcept = 0;
};

class IChannelConnector {
public:
    virtual ~IChannelConnector() = default;

    [[nodiscard]] virtual Result<ChannelPair, ChannelFailure> ConnectPair() = 0;
};
}
