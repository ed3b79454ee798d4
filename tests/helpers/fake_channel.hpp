#pragma once
#include "shellpipe/transport/channel.hpp"
#include "shellpipe/core/constants.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <variant>

namespace shellpipe::channel::test_helpers {

using transport::ChannelPair;
using transport::IChannel;
using transport::IChannelAcceptor;
using transport::IChannelConnector;

/**
 * One direction of an in-memory stream.
 */
class ByteQueue {
public:
    void Push(std::span<const uint8_t> data) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            buffer_.append(reinterpret_cast<const char*>(data.data()), data.size());
        }
        cv_.notify_all();
    }

    void Push(std::string_view text) {
        Push(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
    }

    void Close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool IsClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    /// Blocks until bytes arrive; 0 once closed and drained.
    size_t PopSome(std::span<uint8_t> out) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !buffer_.empty() || closed_; });
        const size_t count = std::min(out.size(), buffer_.size());
        std::memcpy(out.data(), buffer_.data(), count);
        buffer_.erase(0, count);
        return count;
    }

    /// Blocks until a full line arrives; std::nullopt once closed and drained.
    std::optional<std::string> PopLine() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] {
            return buffer_.find(RelayConstants::RECORD_DELIMITER) != std::string::npos || closed_;
        });
        const size_t newline = buffer_.find(RelayConstants::RECORD_DELIMITER);
        if (newline == std::string::npos) {
            if (buffer_.empty()) {
                return std::nullopt;
            }
            std::string rest = std::move(buffer_);
            buffer_.clear();
            return rest;
        }
        std::string line = buffer_.substr(0, newline);
        buffer_.erase(0, newline + 1);
        return line;
    }

    /// Waits until at least `count` complete lines are buffered.
    bool WaitForLines(const size_t count, const std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this, count] {
            return static_cast<size_t>(std::count(buffer_.begin(), buffer_.end(),
                                                   RelayConstants::RECORD_DELIMITER)) >= count;
        });
    }

    [[nodiscard]] std::string Snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return buffer_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::string buffer_;
    bool closed_ = false;
};

/**
 * In-memory IChannel. Closing either end closes both directions, the way a
 * socket shutdown does.
 */
class FakeChannel final : public IChannel {
public:
    FakeChannel(std::shared_ptr<ByteQueue> rx, std::shared_ptr<ByteQueue> tx)
        : rx_(std::move(rx)), tx_(std::move(tx)) {}

    [[nodiscard]] Result<Unit, ChannelFailure> Write(std::span<const uint8_t> data) override {
        if (fail_writes_.load() || closed_.load() || tx_->IsClosed()) {
            return Result<Unit, ChannelFailure>::Err(
                ChannelFailure::Transport("fake channel closed"));
        }
        tx_->Push(data);
        return Result<Unit, ChannelFailure>::Ok(unit);
    }

    [[nodiscard]] Result<size_t, ChannelFailure> Read(std::span<uint8_t> buffer) override {
        return Result<size_t, ChannelFailure>::Ok(rx_->PopSome(buffer));
    }

    [[nodiscard]] Result<std::optional<std::string>, ChannelFailure> ReadLine() override {
        return Result<std::optional<std::string>, ChannelFailure>::Ok(rx_->PopLine());
    }

    [[nodiscard]] bool IsConnected() const noexcept override {
        return !closed_.load() && !rx_->IsClosed() && !tx_->IsClosed();
    }

    void Close() noexcept override {
        closed_.store(true);
        rx_->Close();
        tx_->Close();
    }

    void FailWrites() { fail_writes_.store(true); }

private:
    std::shared_ptr<ByteQueue> rx_;
    std::shared_ptr<ByteQueue> tx_;
    std::atomic<bool> closed_{false};
    std::atomic<bool> fail_writes_{false};
};

/**
 * Both ends of one in-memory connection.
 */
struct FakeLink {
    std::unique_ptr<FakeChannel> near_end;
    std::unique_ptr<FakeChannel> far_end;
};

inline FakeLink MakeLink() {
    auto forward = std::make_shared<ByteQueue>();
    auto backward = std::make_shared<ByteQueue>();
    return {
        std::make_unique<FakeChannel>(backward, forward),
        std::make_unique<FakeChannel>(forward, backward),
    };
}

/**
 * A connected channel pair plus raw handles to the peer side.
 */
struct FakePairLinks {
    ChannelPair local;
    std::unique_ptr<FakeChannel> remote_output;
    std::unique_ptr<FakeChannel> remote_input;
    FakeChannel* local_output = nullptr;
    FakeChannel* local_input = nullptr;
};

inline FakePairLinks MakePairLinks() {
    auto output_link = MakeLink();
    auto input_link = MakeLink();
    FakePairLinks links;
    links.local_output = output_link.near_end.get();
    links.local_input = input_link.near_end.get();
    links.local.output = std::move(output_link.near_end);
    links.local.input = std::move(input_link.near_end);
    links.remote_output = std::move(output_link.far_end);
    links.remote_input = std::move(input_link.far_end);
    return links;
}

/**
 * Acceptor fed by the test: each AcceptPair takes the next scripted pair
 * or failure, blocking until one is queued.
 */
class FakeAcceptor final : public IChannelAcceptor {
public:
    void QueuePair(ChannelPair pair) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.emplace_back(std::move(pair));
        }
        cv_.notify_all();
    }

    void QueueFailure(std::string message) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.emplace_back(ChannelFailure::Transport(std::move(message)));
        }
        cv_.notify_all();
    }

    [[nodiscard]] Result<ChannelPair, ChannelFailure> AcceptPair() override {
        std::unique_lock<std::mutex> lock(mutex_);
        ++accept_calls_;
        cv_.notify_all();
        cv_.wait(lock, [this] { return !queue_.empty() || interrupted_; });
        if (interrupted_) {
            return Result<ChannelPair, ChannelFailure>::Err(
                ChannelFailure::Transport("Accept interrupted"));
        }
        auto next = std::move(queue_.front());
        queue_.pop_front();
        if (auto* failure = std::get_if<ChannelFailure>(&next)) {
            return Result<ChannelPair, ChannelFailure>::Err(std::move(*failure));
        }
        return Result<ChannelPair, ChannelFailure>::Ok(std::move(std::get<ChannelPair>(next)));
    }

    void Interrupt() noexcept override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            interrupted_ = true;
        }
        cv_.notify_all();
    }

    bool WaitForAcceptCalls(const int count, const std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this, count] { return accept_calls_ >= count; });
    }

    [[nodiscard]] int AcceptCalls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return accept_calls_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::variant<ChannelPair, ChannelFailure>> queue_;
    bool interrupted_ = false;
    int accept_calls_ = 0;
};

class FakeConnector final : public IChannelConnector {
public:
    explicit FakeConnector(ChannelPair pair) : pair_(std::move(pair)) {}
    explicit FakeConnector(ChannelFailure failure) : failure_(std::move(failure)) {}

    [[nodiscard]] Result<ChannelPair, ChannelFailure> ConnectPair() override {
        if (failure_.has_value()) {
            return Result<ChannelPair, ChannelFailure>::Err(*failure_);
        }
        return Result<ChannelPair, ChannelFailure>::Ok(std::move(pair_));
    }

private:
    ChannelPair pair_;
    std::optional<ChannelFailure> failure_;
};

} // namespace shellpipe::channel::test_helpers
