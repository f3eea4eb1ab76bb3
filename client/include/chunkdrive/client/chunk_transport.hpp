#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>

#include "chunkdrive/error_codes.hpp"
#include "chunkdrive/protocol.hpp"

namespace chunkdrive::client
{

    // A failed chunk attempt: a transport problem or a non-success response.
    class TransferFailure : public std::runtime_error
    {
    public:
        TransferFailure(chunkdrive::ErrorCode code, std::string message);

        chunkdrive::ErrorCode code() const noexcept { return code_; }

    private:
        chunkdrive::ErrorCode code_;
    };

    class ChunkTransport
    {
    public:
        virtual ~ChunkTransport() = default;

        // Returns once the receiver acknowledged the chunk; throws TransferFailure otherwise.
        virtual chunkdrive::protocol::ChunkAck send_chunk(const chunkdrive::protocol::ChunkMetadata &metadata,
                                                          std::span<const std::byte> payload) = 0;
    };

    // Each executor worker owns one transport.
    using TransportFactory = std::function<std::unique_ptr<ChunkTransport>()>;

    // Request/response over one TCP connection; every network operation is
    // bounded by `timeout` and a failed exchange drops the connection so the
    // next attempt reconnects.
    class TcpChunkTransport : public ChunkTransport
    {
    public:
        TcpChunkTransport(std::string host, std::uint16_t port, std::chrono::milliseconds timeout);
        ~TcpChunkTransport() override;

        void ping();

        chunkdrive::protocol::ChunkAck send_chunk(const chunkdrive::protocol::ChunkMetadata &metadata,
                                                  std::span<const std::byte> payload) override;

    private:
        void ensure_connected();
        chunkdrive::protocol::ResponseEnvelope exchange(const chunkdrive::protocol::RequestEnvelope &request,
                                                        std::optional<std::span<const std::byte>> payload);
        chunkdrive::protocol::ResponseEnvelope read_response();
        void run_until_complete(const char *operation);
        void close();
        std::string next_request_id();

        std::string host_;
        std::uint16_t port_;
        std::chrono::milliseconds timeout_;
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        bool connected_{false};
        std::uint64_t request_counter_{0};
    };

} // namespace chunkdrive::client
