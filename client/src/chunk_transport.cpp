#include "chunkdrive/client/chunk_transport.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkdrive/framing.hpp"

namespace chunkdrive::client
{

    TransferFailure::TransferFailure(chunkdrive::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    TcpChunkTransport::TcpChunkTransport(std::string host, std::uint16_t port, std::chrono::milliseconds timeout)
        : host_(std::move(host)), port_(port), timeout_(timeout), socket_(io_context_) {}

    TcpChunkTransport::~TcpChunkTransport()
    {
        close();
    }

    void TcpChunkTransport::ping()
    {
        ensure_connected();
        chunkdrive::protocol::RequestEnvelope request{
            .command = chunkdrive::protocol::Command::Ping,
            .payload = nlohmann::json::object(),
            .request_id = next_request_id(),
        };
        const auto response = exchange(request, std::nullopt);
        if (response.kind != chunkdrive::protocol::ResponseKind::Ok)
        {
            close();
            throw TransferFailure(response.error, "Ping rejected: " + response.message);
        }
    }

    chunkdrive::protocol::ChunkAck TcpChunkTransport::send_chunk(const chunkdrive::protocol::ChunkMetadata &metadata,
                                                                 std::span<const std::byte> payload)
    {
        ensure_connected();
        chunkdrive::protocol::RequestEnvelope request{
            .command = chunkdrive::protocol::Command::UploadChunk,
            .payload = metadata,
            .request_id = next_request_id(),
        };
        const auto response = exchange(request, payload);
        if (response.kind != chunkdrive::protocol::ResponseKind::Ok)
        {
            throw TransferFailure(response.error, std::string(chunkdrive::to_string(response.error)) + ": " +
                                                      response.message);
        }
        return response.payload.get<chunkdrive::protocol::ChunkAck>();
    }

    void TcpChunkTransport::ensure_connected()
    {
        if (connected_)
        {
            return;
        }
        std::error_code error;
        asio::ip::tcp::resolver resolver(io_context_);
        const auto endpoints = resolver.resolve(host_, std::to_string(port_), error);
        if (error)
        {
            throw TransferFailure(chunkdrive::ErrorCode::TransportFailure,
                                  "Cannot resolve " + host_ + ": " + error.message());
        }

        asio::async_connect(socket_, endpoints,
                            [&error](const std::error_code &ec, const asio::ip::tcp::endpoint & /*endpoint*/)
                            { error = ec; });
        run_until_complete("connect");
        if (error)
        {
            close();
            throw TransferFailure(chunkdrive::ErrorCode::TransportFailure,
                                  "Cannot connect to " + host_ + ":" + std::to_string(port_) + ": " + error.message());
        }
        connected_ = true;
        ping();
    }

    chunkdrive::protocol::ResponseEnvelope TcpChunkTransport::exchange(
        const chunkdrive::protocol::RequestEnvelope &request, std::optional<std::span<const std::byte>> payload)
    {
        const auto frame = chunkdrive::protocol::encode_frame(nlohmann::json(request));
        std::array<std::uint8_t, chunkdrive::protocol::kFrameHeaderSize> payload_header{};
        std::vector<asio::const_buffer> buffers{asio::buffer(frame)};
        if (payload)
        {
            if (payload->size() > chunkdrive::protocol::kMaxFrameSize)
            {
                throw TransferFailure(chunkdrive::ErrorCode::InvalidPayload, "Chunk too large to send");
            }
            payload_header = chunkdrive::protocol::encode_frame_header(static_cast<std::uint32_t>(payload->size()));
            buffers.push_back(asio::buffer(payload_header));
            buffers.push_back(asio::buffer(payload->data(), payload->size()));
        }

        std::error_code error;
        asio::async_write(socket_, buffers,
                          [&error](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          { error = ec; });
        run_until_complete("send");
        if (error)
        {
            close();
            throw TransferFailure(chunkdrive::ErrorCode::TransportFailure, "Send failed: " + error.message());
        }
        return read_response();
    }

    chunkdrive::protocol::ResponseEnvelope TcpChunkTransport::read_response()
    {
        std::array<std::uint8_t, chunkdrive::protocol::kFrameHeaderSize> header{};
        std::error_code error;
        asio::async_read(socket_, asio::buffer(header),
                         [&error](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         { error = ec; });
        run_until_complete("receive");
        if (error)
        {
            close();
            throw TransferFailure(chunkdrive::ErrorCode::TransportFailure, "Receive failed: " + error.message());
        }

        const auto size = chunkdrive::protocol::decode_frame_header(header);
        if (size > chunkdrive::protocol::kMaxFrameSize)
        {
            close();
            throw TransferFailure(chunkdrive::ErrorCode::TransportFailure, "Response frame too large");
        }
        std::vector<char> body(size);
        asio::async_read(socket_, asio::buffer(body),
                         [&error](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         { error = ec; });
        run_until_complete("receive");
        if (error)
        {
            close();
            throw TransferFailure(chunkdrive::ErrorCode::TransportFailure, "Receive failed: " + error.message());
        }

        try
        {
            return nlohmann::json::parse(body.begin(), body.end()).get<chunkdrive::protocol::ResponseEnvelope>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            close();
            throw TransferFailure(chunkdrive::ErrorCode::TransportFailure,
                                  std::string("Malformed response: ") + ex.what());
        }
    }

    void TcpChunkTransport::run_until_complete(const char *operation)
    {
        io_context_.restart();
        io_context_.run_for(timeout_);
        if (!io_context_.stopped())
        {
            // Timed out: closing the socket aborts the pending operation.
            close();
            io_context_.run();
            throw TransferFailure(chunkdrive::ErrorCode::Timeout,
                                  std::string(operation) + " timed out after " + std::to_string(timeout_.count()) +
                                      " ms");
        }
    }

    void TcpChunkTransport::close()
    {
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        connected_ = false;
    }

    std::string TcpChunkTransport::next_request_id()
    {
        return "chunk-" + std::to_string(++request_counter_);
    }

} // namespace chunkdrive::client
