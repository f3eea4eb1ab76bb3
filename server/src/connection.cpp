#include "chunkdrive/server/connection.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>

#include <span>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "chunkdrive/server/transfer_error.hpp"

namespace chunkdrive::server
{

    namespace
    {

        chunkdrive::protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                                const std::optional<std::string> &request_id)
        {
            chunkdrive::protocol::ResponseEnvelope envelope;
            envelope.kind = chunkdrive::protocol::ResponseKind::Ok;
            envelope.payload = std::move(payload);
            envelope.message = "";
            envelope.error = chunkdrive::ErrorCode::Ok;
            envelope.request_id = request_id;
            return envelope;
        }

    } // namespace

    Connection::Connection(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)), services_(services) {}

    Connection::~Connection()
    {
        std::error_code ec;
        socket_.close(ec);
    }

    void Connection::start()
    {
        spdlog::debug("Client connected from {}", remote_endpoint());
        read_frame_header();
    }

    void Connection::stop()
    {
        if (closed_)
        {
            return;
        }
        closed_ = true;
        std::error_code ec;
        spdlog::debug("Closing connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Connection::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             const std::uint32_t payload_size =
                                 chunkdrive::protocol::decode_frame_header(std::span<const std::uint8_t, 4>(header_buffer_));
                             if (payload_size > chunkdrive::protocol::kMaxFrameSize)
                             {
                                 spdlog::warn("{} sent an oversized frame of {} bytes", remote_endpoint(), payload_size);
                                 // No further reads; the connection closes once the error is written.
                                 send_error(chunkdrive::ErrorCode::InvalidPayload, "Frame too large",
                                            pending_ ? pending_->request_id : std::nullopt);
                                 return;
                             }
                             if (payload_size == 0 && !pending_ && !rejected_)
                             {
                                 read_frame_header();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Connection::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             on_frame();
                             read_frame_header();
                         });
    }

    void Connection::on_frame()
    {
        if (rejected_)
        {
            auto rejection = std::move(*rejected_);
            rejected_.reset();
            send_error(rejection.code, std::move(rejection.message));
            return;
        }
        if (pending_)
        {
            auto envelope = std::move(*pending_);
            pending_.reset();
            handle_upload_chunk(envelope);
            return;
        }
        try
        {
            const std::string payload(reinterpret_cast<const char *>(buffer_.data()), buffer_.size());
            const auto json = nlohmann::json::parse(payload);
            process_message(json);
        }
        catch (const std::exception &ex)
        {
            send_error(chunkdrive::ErrorCode::InvalidPayload, ex.what());
        }
    }

    void Connection::process_message(const nlohmann::json &json)
    {
        chunkdrive::protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<chunkdrive::protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            if (chunkdrive::protocol::announces_payload(json))
            {
                rejected_ = Rejection{chunkdrive::ErrorCode::InvalidCommand, ex.what()};
                return;
            }
            send_error(chunkdrive::ErrorCode::InvalidCommand, ex.what());
            return;
        }

        spdlog::trace("{} -> command {}", remote_endpoint(), chunkdrive::protocol::to_string(envelope.command));

        if (chunkdrive::protocol::carries_payload(envelope.command))
        {
            pending_ = std::move(envelope);
            return;
        }

        switch (envelope.command)
        {
        case chunkdrive::protocol::Command::Ping:
            handle_ping(envelope);
            break;
        default:
            send_error(chunkdrive::ErrorCode::Unsupported, "Command not supported", envelope.request_id);
            break;
        }
    }

    void Connection::send_response(const chunkdrive::protocol::ResponseEnvelope &envelope)
    {
        if (closed_)
        {
            return;
        }
        try
        {
            const auto json = nlohmann::json(envelope);
            auto frame = std::make_shared<std::vector<std::uint8_t>>(chunkdrive::protocol::encode_frame(json));
            auto self = shared_from_this();
            asio::async_write(socket_, asio::buffer(*frame),
                              [this, self, frame](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                              {
                                  if (ec)
                                  {
                                      stop();
                                  }
                              });
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to encode response for {}: {}", remote_endpoint(), ex.what());
            stop();
        }
    }

    void Connection::send_error(chunkdrive::ErrorCode code, std::string message, std::optional<std::string> request_id)
    {
        chunkdrive::protocol::ResponseEnvelope envelope;
        envelope.kind = chunkdrive::protocol::ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.request_id = std::move(request_id);
        send_response(envelope);
    }

    void Connection::handle_ping(const chunkdrive::protocol::RequestEnvelope &envelope)
    {
        send_response(make_ok_response(nlohmann::json::object(), envelope.request_id));
    }

    void Connection::handle_upload_chunk(const chunkdrive::protocol::RequestEnvelope &envelope)
    {
        chunkdrive::protocol::ChunkMetadata metadata;
        try
        {
            metadata = envelope.payload.get<chunkdrive::protocol::ChunkMetadata>();
        }
        catch (const std::exception &ex)
        {
            send_error(chunkdrive::ErrorCode::InvalidPayload, std::string("Invalid chunk info: ") + ex.what(),
                       envelope.request_id);
            return;
        }

        try
        {
            const auto payload = std::as_bytes(std::span(buffer_.data(), buffer_.size()));
            const auto ack = services_.receiver.receive(metadata, payload);
            if (ack.completed)
            {
                spdlog::info("Completed chunked upload {} from {}", metadata.file_name, remote_endpoint());
            }
            send_response(make_ok_response(ack, envelope.request_id));
        }
        catch (const TransferError &error)
        {
            if (chunkdrive::is_client_error(error.code()))
            {
                spdlog::warn("Rejected chunk {} of {} from {}: {}", metadata.chunk_index, metadata.file_name,
                             remote_endpoint(), error.what());
            }
            else
            {
                spdlog::error("Chunk {} of {} from {} failed: {}", metadata.chunk_index, metadata.file_name,
                              remote_endpoint(), error.what());
            }
            send_error(error.code(), error.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Chunk {} of {} from {} failed: {}", metadata.chunk_index, metadata.file_name,
                          remote_endpoint(), ex.what());
            send_error(chunkdrive::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    std::string Connection::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace chunkdrive::server
