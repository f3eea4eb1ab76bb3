#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "chunkdrive/error_codes.hpp"
#include "chunkdrive/framing.hpp"
#include "chunkdrive/protocol.hpp"
#include "chunkdrive/server/chunk_receiver.hpp"

namespace chunkdrive::server
{

    struct ServerServices
    {
        ChunkReceiver &receiver;
    };

    // One TCP connection. Reads a JSON envelope frame and, for chunk uploads,
    // the raw payload frame that follows it.
    class Connection : public std::enable_shared_from_this<Connection>
    {
    public:
        Connection(asio::ip::tcp::socket socket, ServerServices services);
        ~Connection();

        void start();

        void stop();

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void on_frame();
        void process_message(const nlohmann::json &json);
        void send_response(const chunkdrive::protocol::ResponseEnvelope &envelope);
        void send_error(chunkdrive::ErrorCode code, std::string message,
                        std::optional<std::string> request_id = std::nullopt);

        void handle_ping(const chunkdrive::protocol::RequestEnvelope &envelope);
        void handle_upload_chunk(const chunkdrive::protocol::RequestEnvelope &envelope);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;

        std::array<std::uint8_t, chunkdrive::protocol::kFrameHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        // Envelope waiting for its payload frame.
        std::optional<chunkdrive::protocol::RequestEnvelope> pending_;
        // Rejected chunk envelope; answered once its payload frame is consumed.
        struct Rejection
        {
            chunkdrive::ErrorCode code;
            std::string message;
        };
        std::optional<Rejection> rejected_;
        bool closed_{false};
    };

} // namespace chunkdrive::server
