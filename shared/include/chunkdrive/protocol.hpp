/**
 * ChunkDrive - Wire schema for chunk uploads and its JSON serialization.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "chunkdrive/error_codes.hpp"

namespace chunkdrive::protocol
{

    enum class Command : std::uint8_t
    {
        UploadChunk,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    // Commands followed by a raw payload frame.
    constexpr bool carries_payload(Command command) noexcept
    {
        return command == Command::UploadChunk;
    }

    // True when `json` names a command whose payload frame follows, even if the
    // rest of the envelope is malformed.
    bool announces_payload(const nlohmann::json &json) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    // Metadata half of a chunk request. The raw bytes travel in the next frame.
    struct ChunkMetadata
    {
        std::string file_name;
        std::uint64_t chunk_index{};
        std::uint64_t total_chunks{};
        std::uint64_t chunk_size{};
        std::uint64_t total_size{};
        std::uint32_t chunk_checksum{};
        // Only set on the last chunk.
        std::uint32_t file_checksum{};
        std::string target_dir{};
        std::optional<std::string> upload_token{};
    };

    void to_json(nlohmann::json &json, const ChunkMetadata &metadata);
    void from_json(const nlohmann::json &json, ChunkMetadata &metadata);

    struct ChunkAck
    {
        std::uint64_t received_chunks{};
        std::uint64_t total_chunks{};
        bool completed{};
    };

    void to_json(nlohmann::json &json, const ChunkAck &ack);
    void from_json(const nlohmann::json &json, ChunkAck &ack);

    // Rejects names that could climb out of the destination directory.
    bool is_safe_file_name(std::string_view name) noexcept;

} // namespace chunkdrive::protocol
