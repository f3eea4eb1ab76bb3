#include "chunkdrive/protocol.hpp"

#include <array>
#include <limits>
#include <stdexcept>

namespace chunkdrive::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 2> kCommandMappings{{
            {Command::UploadChunk, "UPLOAD_CHUNK"},
            {Command::Ping, "PING"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 2> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
        }};

        std::uint64_t read_unsigned(const nlohmann::json &json, const char *key,
                                    std::uint64_t max = std::numeric_limits<std::uint64_t>::max())
        {
            const auto &value = json.at(key);
            if (value.is_number_unsigned())
            {
                const auto result = value.get<std::uint64_t>();
                if (result > max)
                {
                    throw std::out_of_range(std::string("Field out of range: ") + key);
                }
                return result;
            }
            if (value.is_number_integer())
            {
                const auto result = value.get<std::int64_t>();
                if (result < 0 || static_cast<std::uint64_t>(result) > max)
                {
                    throw std::out_of_range(std::string("Field out of range: ") + key);
                }
                return static_cast<std::uint64_t>(result);
            }
            throw std::invalid_argument(std::string("Field must be an integer: ") + key);
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        if (auto it = json.find("id"); it != json.end())
        {
            envelope.request_id = it->get<std::string>();
        }
        else
        {
            envelope.request_id.reset();
        }
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        const auto error_value = json.value("error", 0u);
        envelope.error = error_code_from_int(static_cast<std::uint16_t>(error_value));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        if (auto it = json.find("id"); it != json.end())
        {
            envelope.request_id = it->get<std::string>();
        }
        else
        {
            envelope.request_id.reset();
        }
    }

    void to_json(nlohmann::json &json, const ChunkMetadata &metadata)
    {
        json = {
            {"fileName", metadata.file_name},
            {"chunkIndex", metadata.chunk_index},
            {"totalChunks", metadata.total_chunks},
            {"chunkSize", metadata.chunk_size},
            {"totalSize", metadata.total_size},
            {"chunkChecksum", metadata.chunk_checksum},
            {"fileChecksum", metadata.file_checksum},
        };
        if (!metadata.target_dir.empty())
        {
            json["targetDir"] = metadata.target_dir;
        }
        if (metadata.upload_token)
        {
            json["uploadToken"] = *metadata.upload_token;
        }
    }

    void from_json(const nlohmann::json &json, ChunkMetadata &metadata)
    {
        constexpr std::uint64_t kMaxU32 = std::numeric_limits<std::uint32_t>::max();
        metadata.file_name = json.at("fileName").get<std::string>();
        metadata.chunk_index = read_unsigned(json, "chunkIndex");
        metadata.total_chunks = read_unsigned(json, "totalChunks");
        metadata.chunk_size = read_unsigned(json, "chunkSize");
        metadata.total_size = read_unsigned(json, "totalSize");
        metadata.chunk_checksum = static_cast<std::uint32_t>(read_unsigned(json, "chunkChecksum", kMaxU32));
        metadata.file_checksum = json.contains("fileChecksum") && !json.at("fileChecksum").is_null()
                                     ? static_cast<std::uint32_t>(read_unsigned(json, "fileChecksum", kMaxU32))
                                     : 0;
        metadata.target_dir = json.value("targetDir", std::string{});
        if (auto it = json.find("uploadToken"); it != json.end() && !it->is_null())
        {
            metadata.upload_token = it->get<std::string>();
        }
        else
        {
            metadata.upload_token.reset();
        }
    }

    void to_json(nlohmann::json &json, const ChunkAck &ack)
    {
        json = {
            {"receivedChunks", ack.received_chunks},
            {"totalChunks", ack.total_chunks},
            {"completed", ack.completed},
        };
    }

    void from_json(const nlohmann::json &json, ChunkAck &ack)
    {
        ack.received_chunks = json.value("receivedChunks", 0ULL);
        ack.total_chunks = json.value("totalChunks", 0ULL);
        ack.completed = json.value("completed", false);
    }

    bool announces_payload(const nlohmann::json &json) noexcept
    {
        if (!json.is_object())
        {
            return false;
        }
        const auto it = json.find("cmd");
        if (it == json.end() || !it->is_string())
        {
            return false;
        }
        const auto command = command_from_string(it->get_ref<const std::string &>());
        return command && carries_payload(*command);
    }

    bool is_safe_file_name(std::string_view name) noexcept
    {
        if (name.empty() || name == "." || name.front() == '/')
        {
            return false;
        }
        if (name.find("..") != std::string_view::npos)
        {
            return false;
        }
        return name.find_first_of(std::string_view("/\\\0", 3)) == std::string_view::npos;
    }

} // namespace chunkdrive::protocol
