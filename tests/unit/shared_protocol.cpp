#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkdrive/checksum.hpp"
#include "chunkdrive/chunk_plan.hpp"
#include "chunkdrive/crypto.hpp"
#include "chunkdrive/error_codes.hpp"
#include "chunkdrive/framing.hpp"
#include "chunkdrive/protocol.hpp"

using namespace chunkdrive;
using namespace chunkdrive::protocol;

void run_server_component_tests();
void run_client_transfer_tests();

namespace
{

    std::vector<std::byte> bytes_of(const std::string &text)
    {
        std::vector<std::byte> out(text.size());
        for (std::size_t i = 0; i < text.size(); ++i)
        {
            out[i] = static_cast<std::byte>(text[i]);
        }
        return out;
    }

    void test_crc32_known_values()
    {
        const auto check = bytes_of("123456789");
        assert(checksum::crc32(check) == 0xCBF43926u);
        assert(checksum::crc32(std::span<const std::byte>{}) == 0u);

        const auto fox = bytes_of("The quick brown fox jumps over the lazy dog");
        assert(checksum::crc32(fox) == 0x414FA339u);
    }

    void test_crc32_incremental()
    {
        const auto data = bytes_of("The quick brown fox jumps over the lazy dog");
        const auto whole = checksum::crc32(data);

        for (std::size_t split = 0; split <= data.size(); split += 7)
        {
            checksum::Crc32 running;
            running.update(std::span<const std::byte>(data).first(split));
            // Continue from the raw running state, as a second reader would.
            checksum::Crc32 resumed(running.running_state());
            resumed.update(std::span<const std::byte>(data).subspan(split));
            assert(resumed.value() == whole);
        }

        checksum::Crc32 untouched;
        assert(untouched.value() == 0u);
    }

    void test_chunk_size_tiers()
    {
        assert(select_chunk_size(0) == kMinChunkSize);
        assert(select_chunk_size(kMiB - 1) == 256 * kKiB);
        // Each tier includes its upper bound.
        assert(select_chunk_size(kMiB) == 256 * kKiB);
        assert(select_chunk_size(kMiB + 1) == 1 * kMiB);
        assert(select_chunk_size(100 * kMiB) == 1 * kMiB);
        assert(select_chunk_size(100 * kMiB + 1) == 5 * kMiB);
        assert(select_chunk_size(kGiB) == 5 * kMiB);
        assert(select_chunk_size(kGiB + 1) == 10 * kMiB);
        assert(select_chunk_size(40 * kGiB) == kMaxChunkSize);
    }

    void test_chunk_plan()
    {
        const auto empty = plan_chunks(0);
        assert(empty.total_chunks == 1);
        const auto only = empty.slice(0);
        assert(only.offset == 0 && only.size == 0);
        assert(empty.is_last(0));

        const auto three = plan_chunks(3 * kMiB);
        assert(three.chunk_size == kMiB);
        assert(three.total_chunks == 3);
        assert(three.slice(2).offset == 2 * kMiB);
        assert(three.slice(2).size == kMiB);

        const auto uneven = plan_chunks(10, 4);
        assert(uneven.total_chunks == 3);
        assert(uneven.slice(0).size == 4);
        assert(uneven.slice(2).offset == 8);
        assert(uneven.slice(2).size == 2);

        std::uint64_t covered = 0;
        for (std::uint64_t i = 0; i < uneven.total_chunks; ++i)
        {
            const auto slice = uneven.slice(i);
            assert(slice.offset == covered);
            covered += slice.size;
        }
        assert(covered == 10);

        bool out_of_range = false;
        try
        {
            (void)uneven.slice(3);
        }
        catch (const std::out_of_range &)
        {
            out_of_range = true;
        }
        assert(out_of_range);

        bool invalid = false;
        try
        {
            (void)plan_chunks(10, 0);
        }
        catch (const std::invalid_argument &)
        {
            invalid = true;
        }
        assert(invalid);
    }

    void test_chunk_metadata_json()
    {
        ChunkMetadata metadata{
            .file_name = "report.pdf",
            .chunk_index = 2,
            .total_chunks = 3,
            .chunk_size = 1024,
            .total_size = 3000,
            .chunk_checksum = 0xDEADBEEFu,
            .file_checksum = 0x01020304u,
            .target_dir = "docs/2024",
            .upload_token = std::string("abc123"),
        };

        const auto json = nlohmann::json(metadata);
        assert(json.at("fileName") == "report.pdf");
        assert(json.at("chunkIndex") == 2);
        assert(json.at("targetDir") == "docs/2024");

        const auto decoded = json.get<ChunkMetadata>();
        assert(decoded.file_name == metadata.file_name);
        assert(decoded.chunk_index == 2);
        assert(decoded.total_size == 3000);
        assert(decoded.chunk_checksum == 0xDEADBEEFu);
        assert(decoded.file_checksum == 0x01020304u);
        assert(decoded.upload_token == metadata.upload_token);

        metadata.target_dir.clear();
        metadata.upload_token.reset();
        const auto plain = nlohmann::json(metadata);
        assert(!plain.contains("targetDir"));
        const auto plain_decoded = plain.get<ChunkMetadata>();
        assert(plain_decoded.target_dir.empty());
        assert(!plain_decoded.upload_token.has_value());

        auto negative = nlohmann::json(metadata);
        negative["chunkIndex"] = -1;
        bool rejected = false;
        try
        {
            (void)negative.get<ChunkMetadata>();
        }
        catch (const std::exception &)
        {
            rejected = true;
        }
        assert(rejected);

        auto missing = nlohmann::json(metadata);
        missing.erase("totalChunks");
        rejected = false;
        try
        {
            (void)missing.get<ChunkMetadata>();
        }
        catch (const std::exception &)
        {
            rejected = true;
        }
        assert(rejected);
    }

    void test_envelopes()
    {
        RequestEnvelope request{};
        request.command = Command::Ping;
        request.request_id = std::string("chunk-7");
        const auto decoded_request = nlohmann::json(request).get<RequestEnvelope>();
        assert(decoded_request.command == Command::Ping);
        assert(decoded_request.request_id == request.request_id);
        assert(!carries_payload(Command::Ping));
        assert(carries_payload(Command::UploadChunk));
        assert(command_from_string("UPLOAD_CHUNK") == Command::UploadChunk);
        assert(!command_from_string("LIST").has_value());

        // A chunk envelope announces its payload frame even when other fields are broken.
        assert(announces_payload(nlohmann::json{{"cmd", "UPLOAD_CHUNK"}, {"id", 42}}));
        assert(!announces_payload(nlohmann::json{{"cmd", "PING"}, {"id", 42}}));
        assert(!announces_payload(nlohmann::json{{"cmd", 7}}));
        assert(!announces_payload(nlohmann::json::array()));

        ResponseEnvelope response{};
        response.kind = ResponseKind::Ok;
        response.payload = ChunkAck{.received_chunks = 2, .total_chunks = 3, .completed = false};
        response.request_id = std::string("chunk-7");
        const auto decoded_response = nlohmann::json(response).get<ResponseEnvelope>();
        assert(decoded_response.kind == ResponseKind::Ok);
        const auto ack = decoded_response.payload.get<ChunkAck>();
        assert(ack.received_chunks == 2 && ack.total_chunks == 3 && !ack.completed);

        ResponseEnvelope failure{};
        failure.kind = ResponseKind::Error;
        failure.error = ErrorCode::ChecksumMismatch;
        failure.message = "bad chunk";
        const auto decoded_failure = nlohmann::json(failure).get<ResponseEnvelope>();
        assert(decoded_failure.error == ErrorCode::ChecksumMismatch);
        assert(decoded_failure.message == "bad chunk");
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::SessionExpired) == "session_expired");
        assert(error_code_from_int(to_int(ErrorCode::ReassemblyFailed)) == ErrorCode::ReassemblyFailed);
        assert(error_code_from_int(999) == ErrorCode::InternalError);
        assert(is_client_error(ErrorCode::ChecksumMismatch));
        assert(is_client_error(ErrorCode::PermissionDenied));
        assert(!is_client_error(ErrorCode::StorageFailure));
        assert(!is_client_error(ErrorCode::SessionExpired));
    }

    void test_framing()
    {
        RequestEnvelope envelope{};
        envelope.command = Command::UploadChunk;
        envelope.payload = ChunkMetadata{.file_name = "a.bin", .total_chunks = 1, .chunk_size = 4, .total_size = 4};

        const auto frame = encode_frame(nlohmann::json(envelope));
        const auto partial = try_decode_frame(std::span<const std::uint8_t>(frame.data(), frame.size() - 1));
        assert(!partial.has_value());
        const auto decoded = try_decode_frame(std::span<const std::uint8_t>(frame.data(), frame.size()));
        assert(decoded.has_value());
        assert(decoded->bytes_consumed == frame.size());
        assert(decoded->message.get<RequestEnvelope>().command == Command::UploadChunk);

        const auto header = encode_frame_header(0x01020304u);
        assert(header[0] == 0x01 && header[3] == 0x04);

        const auto oversized = encode_frame_header(kMaxFrameSize + 1);
        bool too_large = false;
        try
        {
            (void)try_decode_frame(std::span<const std::uint8_t>(oversized.data(), oversized.size()));
        }
        catch (const std::length_error &)
        {
            too_large = true;
        }
        assert(too_large);
    }

    void test_safe_file_names()
    {
        assert(is_safe_file_name("report.pdf"));
        assert(is_safe_file_name(".hidden"));
        assert(!is_safe_file_name("a..b"));
        assert(!is_safe_file_name(""));
        assert(!is_safe_file_name("."));
        assert(!is_safe_file_name(".."));
        assert(!is_safe_file_name("../etc/passwd"));
        assert(!is_safe_file_name("/etc/passwd"));
        assert(!is_safe_file_name("dir/file"));
        assert(!is_safe_file_name("dir\\file"));
        assert(!is_safe_file_name(std::string("a\0b", 3)));
    }

    void test_crypto()
    {
        const auto first = crypto::random_token();
        const auto second = crypto::random_token();
        assert(first.size() == 32);
        assert(first != second);
        assert(crypto::random_token(4).size() == 8);
    }

} // namespace

int main()
{
    try
    {
        test_crc32_known_values();
        test_crc32_incremental();
        test_chunk_size_tiers();
        test_chunk_plan();
        test_chunk_metadata_json();
        test_envelopes();
        test_error_codes();
        test_framing();
        test_safe_file_names();
        test_crypto();
        run_server_component_tests();
        run_client_transfer_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
