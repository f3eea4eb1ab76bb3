#include "chunkdrive/server/finalizer.hpp"

#include <fstream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "chunkdrive/checksum.hpp"
#include "chunkdrive/server/transfer_error.hpp"

namespace chunkdrive::server
{

    namespace
    {
        constexpr std::size_t kCopyBufferSize = 64 * 1024;

        [[noreturn]] void fail_reassembly(UploadSession &session, const std::string &reason)
        {
            session.state = SessionState::Failed;
            spdlog::error("Reassembly of {} failed: {} (scratch area kept at {})", session.target_path().string(),
                          reason, session.temp_area.string());
            throw TransferError(chunkdrive::ErrorCode::ReassemblyFailed, reason);
        }
    } // namespace

    Finalizer::Finalizer(SessionRegistry &registry) : registry_(registry) {}

    std::optional<FinalizeResult> Finalizer::finalize(const std::shared_ptr<UploadSession> &session)
    {
        FinalizeResult result;
        {
            std::lock_guard lock(session->mutex);
            if (session->state != SessionState::Active)
            {
                spdlog::debug("Not finalizing {}: session is {}", session->target_path().string(),
                              to_string(session->state));
                return std::nullopt;
            }
            if (!session->is_complete())
            {
                return std::nullopt;
            }
            result = assemble(*session);
            session->state = SessionState::Completed;
        }

        std::error_code ec;
        std::filesystem::remove_all(session->temp_area, ec);
        if (ec)
        {
            spdlog::warn("Could not remove scratch area {}: {}", session->temp_area.string(), ec.message());
        }
        registry_.remove(session->identity, session.get());
        spdlog::info("Finalized {} ({} bytes, {} chunks, crc32 {:08x})", result.path.string(), result.bytes,
                     session->total_chunks, result.checksum);
        return result;
    }

    FinalizeResult Finalizer::assemble(UploadSession &session)
    {
        const auto &target = session.target_path();
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec)
        {
            throw TransferError(chunkdrive::ErrorCode::StorageFailure,
                                "Cannot create destination directory: " + ec.message());
        }

        // Assembled beside the destination so the final rename stays on one filesystem.
        const auto part = target.parent_path() /
                          ("." + target.filename().string() + "." + session.temp_area.filename().string() + ".part");
        FinalizeResult result;
        try
        {
            result = write_part(session, part);
        }
        catch (const TransferError &)
        {
            std::filesystem::remove(part, ec);
            throw;
        }

        std::filesystem::rename(part, target, ec);
        if (ec)
        {
            std::error_code remove_ec;
            std::filesystem::remove(part, remove_ec);
            throw TransferError(chunkdrive::ErrorCode::StorageFailure,
                                "Cannot move assembled file into " + target.string() + ": " + ec.message());
        }
        result.path = target;
        return result;
    }

    FinalizeResult Finalizer::write_part(UploadSession &session, const std::filesystem::path &part)
    {
        std::ofstream out(part, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw TransferError(chunkdrive::ErrorCode::StorageFailure, "Cannot open " + part.string());
        }

        chunkdrive::checksum::Crc32 crc;
        std::uint64_t written = 0;
        std::vector<char> buffer(kCopyBufferSize);
        for (std::uint64_t index = 0; index < session.total_chunks; ++index)
        {
            std::ifstream in(session.chunk_path(index), std::ios::binary);
            if (!in.is_open())
            {
                fail_reassembly(session, "Missing chunk " + std::to_string(index));
            }
            while (in)
            {
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const auto count = static_cast<std::size_t>(in.gcount());
                if (count == 0)
                {
                    break;
                }
                out.write(buffer.data(), static_cast<std::streamsize>(count));
                if (!out)
                {
                    throw TransferError(chunkdrive::ErrorCode::StorageFailure, "Failed writing " + part.string());
                }
                crc.update(std::as_bytes(std::span(buffer.data(), count)));
                written += count;
            }
            if (in.bad())
            {
                fail_reassembly(session, "Unreadable chunk " + std::to_string(index));
            }
        }

        out.close();
        if (!out)
        {
            throw TransferError(chunkdrive::ErrorCode::StorageFailure, "Failed flushing " + part.string());
        }
        if (written != session.total_size())
        {
            fail_reassembly(session, "Assembled " + std::to_string(written) + " bytes, expected " +
                                         std::to_string(session.total_size()));
        }
        if (session.has_file_checksum && crc.value() != session.file_checksum)
        {
            fail_reassembly(session, "Whole-file checksum mismatch");
        }

        return FinalizeResult{
            .path = part,
            .bytes = written,
            .checksum = crc.value(),
        };
    }

} // namespace chunkdrive::server
