#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>

#include "chunkdrive/server/session_registry.hpp"
#include "chunkdrive/server/upload_session.hpp"

namespace chunkdrive::server
{

    struct FinalizeResult
    {
        std::filesystem::path path;
        std::uint64_t bytes{};
        std::uint32_t checksum{};
    };

    // Concatenates a complete session's chunks, in index order, into the destination.
    class Finalizer
    {
    public:
        explicit Finalizer(SessionRegistry &registry);

        // Returns nullopt when the session is not complete or was finalized already.
        // Throws TransferError(StorageFailure) leaving the session active, or
        // TransferError(ReassemblyFailed) leaving it failed with its scratch area intact.
        std::optional<FinalizeResult> finalize(const std::shared_ptr<UploadSession> &session);

    private:
        FinalizeResult assemble(UploadSession &session);
        FinalizeResult write_part(UploadSession &session, const std::filesystem::path &part);

        SessionRegistry &registry_;
    };

} // namespace chunkdrive::server
