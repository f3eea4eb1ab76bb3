#include "chunkdrive/server/path_guard.hpp"

#include <algorithm>

#include "chunkdrive/protocol.hpp"
#include "chunkdrive/server/transfer_error.hpp"

namespace chunkdrive::server
{

    namespace
    {
        bool is_within(const std::filesystem::path &base, const std::filesystem::path &candidate)
        {
            const auto mismatch = std::mismatch(base.begin(), base.end(), candidate.begin(), candidate.end());
            return mismatch.first == base.end();
        }
    } // namespace

    PathGuard::PathGuard(std::filesystem::path base)
    {
        std::filesystem::create_directories(base);
        base_ = std::filesystem::canonical(base);
    }

    std::filesystem::path PathGuard::resolve_target(const std::string &target_dir, const std::string &file_name) const
    {
        if (!chunkdrive::protocol::is_safe_file_name(file_name))
        {
            throw TransferError(chunkdrive::ErrorCode::PermissionDenied, "Invalid file name: " + file_name);
        }
        auto target = sanitize(target_dir) / file_name;
        if (!contains(target))
        {
            throw TransferError(chunkdrive::ErrorCode::PermissionDenied, "Destination escapes the base directory");
        }
        return target;
    }

    bool PathGuard::contains(const std::filesystem::path &path) const
    {
        // Resolves symlinks in the existing prefix of the path.
        std::error_code ec;
        const auto resolved = std::filesystem::weakly_canonical(path, ec);
        if (ec)
        {
            return false;
        }
        return resolved != base_ && is_within(base_, resolved);
    }

    std::filesystem::path PathGuard::sanitize(const std::string &requested) const
    {
        std::filesystem::path relative = requested;
        if (!requested.empty() && relative.is_absolute())
        {
            relative = relative.lexically_relative("/");
        }

        std::filesystem::path sanitized = base_;
        for (const auto &part : relative)
        {
            const auto part_string = part.generic_string();
            if (part_string.empty() || part_string == ".")
            {
                continue;
            }
            if (part_string == "..")
            {
                throw TransferError(chunkdrive::ErrorCode::PermissionDenied, "Path traversal detected");
            }
            sanitized /= part;
        }
        return sanitized;
    }

} // namespace chunkdrive::server
