#include "chunkdrive/server/upload_session.hpp"

#include <string>

namespace chunkdrive::server
{

    std::string TransferIdentity::key() const
    {
        std::string key = target_path.generic_string();
        key += '\n';
        key += std::to_string(total_size);
        key += '\n';
        key += upload_token;
        return key;
    }

    std::string_view to_string(SessionState state) noexcept
    {
        switch (state)
        {
        case SessionState::Active:
            return "active";
        case SessionState::Completed:
            return "completed";
        case SessionState::Failed:
            return "failed";
        case SessionState::Evicted:
            return "evicted";
        }
        return "unknown";
    }

    UploadSession::UploadSession(TransferIdentity identity_in, std::string file_name_in, std::uint64_t total_chunks_in,
                                 std::filesystem::path temp_area_in, Clock::time_point created)
        : identity(std::move(identity_in)),
          file_name(std::move(file_name_in)),
          total_chunks(total_chunks_in),
          temp_area(std::move(temp_area_in)),
          received(static_cast<std::size_t>(total_chunks_in), false),
          chunk_sizes(static_cast<std::size_t>(total_chunks_in), 0),
          last_activity(created)
    {
    }

    std::filesystem::path UploadSession::chunk_path(std::uint64_t index) const
    {
        return temp_area / ("chunk_" + std::to_string(index));
    }

} // namespace chunkdrive::server
