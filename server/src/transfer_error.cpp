#include "chunkdrive/server/transfer_error.hpp"

namespace chunkdrive::server
{

    TransferError::TransferError(chunkdrive::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

} // namespace chunkdrive::server
