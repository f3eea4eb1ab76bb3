#pragma once

#include <stdexcept>
#include <string>

#include "chunkdrive/error_codes.hpp"

namespace chunkdrive::server
{

    class TransferError : public std::runtime_error
    {
    public:
        TransferError(chunkdrive::ErrorCode code, std::string message);

        chunkdrive::ErrorCode code() const noexcept { return code_; }

    private:
        chunkdrive::ErrorCode code_;
    };

} // namespace chunkdrive::server
