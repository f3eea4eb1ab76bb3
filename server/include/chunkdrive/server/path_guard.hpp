#pragma once

#include <filesystem>
#include <string>

namespace chunkdrive::server
{

    // Resolves upload destinations and refuses anything outside the base directory.
    class PathGuard
    {
    public:
        explicit PathGuard(std::filesystem::path base);

        const std::filesystem::path &base() const noexcept { return base_; }

        // base / target_dir / file_name, after traversal and containment checks.
        std::filesystem::path resolve_target(const std::string &target_dir, const std::string &file_name) const;

        bool contains(const std::filesystem::path &path) const;

    private:
        std::filesystem::path sanitize(const std::string &requested) const;

        std::filesystem::path base_;
    };

} // namespace chunkdrive::server
