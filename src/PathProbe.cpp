#include "PathProbe.hpp"

bool pathOccupied(const std::filesystem::path& path, std::error_code& ec) {
    std::error_code statusErr;
    const auto status = std::filesystem::symlink_status(path, statusErr);
    if (status.type() == std::filesystem::file_type::none) {
        ec = statusErr;
        return false;
    }

    ec.clear();
    return std::filesystem::exists(status);
}
