#ifndef PATH_PROBE_HPP
#define PATH_PROBE_HPP

#include <filesystem>
#include <system_error>

// True when something (file, directory, or even a dangling symlink) occupies the path.
// ec is set only when the status could not be determined at all.
bool pathOccupied(const std::filesystem::path& path, std::error_code& ec);

#endif
