#pragma once

#include <filesystem>
#include <system_error>
#include <vector>

namespace begone::io {

// Immediate entries of dir sorted by file name. On failure ec is set and the
// entries gathered so far are discarded.
std::vector<std::filesystem::directory_entry> listEntries(const std::filesystem::path &dir, std::error_code &ec);

// True for real directories and for symlinks that resolve to a directory.
bool isDirectoryEntry(const std::filesystem::directory_entry &entry, bool &isLink, std::error_code &ec);

// Removes a directory tree, or only the link when path is a symlink.
bool removePath(const std::filesystem::path &path, std::error_code &ec);

} // namespace begone::io
