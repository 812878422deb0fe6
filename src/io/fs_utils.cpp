#include "io/fs_utils.hpp"

#include <algorithm>
#include <cstdint>

namespace fs = std::filesystem;

namespace begone::io
{

    std::vector<fs::directory_entry> listEntries(const fs::path &dir, std::error_code &ec)
    {
        std::vector<fs::directory_entry> out;
        ec.clear();

        fs::directory_iterator it(dir, ec);
        const fs::directory_iterator end;
        while (!ec && it != end)
        {
            out.push_back(*it);
            it.increment(ec);
        }
        if (ec)
        {
            out.clear();
            return out;
        }

        std::sort(out.begin(), out.end(), [](const fs::directory_entry &a, const fs::directory_entry &b)
                  { return a.path().filename() < b.path().filename(); });
        return out;
    }

    bool isDirectoryEntry(const fs::directory_entry &entry, bool &isLink, std::error_code &ec)
    {
        ec.clear();
        const fs::file_status linkStatus = entry.symlink_status(ec);
        if (ec)
        {
            return false;
        }

        isLink = fs::is_symlink(linkStatus);
        if (!isLink)
        {
            return fs::is_directory(linkStatus);
        }

        // A dangling link is not a directory and not an error.
        std::error_code targetEc;
        const fs::file_status target = entry.status(targetEc);
        return !targetEc && fs::is_directory(target);
    }

    bool removePath(const fs::path &path, std::error_code &ec)
    {
        ec.clear();
        const fs::file_status linkStatus = fs::symlink_status(path, ec);
        if (ec)
        {
            return false;
        }

        if (fs::is_symlink(linkStatus) || !fs::is_directory(linkStatus))
        {
            const bool ok = fs::remove(path, ec);
            return ok && !ec;
        }

        const std::uintmax_t removed = fs::remove_all(path, ec);
        return removed != static_cast<std::uintmax_t>(-1) && !ec;
    }

} // namespace begone::io
