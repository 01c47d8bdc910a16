// © 2026 Beatrix Zselezny. All rights reserved.
// Preflight Bootstrap Framework

#include "core/FileSystem.hpp"
#include <unistd.h>

namespace fs = std::filesystem;

namespace Preflight::Core {

    namespace {
        // not_found (ENOENT, ENOTDIR) a válasz, nem hiba; pl. ELOOP vagy EACCES igen
        bool settle(const fs::file_status& st, std::error_code& ec) {
            if (st.type() == fs::file_type::not_found) {
                ec.clear();
                return false;
            }
            return !ec;
        }
    }

    bool LocalFileSystem::entryExists(const fs::path& p, std::error_code& ec) const {
        ec.clear();
        return settle(fs::symlink_status(p, ec), ec);
    }

    bool LocalFileSystem::isDirectory(const fs::path& p, std::error_code& ec) const {
        ec.clear();
        auto st = fs::status(p, ec);
        return settle(st, ec) && st.type() == fs::file_type::directory;
    }

    bool LocalFileSystem::isRegularFile(const fs::path& p) const {
        std::error_code ec;
        return fs::is_regular_file(p, ec);
    }

    bool LocalFileSystem::isExecutable(const fs::path& p) const {
        return isRegularFile(p) && access(p.c_str(), X_OK) == 0;
    }

    bool LocalFileSystem::removeEntry(const fs::path& p, std::error_code& ec) {
        ec.clear();
        return fs::remove(p, ec);
    }
}
