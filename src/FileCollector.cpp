#include "FileCollector.hpp"

#include <system_error>

namespace fs = std::filesystem;

CollectionError::CollectionError(const fs::path& path, const std::string& reason)
    : std::runtime_error("cannot read `" + path.string() + "`: " + reason), m_path(path) {}

const fs::path& CollectionError::path() const {
    return m_path;
}

namespace {
bool isDanglingLink(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory ||
           ec == std::errc::too_many_symbolic_link_levels;
}

template <typename Iterator>
std::vector<fs::path> drain(const fs::path& root, Iterator iter) {
    std::vector<fs::path> files;
    std::error_code ec;

    for (const Iterator end{}; iter != end; iter.increment(ec)) {
        if (ec) {
            break;
        }

        std::error_code statusErr;
        const bool regular = iter->is_regular_file(statusErr);
        if (statusErr) {
            // Broken or looping symlinks point at nothing to sort; only unreadable entries are fatal.
            if (isDanglingLink(statusErr)) {
                continue;
            }
            throw CollectionError(iter->path(), statusErr.message());
        }
        if (regular) {
            files.push_back(iter->path());
        }
    }

    if (ec) {
        throw CollectionError(root, ec.message());
    }
    return files;
}
} // namespace

std::vector<fs::path> collectFiles(const fs::path& root, bool recursive) {
    std::error_code ec;
    if (!recursive) {
        fs::directory_iterator iter(root, ec);
        if (ec) {
            throw CollectionError(root, ec.message());
        }
        return drain(root, std::move(iter));
    }

    fs::recursive_directory_iterator iter(root, ec);
    if (ec) {
        throw CollectionError(root, ec.message());
    }
    return drain(root, std::move(iter));
}
