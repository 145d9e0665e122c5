#ifndef FILE_COLLECTOR_HPP
#define FILE_COLLECTOR_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

// Raised when the source tree cannot be enumerated; the run must not continue.
class CollectionError : public std::runtime_error {
public:
    CollectionError(const std::filesystem::path& path, const std::string& reason);

    const std::filesystem::path& path() const;

private:
    std::filesystem::path m_path;
};

// List the regular files under root. Without recursion only direct children are returned.
// Throws CollectionError on any enumeration failure; never returns a partial list.
std::vector<std::filesystem::path> collectFiles(const std::filesystem::path& root, bool recursive);

#endif
