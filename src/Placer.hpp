#ifndef PLACER_HPP
#define PLACER_HPP

#include "Category.hpp"

#include <filesystem>
#include <optional>

// Where a candidate goes. When collision is set the file already sits at its destination.
struct Placement {
    std::filesystem::path source;
    std::filesystem::path destinationDir;
    std::filesystem::path destination;
    Category category = Category::Other;
    bool collision = false;
};

// Resolve destRoot/<category>/<file name> for a candidate found under sourceRoot.
// Sub-directories below sourceRoot are flattened. Returns empty when the candidate
// cannot be expressed relative to sourceRoot.
std::optional<Placement> place(const std::filesystem::path& candidate,
                               const std::filesystem::path& sourceRoot,
                               const std::filesystem::path& destRoot);

// Compare two paths after making them absolute and lexically normal.
bool samePath(const std::filesystem::path& a, const std::filesystem::path& b);

#endif
