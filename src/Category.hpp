#ifndef CATEGORY_HPP
#define CATEGORY_HPP

#include <filesystem>
#include <string>

// Closed set of folders a file can be sorted into.
enum class Category {
    Images,
    Videos,
    Audio,
    Documents,
    Archives,
    Code,
    NoExtension,
    Other
};

// Map an extension (with or without the leading dot, any case) to its category.
Category classify(const std::string& extension);
// Folder label used under the destination root.
const char* categoryName(Category category);
// Lower-cased text from the last dot of the file name, dot included; empty when there is none.
std::string extensionOf(const std::filesystem::path& file);

#endif
