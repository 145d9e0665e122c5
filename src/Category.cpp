#include "Category.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <unordered_map>

namespace {
std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

const std::unordered_map<std::string, Category>& extensionTable() {
    static const std::unordered_map<std::string, Category> table = [] {
        std::unordered_map<std::string, Category> map;
        auto add = [&map](Category category, std::initializer_list<const char*> extensions) {
            for (const char* ext : extensions) {
                map.emplace(ext, category);
            }
        };

        add(Category::Images, {"jpg", "jpeg", "png", "gif", "webp", "svg", "bmp", "tiff"});
        add(Category::Videos, {"mp4", "mov", "mkv", "avi", "webm"});
        add(Category::Audio, {"mp3", "wav", "flac", "aac", "m4a"});
        add(Category::Documents, {"pdf", "doc", "docx", "xls", "xlsx", "ppt", "pptx", "txt", "md"});
        add(Category::Archives, {"zip", "tar", "gz", "tgz", "rar", "7z"});
        add(Category::Code, {"go", "py", "js", "ts", "java", "c", "cpp", "cs", "html", "css", "json", "yaml", "yml", "sh"});
        return map;
    }();
    return table;
}
} // namespace

Category classify(const std::string& extension) {
    if (extension.empty()) {
        return Category::NoExtension;
    }

    std::string key = toLower(extension);
    if (key.front() == '.') {
        key.erase(key.begin());
    }

    // A trailing dot ("report.") is an extension, just not one we know.
    if (key.empty()) {
        return Category::Other;
    }

    const auto& table = extensionTable();
    auto it = table.find(key);
    if (it == table.end()) {
        return Category::Other;
    }
    return it->second;
}

const char* categoryName(Category category) {
    switch (category) {
    case Category::Images:
        return "images";
    case Category::Videos:
        return "videos";
    case Category::Audio:
        return "audio";
    case Category::Documents:
        return "documents";
    case Category::Archives:
        return "archives";
    case Category::Code:
        return "code";
    case Category::NoExtension:
        return "no_extension";
    case Category::Other:
        break;
    }
    return "other";
}

std::string extensionOf(const std::filesystem::path& file) {
    const std::string name = file.filename().string();
    const auto dot = name.find_last_of('.');
    if (dot == std::string::npos) {
        return {};
    }
    return toLower(name.substr(dot));
}
