#include "RunConfig.hpp"

#include <algorithm>
#include <cctype>

const char* transferVerb(TransferMode mode) {
    return mode == TransferMode::Copy ? "COPY" : "MOVE";
}

const char* transferModeName(TransferMode mode) {
    return mode == TransferMode::Copy ? "copy" : "move";
}

std::optional<TransferMode> parseTransferMode(std::string name) {
    auto notSpace = [](unsigned char ch) { return !std::isspace(ch); };
    name.erase(name.begin(), std::find_if(name.begin(), name.end(), notSpace));
    name.erase(std::find_if(name.rbegin(), name.rend(), notSpace).base(), name.end());

    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    if (name == "move") {
        return TransferMode::Move;
    }
    if (name == "copy") {
        return TransferMode::Copy;
    }
    return std::nullopt;
}
