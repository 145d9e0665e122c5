#include "Placer.hpp"

#include <system_error>

namespace fs = std::filesystem;

bool samePath(const fs::path& a, const fs::path& b) {
    std::error_code errA;
    std::error_code errB;
    const fs::path absA = fs::absolute(a, errA).lexically_normal();
    const fs::path absB = fs::absolute(b, errB).lexically_normal();
    if (errA || errB) {
        return false;
    }
    return absA == absB;
}

std::optional<Placement> place(const fs::path& candidate, const fs::path& sourceRoot, const fs::path& destRoot) {
    const fs::path relative = candidate.lexically_normal().lexically_relative(sourceRoot.lexically_normal());
    if (relative.empty() || relative.begin()->string() == "..") {
        return std::nullopt;
    }

    Placement placement;
    placement.source = candidate;
    placement.category = classify(extensionOf(relative));
    placement.destinationDir = destRoot / categoryName(placement.category);
    placement.destination = placement.destinationDir / relative.filename();
    placement.collision = samePath(placement.source, placement.destination);
    return placement;
}
