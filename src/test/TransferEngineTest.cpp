#include <cassert>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <system_error>

#include "Placer.hpp"
#include "TestSupport.hpp"
#include "TransferEngine.hpp"

#include <sys/stat.h>

namespace fs = std::filesystem;

namespace {
Placement placementFor(const fs::path& source, const fs::path& sourceRoot, const fs::path& destRoot) {
    auto placement = place(source, sourceRoot, destRoot);
    assert(placement && "candidate under the source root must be placeable");
    return *placement;
}
} // namespace

int main() {
    std::cout << "[Test] Starting TransferEngine Test..." << std::endl;

    const fs::path root = makeScratchDir("transfer");
    const fs::path src = root / "src";
    const fs::path dest = root / "dest";
    std::ostringstream out;

    // Placement
    {
        writeFile(src / "nested" / "Photo.JPG", "x");
        const Placement placement = placementFor(src / "nested" / "Photo.JPG", src, dest);
        assert(placement.category == Category::Images);
        assert(placement.destinationDir == dest / "images");
        assert(placement.destination == dest / "images" / "Photo.JPG");
        assert(!placement.collision);

        assert(!place(root / "elsewhere.txt", src, dest));

        const Placement sameRoot = placementFor(src / "images" / "a.png", src, src);
        assert(sameRoot.collision);
        assert(samePath(src / "x" / ".." / "a", src / "a"));
    }

    // Copy keeps the source and reproduces its bytes, replacing a longer stale destination.
    {
        const std::string payload(200000, 'q');
        writeFile(src / "report.pdf", payload);
        writeFile(dest / "documents" / "report.pdf", std::string(300000, 'z'));

        TransferEngine engine(TransferMode::Copy, false, false, out);
        const TransferOutcome outcome = engine.transfer(placementFor(src / "report.pdf", src, dest));
        assert(outcome.success);
        assert(outcome.reason.empty());
        assert(fs::exists(src / "report.pdf"));
        assert(readFile(dest / "documents" / "report.pdf") == payload);
    }

    // A new destination keeps the source's permission bits.
    {
        ::umask(022);
        writeFile(src / "private.txt", "secret");
        fs::permissions(src / "private.txt", fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read);

        TransferEngine engine(TransferMode::Copy, false, false, out);
        const TransferOutcome outcome = engine.transfer(placementFor(src / "private.txt", src, dest));
        assert(outcome.success);
        const fs::perms copied = fs::status(dest / "documents" / "private.txt").permissions() & fs::perms::all;
        assert(copied == (fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read));
    }

    // Move on the same filesystem renames.
    {
        writeFile(src / "song.mp3", "la la");
        TransferEngine engine(TransferMode::Move, false, false, out);
        const TransferOutcome outcome = engine.transfer(placementFor(src / "song.mp3", src, dest));
        assert(outcome.success);
        assert(!fs::exists(src / "song.mp3"));
        assert(readFile(dest / "audio" / "song.mp3") == "la la");
    }

    // A failed rename (cross-device) falls back to copy + delete.
    {
        writeFile(src / "clip.mkv", "frames");
        TransferEngine engine(TransferMode::Move, false, false, out);
        int renameCalls = 0;
        engine.setRenameFunction([&renameCalls](const fs::path&, const fs::path&, std::error_code& ec) {
            ++renameCalls;
            ec = std::make_error_code(std::errc::cross_device_link);
        });

        const TransferOutcome outcome = engine.transfer(placementFor(src / "clip.mkv", src, dest));
        assert(outcome.success);
        assert(renameCalls == 1);
        assert(!fs::exists(src / "clip.mkv"));
        assert(readFile(dest / "videos" / "clip.mkv") == "frames");
    }

    // Fallback copy succeeded but the original could not be deleted: still a failed move.
    {
        writeFile(src / "deck.pptx", "slides");
        TransferEngine engine(TransferMode::Move, false, false, out);
        engine.setRenameFunction([](const fs::path&, const fs::path&, std::error_code& ec) {
            ec = std::make_error_code(std::errc::cross_device_link);
        });
        engine.setRemoveFunction([](const fs::path&, std::error_code& ec) {
            ec = std::make_error_code(std::errc::permission_denied);
            return false;
        });

        const TransferOutcome outcome = engine.transfer(placementFor(src / "deck.pptx", src, dest));
        assert(!outcome.success);
        assert(!outcome.directoryFailure);
        assert(outcome.reason.find("could not remove the original") != std::string::npos);
        assert(readFile(dest / "documents" / "deck.pptx") == "slides");
        assert(readFile(src / "deck.pptx") == "slides");
    }

    // Source vanished before the delete: reported the same way.
    {
        writeFile(src / "tune.flac", "notes");
        TransferEngine engine(TransferMode::Move, false, false, out);
        engine.setRenameFunction([](const fs::path&, const fs::path&, std::error_code& ec) {
            ec = std::make_error_code(std::errc::cross_device_link);
        });
        engine.setRemoveFunction([](const fs::path& path, std::error_code& ec) {
            fs::remove(path, ec);
            return fs::remove(path, ec);
        });

        const TransferOutcome outcome = engine.transfer(placementFor(src / "tune.flac", src, dest));
        assert(!outcome.success);
        assert(outcome.reason.find("could not remove the original") != std::string::npos);
        assert(readFile(dest / "audio" / "tune.flac") == "notes");
    }

    // When the fallback copy fails the move fails and nothing is removed.
    {
        TransferEngine engine(TransferMode::Move, false, false, out);
        engine.setRenameFunction([](const fs::path&, const fs::path&, std::error_code& ec) {
            ec = std::make_error_code(std::errc::cross_device_link);
        });

        const Placement placement = placementFor(src / "gone.zip", src, dest);
        const TransferOutcome outcome = engine.transfer(placement);
        assert(!outcome.success);
        assert(!outcome.directoryFailure);
        assert(outcome.reason.find("open") != std::string::npos);
        assert(outcome.reason.find("gone.zip") != std::string::npos);
        assert(!fs::exists(dest / "archives" / "gone.zip"));
    }

    // Copy of a missing source reports the failing step.
    {
        const TransferOutcome outcome = TransferEngine::copyFile(src / "nope.txt", dest / "nope.txt");
        assert(!outcome.success);
        assert(outcome.reason.rfind("open", 0) == 0);
    }

    // Category folder cannot be created because a file is in the way.
    {
        const fs::path blockedRoot = root / "blocked";
        writeFile(blockedRoot / "code", "not a directory");
        writeFile(src / "main.cpp", "int main() {}");

        TransferEngine engine(TransferMode::Copy, false, false, out);
        const TransferOutcome outcome = engine.transfer(placementFor(src / "main.cpp", src, blockedRoot));
        assert(!outcome.success);
        assert(outcome.directoryFailure);
        assert(outcome.reason.find("cannot create directory") != std::string::npos);
        assert(fs::exists(src / "main.cpp"));
    }

    // Dry run reports but never touches the filesystem.
    {
        const fs::path dryDest = root / "dry";
        writeFile(src / "shot.png", "pixels");
        std::ostringstream dryOut;

        TransferEngine engine(TransferMode::Move, true, true, dryOut);
        const TransferOutcome outcome = engine.transfer(placementFor(src / "shot.png", src, dryDest));
        assert(outcome.success);
        assert(!fs::exists(dryDest));
        assert(readFile(src / "shot.png") == "pixels");

        const std::string log = dryOut.str();
        assert(log.find("DRY-RUN: ensure dir " + (dryDest / "images").string()) != std::string::npos);
        assert(log.find("MOVE: " + (src / "shot.png").string() + " -> " + (dryDest / "images" / "shot.png").string()) != std::string::npos);
    }

    // Non-verbose real runs stay quiet.
    assert(out.str().empty());

    fs::remove_all(root);
    std::cout << "[PASS] TransferEngine Test." << std::endl;
    return 0;
}
