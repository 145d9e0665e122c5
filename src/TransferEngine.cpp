#include "TransferEngine.hpp"

#include <cerrno>
#include <cstring>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
constexpr std::size_t kCopyBufferSize = 64 * 1024;

TransferOutcome failure(std::string reason) {
    return {false, std::move(reason), false};
}

TransferOutcome ioFailure(const char* step, const fs::path& path, int error) {
    return failure(std::string(step) + " `" + path.string() + "`: " + std::strerror(error));
}

// Owns a POSIX descriptor; close() reports the error instead of dropping it.
class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : m_fd(fd) {}
    ~FileDescriptor() {
        if (m_fd >= 0) {
            ::close(m_fd);
        }
    }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return m_fd; }
    bool valid() const { return m_fd >= 0; }

    int close() {
        const int result = ::close(m_fd);
        m_fd = -1;
        return result;
    }

private:
    int m_fd;
};
} // namespace

TransferEngine::TransferEngine(TransferMode mode, bool dryRun, bool verbose, std::ostream& out)
    : m_mode(mode), m_dryRun(dryRun), m_verbose(verbose), m_out(out),
      m_rename([](const fs::path& from, const fs::path& to, std::error_code& ec) { fs::rename(from, to, ec); }),
      m_remove([](const fs::path& path, std::error_code& ec) { return fs::remove(path, ec); }) {}

void TransferEngine::setRenameFunction(RenameFunction rename) {
    m_rename = std::move(rename);
}

void TransferEngine::setRemoveFunction(RemoveFunction remove) {
    m_remove = std::move(remove);
}

TransferOutcome TransferEngine::transfer(const Placement& placement) const {
    TransferOutcome dirOutcome = ensureDirectory(placement.destinationDir);
    if (!dirOutcome.success) {
        return dirOutcome;
    }

    if (m_verbose || m_dryRun) {
        m_out << transferVerb(m_mode) << ": " << placement.source.string() << " -> " << placement.destination.string() << std::endl;
    }

    if (m_dryRun) {
        return {true, {}, false};
    }

    if (m_mode == TransferMode::Move) {
        return moveFile(placement.source, placement.destination);
    }
    return copyFile(placement.source, placement.destination);
}

TransferOutcome TransferEngine::ensureDirectory(const fs::path& directory) const {
    if (m_dryRun) {
        if (m_verbose) {
            m_out << "DRY-RUN: ensure dir " << directory.string() << std::endl;
        }
        return {true, {}, false};
    }

    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        TransferOutcome outcome = failure("cannot create directory `" + directory.string() + "`: " + ec.message());
        outcome.directoryFailure = true;
        return outcome;
    }
    return {true, {}, false};
}

TransferOutcome TransferEngine::moveFile(const fs::path& source, const fs::path& destination) const {
    std::error_code renameErr;
    m_rename(source, destination, renameErr);
    if (!renameErr) {
        return {true, {}, false};
    }

    // Typically EXDEV; any rename failure degrades to copy + delete.
    TransferOutcome copied = copyFile(source, destination);
    if (!copied.success) {
        return copied;
    }

    std::error_code removeErr;
    if (!m_remove(source, removeErr) || removeErr) {
        const std::string detail = removeErr ? removeErr.message() : "file no longer exists";
        return failure("copied `" + source.string() + "` to `" + destination.string() +
                       "` but could not remove the original: " + detail);
    }
    return {true, {}, false};
}

TransferOutcome TransferEngine::copyFile(const fs::path& source, const fs::path& destination) {
    FileDescriptor in(::open(source.c_str(), O_RDONLY | O_CLOEXEC));
    if (!in.valid()) {
        return ioFailure("open", source, errno);
    }

    struct stat info {};
    if (::fstat(in.get(), &info) != 0) {
        return ioFailure("stat", source, errno);
    }

    // New destinations take the source's permission bits, filtered by the umask.
    FileDescriptor out(::open(destination.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, info.st_mode & 0777));
    if (!out.valid()) {
        return ioFailure("create", destination, errno);
    }

    std::vector<char> buffer(kCopyBufferSize);
    for (;;) {
        const ssize_t readBytes = ::read(in.get(), buffer.data(), buffer.size());
        if (readBytes < 0) {
            if (errno == EINTR) {
                continue;
            }
            return ioFailure("read", source, errno);
        }
        if (readBytes == 0) {
            break;
        }

        ssize_t offset = 0;
        while (offset < readBytes) {
            const ssize_t written = ::write(out.get(), buffer.data() + offset, static_cast<std::size_t>(readBytes - offset));
            if (written < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return ioFailure("write", destination, errno);
            }
            offset += written;
        }
    }

    if (::fsync(out.get()) != 0) {
        return ioFailure("sync", destination, errno);
    }
    if (out.close() != 0) {
        return ioFailure("close", destination, errno);
    }
    return {true, {}, false};
}
