// filename: handoff.cpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#include "flowbridge/handoff.hpp"

#include "flowbridge/errors.hpp"
#include "flowbridge/log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace flowbridge {
namespace {

namespace fs = std::filesystem;

constexpr const char* kLog = "handoff";

void fsyncPath(const fs::path& path, bool directory) {
    const int fd = ::open(path.c_str(), directory ? (O_RDONLY | O_DIRECTORY) : O_RDONLY);
    if (fd < 0) {
        throw std::runtime_error("Cannot open " + path.string() + " for sync: " + std::strerror(errno));
    }
    const int rc = ::fsync(fd);
    const int err = errno;
    ::close(fd);
    if (rc != 0) {
        throw std::runtime_error("fsync failed for " + path.string() + ": " + std::strerror(err));
    }
}

fs::path parentOrCurrent(const fs::path& path) {
    const fs::path parent = path.parent_path();
    return parent.empty() ? fs::path(".") : parent;
}

void ensureParent(const fs::path& path) {
    const fs::path parent = path.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }
}

void renameIntoPlace(const ArtifactHandle& handle) {
    std::error_code ec;
    fs::rename(handle.stagingPath, handle.finalPath, ec);
    if (ec) {
        throw HandoffError("Failed to rename " + handle.stagingPath + " to " + handle.finalPath + ": " +
                               ec.message(),
                           handle.stagingPath);
    }
    try {
        fsyncPath(parentOrCurrent(handle.finalPath), true);
    } catch (const std::exception& ex) {
        logWarn(kLog, ex.what());
    }
}

}  // namespace

ArtifactHandle makeLiveFrameHandle(const std::string& path) {
    ArtifactHandle handle{};
    handle.finalPath = path;
    handle.kind = ArtifactKind::LiveFrame;
    return handle;
}

ArtifactHandle makeFinalResultHandle(const std::string& finalPath, const std::string& tempPath) {
    ArtifactHandle handle{};
    handle.tempPath = tempPath;
    handle.finalPath = finalPath;
    handle.stagingPath = finalPath + kStagingSuffix;
    handle.kind = ArtifactKind::FinalResult;
    return handle;
}

bool isStagingPath(const fs::path& path) {
    const std::string name = path.filename().string();
    const std::string suffix{kStagingSuffix};
    return name.size() >= suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

LiveFrameWriter::LiveFrameWriter(std::string path) : path_(std::move(path)) {}

bool LiveFrameWriter::write(const std::string& bytes) {
    try {
        ensureParent(path_);
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("cannot open " + path_);
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            throw std::runtime_error("short write to " + path_);
        }
    } catch (const std::exception& ex) {
        ++failures_;
        logWarn(kLog, std::string("Live frame skipped: ") + ex.what());
        return false;
    }
    ++framesWritten_;
    return true;
}

void LiveFrameWriter::remove() {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        logWarn(kLog, "Could not delete live frame " + path_ + ": " + ec.message());
    }
}

const char* toString(FrameStatus status) {
    switch (status) {
        case FrameStatus::Missing:
            return "missing";
        case FrameStatus::Unreadable:
            return "unreadable";
        case FrameStatus::Stale:
            return "stale";
        case FrameStatus::Fresh:
            return "fresh";
    }
    return "unknown";
}

LiveFramePoller::LiveFramePoller(std::string path, Millis freshnessWindow, Validator validator)
    : path_(std::move(path)), freshnessWindow_(freshnessWindow), validator_(std::move(validator)) {}

LiveFrame LiveFramePoller::poll() {
    LiveFrame frame{};
    changed_ = false;

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        frame.status = FrameStatus::Missing;
        return frame;
    }
    frame.modified = fs::last_write_time(path_, ec);
    if (ec) {
        frame.status = FrameStatus::Unreadable;
        return frame;
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        frame.status = FrameStatus::Unreadable;
        return frame;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    frame.bytes = buffer.str();
    if (frame.bytes.empty() || (validator_ && !validator_(frame.bytes))) {
        frame.status = FrameStatus::Unreadable;
        return frame;
    }

    const auto age = fs::file_time_type::clock::now() - frame.modified;
    frame.status = age > freshnessWindow_ ? FrameStatus::Stale : FrameStatus::Fresh;
    if (frame.status == FrameStatus::Fresh) {
        changed_ = !lastSeen_ || *lastSeen_ != frame.modified;
        lastSeen_ = frame.modified;
    }
    return frame;
}

void publishArtifact(const ArtifactHandle& handle, const std::function<void(const std::string&)>& writer) {
    if (handle.kind != ArtifactKind::FinalResult || handle.stagingPath.empty()) {
        throw std::invalid_argument("publishArtifact requires a FinalResult handle");
    }
    ensureParent(handle.finalPath);

    try {
        writer(handle.stagingPath);
        fsyncPath(handle.stagingPath, false);
    } catch (...) {
        std::error_code ec;
        fs::remove(handle.stagingPath, ec);
        throw;
    }
    renameIntoPlace(handle);
}

bool sameVolume(const fs::path& a, const fs::path& b) {
    struct stat sa {};
    struct stat sb {};
    if (::stat(a.c_str(), &sa) != 0 || ::stat(b.c_str(), &sb) != 0) {
        return false;
    }
    return sa.st_dev == sb.st_dev;
}

void publishArtifactFromFile(const ArtifactHandle& handle, const std::string& sourcePath) {
    if (handle.kind != ArtifactKind::FinalResult || handle.stagingPath.empty()) {
        throw std::invalid_argument("publishArtifactFromFile requires a FinalResult handle");
    }
    ensureParent(handle.finalPath);

    if (sameVolume(sourcePath, parentOrCurrent(handle.stagingPath))) {
        std::error_code ec;
        fs::rename(sourcePath, handle.stagingPath, ec);
        if (ec) {
            throw HandoffError("Failed to move " + sourcePath + " to staging: " + ec.message(),
                               handle.stagingPath);
        }
        fsyncPath(handle.stagingPath, false);
        renameIntoPlace(handle);
        return;
    }

    logInfo(kLog, "Source on another volume, copying into staging: " + sourcePath);
    try {
        fs::copy_file(sourcePath, handle.stagingPath, fs::copy_options::overwrite_existing);
        fsyncPath(handle.stagingPath, false);
    } catch (...) {
        std::error_code ec;
        fs::remove(handle.stagingPath, ec);
        throw;
    }
    renameIntoPlace(handle);

    std::error_code ec;
    fs::remove(sourcePath, ec);
    if (ec) {
        logWarn(kLog, "Could not remove source after copy " + sourcePath + ": " + ec.message());
    }
}

ArtifactWatcher::ArtifactWatcher(std::string finalPath)
    : finalPath_(std::move(finalPath)), previous_(stamp(finalPath_)) {}

std::optional<ArtifactWatcher::FileStamp> ArtifactWatcher::stamp(const std::string& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return std::nullopt;
    }
    FileStamp result;
    result.device = st.st_dev;
    result.inode = st.st_ino;
    result.mtimeNs = static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec;
    result.size = static_cast<std::int64_t>(st.st_size);
    return result;
}

bool ArtifactWatcher::poll() {
    if (!ready_) {
        const std::optional<FileStamp> current = stamp(finalPath_);
        ready_ = current && !(previous_ && *current == *previous_);
    }
    return ready_;
}

std::size_t pruneArtifacts(const std::string& directory, const std::string& extension, std::size_t keepCount) {
    std::string ext = extension;
    if (!ext.empty() && ext.front() != '.') {
        ext.insert(ext.begin(), '.');
    }

    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return 0;
    }

    struct Candidate {
        fs::path path;
        fs::file_time_type modified;
    };
    std::vector<Candidate> candidates;
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (!entry.is_regular_file(ec) || isStagingPath(entry.path()) || entry.path().extension() != ext) {
            continue;
        }
        const auto modified = entry.last_write_time(ec);
        if (ec) {
            continue;
        }
        candidates.push_back({entry.path(), modified});
    }
    if (candidates.size() <= keepCount) {
        return 0;
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const Candidate& a, const Candidate& b) { return a.modified < b.modified; });

    std::size_t removed = 0;
    const std::size_t excess = candidates.size() - keepCount;
    for (std::size_t k = 0; k < excess; ++k) {
        fs::remove(candidates[k].path, ec);
        if (ec) {
            logWarn(kLog, "Could not prune " + candidates[k].path.string() + ": " + ec.message());
            continue;
        }
        ++removed;
    }
    if (removed > 0) {
        logInfo(kLog, "Pruned " + std::to_string(removed) + " old artifact(s) from " + directory);
    }
    return removed;
}

}  // namespace flowbridge
