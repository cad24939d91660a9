// filename: handoff.hpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include <sys/types.h>

#include "flowbridge/timer.hpp"

namespace flowbridge {

enum class ArtifactKind {
    LiveFrame,
    FinalResult,
};

/**
 * @brief Where an artifact is written and where readers find it.
 *
 * LiveFrame handles are overwritten in place at finalPath. FinalResult handles
 * are produced in stagingPath (same directory as finalPath) and renamed once.
 * tempPath is the scratch file of a producer that builds the artifact outside
 * the result directory (a solver writing to its own temp dir) and hands it over
 * with publishArtifactFromFile. SimulationService renders straight into
 * stagingPath, so its handles leave tempPath empty.
 */
struct ArtifactHandle {
    std::string tempPath;
    std::string stagingPath;
    std::string finalPath;
    ArtifactKind kind{ArtifactKind::FinalResult};
};

inline constexpr const char* kStagingSuffix = ".staging";

ArtifactHandle makeLiveFrameHandle(const std::string& path);
ArtifactHandle makeFinalResultHandle(const std::string& finalPath, const std::string& tempPath = {});

bool isStagingPath(const std::filesystem::path& path);

/**
 * @brief Best-effort producer of the live preview. Failures are logged, never thrown.
 */
class LiveFrameWriter {
public:
    explicit LiveFrameWriter(std::string path);

    bool write(const std::string& bytes);
    void remove();

    const std::string& path() const { return path_; }
    std::size_t framesWritten() const { return framesWritten_; }
    std::size_t failures() const { return failures_; }

private:
    std::string path_;
    std::size_t framesWritten_{0};
    std::size_t failures_{0};
};

enum class FrameStatus {
    Missing,
    Unreadable,
    Stale,
    Fresh,
};

const char* toString(FrameStatus status);

struct LiveFrame {
    FrameStatus status{FrameStatus::Missing};
    std::string bytes;
    std::filesystem::file_time_type modified{};
};

/**
 * @brief Consumer side of the live preview.
 *
 * Each poll reads the whole file. A frame that cannot be read, or that the
 * validator rejects (a torn write), is reported as Unreadable and the caller
 * simply tries again next tick.
 */
class LiveFramePoller {
public:
    using Validator = std::function<bool(const std::string&)>;

    LiveFramePoller(std::string path, Millis freshnessWindow, Validator validator = nullptr);

    LiveFrame poll();

    // True when the last Fresh frame differs in mtime from the one before it.
    bool changed() const { return changed_; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    Millis freshnessWindow_;
    Validator validator_;
    std::optional<std::filesystem::file_time_type> lastSeen_;
    bool changed_{false};
};

/**
 * @brief Stage-then-rename publication of a final artifact.
 *
 * writer fills the staging path; the file is fsynced and renamed onto
 * finalPath. A writer exception removes the staging file and propagates. A
 * failed rename throws HandoffError and leaves the staging file in place.
 */
void publishArtifact(const ArtifactHandle& handle, const std::function<void(const std::string&)>& writer);

// Publishes a file an external producer already finished, usually handle.tempPath.
// Sources on another volume are copied into staging first. The bundled service
// does not need this; see publishArtifact.
void publishArtifactFromFile(const ArtifactHandle& handle, const std::string& sourcePath);

bool sameVolume(const std::filesystem::path& a, const std::filesystem::path& b);

/**
 * @brief Existence of finalPath means the artifact is complete.
 *
 * A file already at finalPath when the watcher is created belongs to an earlier
 * run; it only counts once a rename has replaced it. Create the watcher before
 * the request that produces the artifact is sent.
 */
class ArtifactWatcher {
public:
    explicit ArtifactWatcher(std::string finalPath);

    bool poll();
    bool ready() const { return ready_; }
    const std::string& path() const { return finalPath_; }

private:
    struct FileStamp {
        dev_t device{0};
        ino_t inode{0};
        std::int64_t mtimeNs{0};
        std::int64_t size{0};

        bool operator==(const FileStamp& other) const {
            return device == other.device && inode == other.inode && mtimeNs == other.mtimeNs &&
                   size == other.size;
        }
    };

    static std::optional<FileStamp> stamp(const std::string& path);

    std::string finalPath_;
    std::optional<FileStamp> previous_;
    bool ready_{false};
};

// Deletes the oldest files with the given extension beyond keepCount, by write
// time. Staging files are never touched. Returns the number removed.
std::size_t pruneArtifacts(const std::string& directory, const std::string& extension, std::size_t keepCount);

}  // namespace flowbridge
