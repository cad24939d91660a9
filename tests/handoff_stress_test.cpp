// filename: handoff_stress_test.cpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#include "flowbridge/errors.hpp"
#include "flowbridge/handoff.hpp"
#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

#include <unistd.h>

namespace {

constexpr int kRounds = 8;
constexpr int kGenerations = 120;

// Generation g is a header "g size\n" followed by filler; sizes grow with g.
std::string payload(int generation) {
    const std::size_t fill = 256 + static_cast<std::size_t>(generation) * 97;
    std::ostringstream header;
    header << generation << ' ' << fill << '\n';
    return header.str() + std::string(fill, static_cast<char>('a' + generation % 26));
}

bool parsePayload(const std::string& bytes, int& generation) {
    const auto newline = bytes.find('\n');
    if (newline == std::string::npos) {
        return false;
    }
    std::istringstream header(bytes.substr(0, newline));
    std::size_t fill = 0;
    if (!(header >> generation >> fill)) {
        return false;
    }
    return bytes.size() == newline + 1 + fill;
}

// Random pauses in the microsecond range, so each round interleaves differently.
void jitter(std::mt19937& rng) {
    std::uniform_int_distribution<int> pause(0, 9);
    const int roll = pause(rng);
    if (roll < 3) {
        std::this_thread::yield();
    } else if (roll < 5) {
        std::this_thread::sleep_for(std::chrono::microseconds(roll * 40));
    }
}

// One concurrent writer/reader pass over finalPath. Returns false on any torn,
// missing or stale read.
bool runRound(const std::string& finalPath, unsigned seed, std::size_t& reads) {
    using namespace flowbridge;
    const ArtifactHandle handle = makeFinalResultHandle(finalPath);

    std::atomic<int> published{-1};
    std::atomic<bool> writerDone{false};
    std::atomic<bool> writerFailed{false};

    // The watcher exists before anything is published, as a consumer's would.
    ArtifactWatcher watcher(finalPath);

    std::thread writer([&] {
        std::mt19937 rng(seed);
        try {
            for (int g = 0; g < kGenerations; ++g) {
                publishArtifact(handle, [g](const std::string& staging) {
                    std::ofstream out(staging, std::ios::binary | std::ios::trunc);
                    const std::string bytes = payload(g);
                    // Two halves so a reader of a non-atomic scheme would see a torn file.
                    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size() / 2));
                    out.flush();
                    out.write(bytes.data() + bytes.size() / 2,
                              static_cast<std::streamsize>(bytes.size() - bytes.size() / 2));
                });
                published.store(g);
                jitter(rng);
            }
        } catch (const std::exception& ex) {
            std::cerr << "Writer failed: " << ex.what() << "\n";
            writerFailed.store(true);
        }
        writerDone.store(true);
    });

    std::mt19937 rng(seed * 7919U + 1U);
    bool ok = true;
    while (!writerDone.load() && ok) {
        jitter(rng);
        const int atLeast = published.load();
        if (!watcher.poll()) {
            if (atLeast >= 0) {
                std::cerr << "Final path missing after generation " << atLeast << " was published\n";
                ok = false;
            }
            continue;
        }
        const std::string bytes = testing::readWhole(finalPath);
        int generation = -1;
        if (!parsePayload(bytes, generation)) {
            std::cerr << "Reader observed an incomplete artifact of " << bytes.size() << " bytes\n";
            ok = false;
        } else if (generation < atLeast) {
            std::cerr << "Reader observed generation " << generation << " after " << atLeast
                      << " was published\n";
            ok = false;
        }
        ++reads;
    }
    writer.join();

    if (!ok || writerFailed.load()) {
        return false;
    }
    int last = -1;
    if (!parsePayload(testing::readWhole(finalPath), last) || last != kGenerations - 1) {
        std::cerr << "Final artifact is not the last generation\n";
        return false;
    }
    if (std::filesystem::exists(handle.stagingPath)) {
        std::cerr << "Staging file left behind after successful publishes\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    using namespace flowbridge;
    namespace fs = std::filesystem;

    testing::TempDir dir("flowbridge_handoff");
    const std::string finalPath = dir.file("result.vti");
    const ArtifactHandle handle = makeFinalResultHandle(finalPath);

    if (handle.stagingPath != finalPath + ".staging" ||
        fs::path(handle.stagingPath).parent_path() != fs::path(finalPath).parent_path()) {
        std::cerr << "Staging file must sit beside the final path\n";
        return 1;
    }

    const unsigned baseSeed = std::random_device{}();
    std::size_t reads = 0;
    for (int round = 0; round < kRounds; ++round) {
        const unsigned seed = baseSeed + static_cast<unsigned>(round);
        const std::string roundPath = dir.file("round_" + std::to_string(round) + ".vti");
        if (!runRound(roundPath, seed, reads)) {
            std::cerr << "Round " << round << " failed (seed " << seed << ")\n";
            return 1;
        }
    }

    // A result left over from an earlier run is not the new one.
    testing::writeWhole(finalPath, payload(1));
    ArtifactWatcher stale(finalPath);
    if (stale.poll()) {
        std::cerr << "Watcher reported a pre-existing artifact as ready\n";
        return 1;
    }
    publishArtifact(handle, [](const std::string& staging) { testing::writeWhole(staging, payload(2)); });
    int replaced = -1;
    if (!stale.poll() || !parsePayload(testing::readWhole(finalPath), replaced) || replaced != 2) {
        std::cerr << "Watcher missed the artifact that replaced the old one\n";
        return 1;
    }

    // A writer that throws leaves neither a staging file nor a new final file.
    bool threw = false;
    try {
        publishArtifact(makeFinalResultHandle(dir.file("broken.vti")), [](const std::string& staging) {
            testing::writeWhole(staging, "partial");
            throw std::runtime_error("solver output failed");
        });
    } catch (const std::runtime_error&) {
        threw = true;
    }
    if (!threw || fs::exists(dir.file("broken.vti")) || fs::exists(dir.file("broken.vti.staging"))) {
        std::cerr << "Failed writer must propagate and clean its staging file\n";
        return 1;
    }

    // Renaming onto a directory fails; the staging file is kept for inspection.
    fs::create_directories(dir.file("occupied.vti"));
    fs::create_directories(dir.file("occupied.vti") + "/child");
    try {
        publishArtifact(makeFinalResultHandle(dir.file("occupied.vti")),
                        [](const std::string& staging) { testing::writeWhole(staging, "complete"); });
        std::cerr << "Rename onto a non-empty directory should fail\n";
        return 1;
    } catch (const HandoffError& ex) {
        if (ex.stagingPath() != dir.file("occupied.vti.staging") || !fs::exists(ex.stagingPath())) {
            std::cerr << "HandoffError must name a staging file that still exists\n";
            return 1;
        }
    }

    // Publishing an existing file, whichever path sameVolume picks.
    const std::string source = dir.file("scratch.bin");
    testing::writeWhole(source, payload(7));
    publishArtifactFromFile(makeFinalResultHandle(dir.file("moved.vti"), source), source);
    int movedGeneration = -1;
    if (!parsePayload(testing::readWhole(dir.file("moved.vti")), movedGeneration) || movedGeneration != 7 ||
        fs::exists(source)) {
        std::cerr << "publishArtifactFromFile did not move the source into place\n";
        return 1;
    }

    const fs::path shm("/dev/shm");
    if (fs::is_directory(shm) && !sameVolume(shm, dir.path())) {
        const std::string foreign = (shm / ("flowbridge_xvol_" + std::to_string(::getpid()))).string();
        testing::writeWhole(foreign, payload(9));
        publishArtifactFromFile(makeFinalResultHandle(dir.file("copied.vti")), foreign);
        int copiedGeneration = -1;
        if (!parsePayload(testing::readWhole(dir.file("copied.vti")), copiedGeneration) || copiedGeneration != 9 ||
            fs::exists(foreign)) {
            std::cerr << "Cross-volume publish did not copy and clean up\n";
            return 1;
        }
    }

    std::cout << "Handoff stress passed (" << reads << " concurrent reads over " << kRounds << " rounds of "
              << kGenerations << " publishes)\n";
    return 0;
}
