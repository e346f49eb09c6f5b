#include "audio/chunk_store.hpp"
#include "audio/wav_file.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

// Constructor
ChunkStore::ChunkStore(std::string dir, int sampleRate)
    : dir_(std::move(dir)), sampleRate_(sampleRate) {}

void ChunkStore::init() {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec || !fs::is_directory(dir_)) {
        throw StorageError("cannot create temp directory " + dir_ + ": " + ec.message());
    }
}

std::string ChunkStore::pathFor(uint64_t sessionId, uint32_t resetGen, uint32_t seq) const {
    const std::string name = "session" + std::to_string(sessionId) +
                             "_r" + std::to_string(resetGen) +
                             "_chunk" + std::to_string(seq) + ".wav";
    return (fs::path(dir_) / name).string();
}

std::string ChunkStore::write(uint64_t sessionId, uint32_t resetGen, uint32_t seq,
                              const std::vector<int16_t>& samples) const {
    const std::string path = pathFor(sessionId, resetGen, seq);
    writeWavPcm16(path, samples, sampleRate_);
    return path;
}

bool ChunkStore::isChunkFile(const std::string& filename) {
    const std::string prefix = "session";
    const std::string suffix = ".wav";
    if (filename.size() <= prefix.size() + suffix.size()) return false;
    if (filename.compare(0, prefix.size(), prefix) != 0) return false;
    if (filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) != 0) return false;
    return filename.find("_chunk") != std::string::npos;
}

std::vector<std::string> ChunkStore::list() const {
    std::vector<std::string> out;
    std::error_code ec;
    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file()) continue;
        const std::string name = it->path().filename().string();
        if (isChunkFile(name)) out.push_back(it->path().string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

size_t ChunkStore::purge() const {
    size_t removed = 0;
    for (const auto& path : list()) {
        std::error_code ec;
        if (fs::remove(path, ec)) {
            ++removed;
            logDebug("Chunk Store", "Deleted file: " + fs::path(path).filename().string());
        } else if (ec) {
            logWarn("Chunk Store", "Failed to delete " + path + ": " + ec.message());
        }
    }
    return removed;
}
