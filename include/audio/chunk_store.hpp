#ifndef CHUNK_STORE_HPP
#define CHUNK_STORE_HPP

#include <cstdint>
#include <string>
#include <vector>

// Temp WAV files of sealed chunks, named session<N>_r<R>_chunk<S>.wav.
// Files of a finished session stay on disk until purge() is called by the next
// START_RECORDING, so a crash leaves the audio recoverable.
class ChunkStore {
public:
    ChunkStore(std::string dir, int sampleRate);

    // Creates the directory. Throws StorageError when it cannot be created.
    void init();

    std::string pathFor(uint64_t sessionId, uint32_t resetGen, uint32_t seq) const;

    // Throws StorageError.
    std::string write(uint64_t sessionId, uint32_t resetGen, uint32_t seq,
                      const std::vector<int16_t>& samples) const;

    // Deletes every chunk file in the directory. Returns the number removed.
    size_t purge() const;

    std::vector<std::string> list() const;

    const std::string& dir() const { return dir_; }

    static bool isChunkFile(const std::string& filename);

private:
    std::string dir_;
    int sampleRate_;
};

#endif
