#include <catch2/catch.hpp>

#include "audio/chunk_store.hpp"
#include "audio/wav_file.hpp"
#include "core/errors.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST_CASE("Chunk files are named after session, reset generation and seq", "[chunk_store]") {
    ChunkStore store("temp_audio", 16000);
    CHECK(fs::path(store.pathFor(7, 2, 11)).filename().string() == "session7_r2_chunk11.wav");

    CHECK(ChunkStore::isChunkFile("session1_r0_chunk0.wav"));
    CHECK_FALSE(ChunkStore::isChunkFile("session1_r0_chunk0.txt"));
    CHECK_FALSE(ChunkStore::isChunkFile("recording.wav"));
    CHECK_FALSE(ChunkStore::isChunkFile("session.wav"));
}

TEST_CASE("Written chunks read back as 16 kHz mono", "[chunk_store]") {
    testing::TempDir tmp;
    ChunkStore store(tmp.str(), 16000);
    store.init();

    const auto samples = testing::tone(testing::kBeta, 0.5);
    const std::string path = store.write(1, 0, 0, samples);
    REQUIRE(fs::exists(path));

    const auto pcm = readWavMono16k(path);
    REQUIRE(pcm.size() == samples.size());
    CHECK(pcm[0] == Approx(testing::kBeta / 32768.0f));
    CHECK(pcm[1] == Approx(-testing::kBeta / 32768.0f));
}

TEST_CASE("purge removes chunk files only and is idempotent", "[chunk_store]") {
    testing::TempDir tmp;
    ChunkStore store(tmp.str(), 16000);
    store.init();

    const auto samples = testing::tone(testing::kAlpha, 0.1);
    store.write(3, 0, 0, samples);
    store.write(3, 0, 1, samples);
    store.write(3, 1, 0, samples);
    std::ofstream(tmp.path() / "notes.txt") << "keep me";

    REQUIRE(store.list().size() == 3);

    CHECK(store.purge() == 3);
    CHECK(store.list().empty());
    CHECK(fs::exists(tmp.path() / "notes.txt"));

    CHECK(store.purge() == 0);
}

TEST_CASE("Unwritable storage raises StorageError", "[chunk_store]") {
    testing::TempDir tmp;
    const fs::path blocker = tmp.path() / "file";
    std::ofstream(blocker) << "x";

    ChunkStore store((blocker / "sub").string(), 16000);
    CHECK_THROWS_AS(store.init(), StorageError);
    CHECK_THROWS_AS(store.write(1, 0, 0, testing::tone(testing::kAlpha, 0.1)), StorageError);
}

TEST_CASE("WAV files at other rates are resampled", "[chunk_store]") {
    testing::TempDir tmp;
    const std::string path = (tmp.path() / "eight_k.wav").string();

    writeWavPcm16(path, testing::tone(testing::kGamma, 1.0, 8000), 8000);

    const auto pcm = readWavMono16k(path);
    CHECK(pcm.size() == 16000);
    CHECK(testing::peakOf(pcm) == Approx(testing::kGamma / 32768.0f));
}
