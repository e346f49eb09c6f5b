#include <catch2/catch.hpp>

#include "audio/chunker.hpp"
#include "test_support.hpp"

using testing::tone;
using testing::silence;

namespace {

constexpr size_t kBlock = 1600;   // 100 ms at 16 kHz

std::vector<SealedAudio> feedAll(Chunker& chunker, const std::vector<int16_t>& samples) {
    std::vector<SealedAudio> out;
    for (size_t off = 0; off < samples.size(); off += kBlock) {
        const size_t n = std::min(kBlock, samples.size() - off);
        for (auto& s : chunker.feed(samples.data() + off, n)) out.push_back(std::move(s));
    }
    return out;
}

Chunker::Config defaults() {
    Chunker::Config c;
    c.sampleRate = 16000;
    c.measure = EnergyMeasure::Peak;
    c.threshold = 500.0f;
    c.minSilenceMs = 1500;
    c.maxLeadInMs = 1500;
    c.splitIntervalMs = 60000;
    return c;
}

}

TEST_CASE("Continuous speech is sealed exactly at the split interval", "[chunker]") {
    Chunker chunker(defaults());

    const auto sealed = feedAll(chunker, tone(testing::kAlpha, 61.0));

    REQUIRE(sealed.size() == 1);
    CHECK(sealed[0].seq == 0);
    CHECK(sealed[0].reason == BoundaryReason::MaxDuration);
    CHECK(sealed[0].startSample == 0);
    CHECK(sealed[0].endSample == 960000);
    CHECK(sealed[0].samples.size() == 960000);
    CHECK(chunker.openSamples() == 16000);
}

TEST_CASE("Split boundary falls inside a block", "[chunker]") {
    Chunker chunker(defaults());

    // 960000 is not a multiple of 1024.
    const auto audio = tone(testing::kAlpha, 60.5);
    std::vector<SealedAudio> sealed;
    for (size_t off = 0; off < audio.size(); off += 1024) {
        const size_t n = std::min<size_t>(1024, audio.size() - off);
        for (auto& s : chunker.feed(audio.data() + off, n)) sealed.push_back(std::move(s));
    }

    REQUIRE(sealed.size() == 1);
    CHECK(sealed[0].endSample - sealed[0].startSample == 960000);
    CHECK(chunker.openSamples() == audio.size() - 960000);
}

TEST_CASE("Silence seals at the silence onset", "[chunker]") {
    Chunker chunker(defaults());

    std::vector<int16_t> audio = tone(testing::kAlpha, 3.0);
    testing::append(audio, silence(1.4));

    SECTION("below the minimum nothing is sealed") {
        CHECK(feedAll(chunker, audio).empty());
        CHECK(chunker.openVoiced());
    }

    SECTION("reaching the minimum seals at the onset") {
        testing::append(audio, silence(0.2));
        const auto sealed = feedAll(chunker, audio);

        REQUIRE(sealed.size() == 1);
        CHECK(sealed[0].reason == BoundaryReason::Silence);
        CHECK(sealed[0].startSample == 0);
        CHECK(sealed[0].endSample == 48000);
        // The trailing silence is kept as lead-in of the next chunk.
        CHECK_FALSE(chunker.openVoiced());
        CHECK(chunker.openSamples() > 0);
        CHECK(chunker.openSamples() <= 24000);
    }
}

TEST_CASE("Ninety seconds of speech then stop gives two chunks", "[chunker]") {
    Chunker chunker(defaults());

    auto sealed = feedAll(chunker, tone(testing::kAlpha, 90.0));
    SealedAudio last;
    REQUIRE(chunker.sealOpen(last));
    sealed.push_back(last);

    REQUIRE(sealed.size() == 2);
    CHECK(sealed[0].seq == 0);
    CHECK(sealed[0].reason == BoundaryReason::MaxDuration);
    CHECK(sealed[0].endSample == 960000);
    CHECK(sealed[1].seq == 1);
    CHECK(sealed[1].reason == BoundaryReason::ForcedStop);
    CHECK(sealed[1].startSample == 960000);
    CHECK(sealed[1].endSample == 1440000);
}

TEST_CASE("The first boundary to fire wins", "[chunker]") {
    Chunker chunker(defaults());

    // Silence starts at 59 s; the split boundary at 60 s fires before the
    // 1.5 s silence minimum is reached.
    std::vector<int16_t> audio = tone(testing::kAlpha, 59.0);
    testing::append(audio, silence(3.0));

    const auto sealed = feedAll(chunker, audio);
    REQUIRE(sealed.size() == 1);
    CHECK(sealed[0].seq == 0);
    CHECK(sealed[0].reason == BoundaryReason::MaxDuration);
    CHECK(sealed[0].endSample == 960000);

    SealedAudio last;
    CHECK_FALSE(chunker.sealOpen(last));
    CHECK(chunker.nextSeq() == 1);
}

TEST_CASE("Lead-in silence is bounded", "[chunker]") {
    Chunker chunker(defaults());

    std::vector<int16_t> audio = silence(5.0);
    testing::append(audio, tone(testing::kBeta, 1.0));

    CHECK(feedAll(chunker, audio).empty());

    SealedAudio last;
    REQUIRE(chunker.sealOpen(last));
    CHECK(last.reason == BoundaryReason::ForcedStop);
    CHECK(last.startSample == 80000 - 24000);
    CHECK(last.endSample == 96000);
}

TEST_CASE("A forced stop without speech seals nothing", "[chunker]") {
    Chunker chunker(defaults());

    CHECK(feedAll(chunker, silence(2.0)).empty());

    SealedAudio last;
    CHECK_FALSE(chunker.sealOpen(last));
    CHECK(chunker.nextSeq() == 0);
    CHECK(chunker.openSamples() == 0);
}

TEST_CASE("Sequence numbers stay contiguous across triggers", "[chunker]") {
    Chunker chunker(defaults());

    std::vector<int16_t> audio;
    testing::append(audio, tone(testing::kAlpha, 2.0));
    testing::append(audio, silence(2.0));
    testing::append(audio, tone(testing::kBeta, 65.0));
    testing::append(audio, silence(2.0));
    testing::append(audio, tone(testing::kGamma, 1.0));

    auto sealed = feedAll(chunker, audio);
    SealedAudio last;
    REQUIRE(chunker.sealOpen(last));
    sealed.push_back(last);

    REQUIRE(sealed.size() == 4);
    for (size_t i = 0; i < sealed.size(); ++i) CHECK(sealed[i].seq == i);
    CHECK(sealed[0].reason == BoundaryReason::Silence);
    CHECK(sealed[1].reason == BoundaryReason::MaxDuration);
    CHECK(sealed[2].reason == BoundaryReason::Silence);
    CHECK(sealed[3].reason == BoundaryReason::ForcedStop);
    for (size_t i = 1; i < sealed.size(); ++i) CHECK(sealed[i].startSample >= sealed[i - 1].endSample);
}

TEST_CASE("restart drops the open chunk and rewinds seq", "[chunker]") {
    Chunker chunker(defaults());

    feedAll(chunker, tone(testing::kAlpha, 61.0));
    REQUIRE(chunker.nextSeq() == 1);

    chunker.restart();
    CHECK(chunker.nextSeq() == 0);
    CHECK(chunker.openSamples() == 0);
    CHECK(chunker.samplesSeen() == 0);

    SealedAudio last;
    CHECK_FALSE(chunker.sealOpen(last));
}

TEST_CASE("Switching to a shorter profile cuts the open chunk", "[chunker]") {
    Chunker chunker(defaults());
    feedAll(chunker, tone(testing::kAlpha, 12.0));
    REQUIRE(chunker.openSamples() == 192000);

    Chunker::Config rt = defaults();
    rt.minSilenceMs = 500;
    rt.maxLeadInMs = 500;
    rt.splitIntervalMs = 5000;
    chunker.setConfig(rt);

    const auto sealed = feedAll(chunker, tone(testing::kAlpha, 0.1));
    REQUIRE(sealed.size() == 2);
    CHECK(sealed[0].endSample - sealed[0].startSample == 80000);
    CHECK(sealed[1].endSample - sealed[1].startSample == 80000);
    CHECK(chunker.openSamples() == 32000 + 1600);
}

TEST_CASE("RMS measure uses the root mean square", "[chunker]") {
    Chunker::Config c = defaults();
    c.measure = EnergyMeasure::Rms;
    Chunker chunker(c);

    const std::vector<int16_t> x = {300, -400, 0, 0};
    CHECK(chunker.energy(x.data(), x.size()) == Approx(250.0f));

    c.measure = EnergyMeasure::Peak;
    chunker.setConfig(c);
    CHECK(chunker.energy(x.data(), x.size()) == Approx(400.0f));
}
