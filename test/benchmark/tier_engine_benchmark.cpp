#include <benchmark/benchmark.h>
#include "tiermem/archive/archive_sink.h"
#include "tiermem/archive/chain_hash.h"
#include "tiermem/archive/cold_archive.h"
#include "tiermem/common/logger.h"
#include "tiermem/memory/tier_controller.h"
#include "tiermem/privacy/privacy_redactor.h"

#include <memory>
#include <random>
#include <string>

namespace tiermem {
namespace bench {
namespace {

const char* const kWords[] = {
    "planning", "the", "trip", "with", "Rosa", "next", "month", "budget", "train",
    "hotel", "museum", "dinner", "weather", "garden", "piano", "lesson", "work",
};

std::string make_sentence(std::mt19937& gen, size_t words) {
    std::uniform_int_distribution<size_t> pick(0, sizeof(kWords) / sizeof(kWords[0]) - 1);
    std::string out;
    for (size_t i = 0; i < words; ++i) {
        if (i > 0) out += ' ';
        out += kWords[pick(gen)];
    }
    return out;
}

core::EngineConfig bench_config(size_t capacity) {
    auto config = core::EngineConfig::Default();
    config.hot.capacity_per_owner = capacity;
    return config;
}

// Benchmark ingestion with hot overflow routing into warm and cold
static void BM_RecordTurn(benchmark::State& state) {
    common::Logger::SetLevel(spdlog::level::warn);
    memory::TierController engine(bench_config(static_cast<size_t>(state.range(0))),
                                  std::make_shared<archive::NullArchiveSink>());
    if (!engine.init().ok()) {
        state.SkipWithError("engine init failed");
        return;
    }
    std::mt19937 gen(42);
    std::uniform_real_distribution<> signal(0.0, 10.0);

    for (auto _ : state) {
        core::MemoryContent content;
        content.text = make_sentence(gen, 12);
        content.entities = {"Rosa"};
        content.topics = {"travel"};
        core::ImportanceSignals signals;
        signals.semantic_novelty = signal(gen);
        signals.sentiment_intensity = signal(gen);
        auto result = engine.record_turn("alice", "session", content, signals);
        benchmark::DoNotOptimize(result.ok());
    }
    state.SetItemsProcessed(state.iterations());
}

// Benchmark shallow and deep recall over a populated owner
static void BM_RecallContext(benchmark::State& state) {
    common::Logger::SetLevel(spdlog::level::warn);
    memory::TierController engine(bench_config(20), std::make_shared<archive::NullArchiveSink>());
    if (!engine.init().ok()) {
        state.SkipWithError("engine init failed");
        return;
    }
    std::mt19937 gen(7);
    std::uniform_real_distribution<> signal(0.0, 10.0);
    for (int i = 0; i < 500; ++i) {
        core::MemoryContent content;
        content.text = make_sentence(gen, 12);
        content.entities = {"Rosa"};
        content.topics = {i % 2 == 0 ? "travel" : "music"};
        core::ImportanceSignals signals;
        signals.semantic_novelty = signal(gen);
        signals.sentiment_intensity = signal(gen);
        auto recorded = engine.record_turn("alice", "session", content, signals);
        if (!recorded.ok()) {
            state.SkipWithError(recorded.error().c_str());
            return;
        }
    }

    auto depth = state.range(0) == 0 ? memory::RecallDepth::SHALLOW : memory::RecallDepth::DEEP;
    for (auto _ : state) {
        auto recalled = engine.recall_context("alice", std::string("travel"), depth);
        benchmark::DoNotOptimize(recalled.value().size());
    }
}

// Benchmark chain verification cost against chain length
static void BM_VerifyChain(benchmark::State& state) {
    common::Logger::SetLevel(spdlog::level::warn);
    core::ColdArchiveConfig config = core::ColdArchiveConfig::Default();
    archive::ColdArchive archive(config, std::make_shared<archive::NullArchiveSink>());
    std::mt19937 gen(3);
    for (int64_t i = 0; i < state.range(0); ++i) {
        archive::AppendMeta meta;
        meta.item_id = static_cast<core::ItemId>(i + 1);
        meta.timestamp = i;
        auto appended = archive.append("alice", make_sentence(gen, 20), 3.0, meta);
        if (!appended.ok()) {
            state.SkipWithError(appended.error().c_str());
            return;
        }
    }

    for (auto _ : state) {
        benchmark::DoNotOptimize(archive.verify_chain("alice"));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

// Benchmark SHA-256 leaf hashing
static void BM_LeafDigest(benchmark::State& state) {
    std::string segment(static_cast<size_t>(state.range(0)), 'x');
    for (auto _ : state) {
        benchmark::DoNotOptimize(archive::chain_hash::leaf_digest(segment));
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}

// Benchmark PII detection
static void BM_DetectPii(benchmark::State& state) {
    privacy::PrivacyRedactor redactor;
    std::string text = "Reach me at jane.doe@example.com or 555-201-3344, "
                       "card 4111 1111 1111 1111, server 10.0.0.12, and ask about the lease.";
    for (auto _ : state) {
        benchmark::DoNotOptimize(redactor.detect(text, {"lease"}));
    }
}

// Register benchmarks
BENCHMARK(BM_RecordTurn)->Arg(5)->Arg(20)->Arg(100);
BENCHMARK(BM_RecallContext)->Arg(0)->Arg(1);
BENCHMARK(BM_VerifyChain)->Arg(10)->Arg(100)->Arg(1000);
BENCHMARK(BM_LeafDigest)->Arg(16)->Arg(256)->Arg(4096);
BENCHMARK(BM_DetectPii);

} // namespace
} // namespace bench
} // namespace tiermem

BENCHMARK_MAIN();
