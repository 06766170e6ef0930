#include "tiermem/common/logger.h"
#include "tiermem/memory/tier_controller.h"
#include <iostream>

using namespace tiermem;

namespace {

void say(memory::TierController& engine, const std::string& text, double novelty, double sentiment,
         std::vector<std::string> entities = {}, std::vector<std::string> topics = {}) {
    core::MemoryContent content;
    content.text = text;
    content.entities = std::move(entities);
    content.topics = std::move(topics);

    core::ImportanceSignals signals;
    signals.semantic_novelty = novelty;
    signals.sentiment_intensity = sentiment;

    auto result = engine.record_turn("demo-user", "session-1", content, signals);
    if (!result.ok()) {
        std::cerr << "Record failed: " << result.error() << std::endl;
        return;
    }
    std::cout << "  #" << result.value().id << " importance "
              << result.value().importance << ": " << text << std::endl;
}

} // namespace

int main() {
    std::cout << "=== tiermem Quick Start Example ===" << std::endl;
    common::Logger::Init();

    // Configure engine
    core::EngineConfig config = core::EngineConfig::Default();
    config.hot.capacity_per_owner = 3;
    config.cold.data_dir = "./tiermem_data";

    std::cout << "Creating engine with data_dir: " << config.cold.data_dir << std::endl;
    memory::TierController engine(config);

    // Initialize
    auto init_result = engine.init();
    if (!init_result.ok()) {
        std::cerr << "Init failed: " << init_result.error() << std::endl;
        return 1;
    }
    std::cout << "✅ Engine initialized" << std::endl;

    // Record a short conversation
    std::cout << "Recording turns..." << std::endl;
    say(engine, "My daughter Mia starts school on Monday", 9, 8, {"Mia"}, {"school"});
    say(engine, "I prefer my email at mia.parent@example.com", 6, 1, {}, {"contact"});
    say(engine, "ok thanks", 0.5, 0);
    say(engine, "Mia is nervous about school", 7, 9, {"Mia"}, {"school"});
    say(engine, "what's the weather", 1, 0);
    say(engine, "cool", 0, 0);

    // Recall
    std::cout << "Recalling context for 'school'..." << std::endl;
    auto recall_result = engine.recall_context("demo-user", std::string("school"), memory::RecallDepth::DEEP);
    if (recall_result.ok()) {
        for (const auto& entry : recall_result.value()) {
            std::cout << "  [" << core::tier_name(entry.source_tier) << "] score " << entry.score << " ";
            if (const auto* item = entry.item()) {
                std::cout << item->content.text;
            } else {
                std::cout << memory::node_type_name(entry.node()->node_type) << " " << entry.node()->label;
            }
            std::cout << std::endl;
        }
    } else {
        std::cerr << "Recall failed: " << recall_result.error() << std::endl;
    }

    // Privacy
    auto redact_result = engine.redact_owner("demo-user");
    if (redact_result.ok()) {
        std::cout << "✅ Redacted " << redact_result.value() << " identifiers" << std::endl;
    } else {
        std::cerr << "Redaction failed: " << redact_result.error() << std::endl;
    }
    std::cout << "Chain verifies: " << (engine.verify_integrity("demo-user") ? "yes" : "no") << std::endl;

    std::cout << engine.stats();
    std::cout << "✅ Quick start complete!" << std::endl;

    return 0;
}
