#include <catch2/catch_test_macros.hpp>
#include "savescan/api/savescan.hpp"
#include "savescan/events/TelemetryEvents.hpp"
#include "savescan/scanning/MemoryLocator.hpp"
#include "savescan/snapshot/FileSnapshotProvider.hpp"
#include "utils/synthetic_snapshot.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace savescan;
using test_support::InMemorySnapshotProvider;
using test_support::SyntheticSnapshotBuilder;

TEST_CASE("Engine - Extracts a typical game", "[engine]") {
    SyntheticSnapshotBuilder builder(0x1000);
    builder.WithHeaderMagic().WithTypicalGame();

    Engine engine;
    auto snapshot = builder.Build(100);

    auto result = engine.extract(snapshot);
    REQUIRE(result.ok());
    REQUIRE_FALSE(result.from_cache);
    REQUIRE(result.layout == builder.ExpectedLayout(LocatorStrategyKind::HeaderMagic));
    REQUIRE(result.telemetry.player_name == "RED");
    REQUIRE(result.telemetry.money == 3000u);
    REQUIRE(result.telemetry.party.size() == 2);

    SECTION("Same snapshot id reuses the layout") {
        auto again = engine.extract(snapshot);
        REQUIRE(again.ok());
        REQUIRE(again.from_cache);
        REQUIRE(again.telemetry == result.telemetry);
        REQUIRE(engine.locator_stats().Invocations(LocatorStrategyKind::HeaderMagic) == 1);
    }

    SECTION("Invalidated cache locates again") {
        engine.invalidate_cache();
        auto again = engine.extract(snapshot);
        REQUIRE_FALSE(again.from_cache);
        REQUIRE(engine.locator_stats().Invocations(LocatorStrategyKind::HeaderMagic) == 2);
    }

    SECTION("Explicit id overrides the capture id") {
        auto other = engine.extract(snapshot, 101);
        REQUIRE_FALSE(other.from_cache);
        REQUIRE(other.ok());
    }
}

TEST_CASE("Engine - Layout not found", "[engine][notfound]") {
    Engine engine;
    std::vector<ErrorInfo> reported;
    engine.set_error_callback([&reported](const ErrorInfo& info) { reported.push_back(info); });

    SECTION("Unrecognized buffer") {
        SyntheticSnapshotBuilder builder(0x1000);
        auto snapshot = builder.Build(5);

        auto result = engine.extract(snapshot);
        REQUIRE(result.status == ExtractStatus::LayoutNotFound);
        REQUIRE(result.telemetry.IsEmpty());
        REQUIRE_FALSE(result.layout.has_value());
        REQUIRE_FALSE(engine.last_error().empty());
        REQUIRE(reported.size() == 1);
        REQUIRE(reported[0].level == ErrorSeverityLevel::Warning);

        // Remembered for the short TTL; not reported twice
        auto again = engine.extract(snapshot);
        REQUIRE(again.status == ExtractStatus::LayoutNotFound);
        REQUIRE(again.from_cache);
        REQUIRE(reported.size() == 1);
    }

    SECTION("Buffer too small") {
        std::vector<uint8_t> tiny(0x100, 0);
        auto result = engine.extract(tiny.data(), tiny.size(), 6);
        REQUIRE(result.status == ExtractStatus::LayoutNotFound);
        REQUIRE(reported.size() == 1);
        REQUIRE(reported[0].details == "snapshot too small");
    }
}

TEST_CASE("Engine - Capture", "[engine][capture]") {
    SyntheticSnapshotBuilder builder;
    builder.WithTypicalGame();
    InMemorySnapshotProvider provider(builder.Bytes(), 9);

    Engine engine;
    std::vector<ErrorInfo> reported;
    engine.set_error_callback([&reported](const ErrorInfo& info) { reported.push_back(info); });

    SECTION("Successful capture") {
        auto result = engine.capture_and_extract(provider);
        REQUIRE(result.ok());
        REQUIRE(result.telemetry.location == "Pewter City");
        REQUIRE(provider.CaptureCount() == 1);
        REQUIRE(reported.empty());
    }

    SECTION("Failed capture") {
        provider.SetFailing(true);
        auto result = engine.capture_and_extract(provider);
        REQUIRE(result.status == ExtractStatus::CaptureFailed);
        REQUIRE(result.telemetry.IsEmpty());
        REQUIRE(engine.last_error() == "Snapshot capture failed");
        REQUIRE(reported.size() == 1);
        REQUIRE(reported[0].level == ErrorSeverityLevel::Error);
    }
}

TEST_CASE("Engine - Partial decode failure", "[engine][partial]") {
    SyntheticSnapshotBuilder builder;
    builder.WithTypicalGame().WithMoney(5000000, 0x1111);

    std::vector<std::string> warnings;
    Logger logger;
    logger.warn = [&warnings](const std::string& msg) { warnings.push_back(msg); };

    Engine engine;
    REQUIRE(engine.initialize(Config{}, logger));

    auto result = engine.extract(builder.Build());
    REQUIRE(result.ok());
    REQUIRE_FALSE(result.telemetry.money.has_value());
    REQUIRE(result.telemetry.player_name == "RED");
    REQUIRE(result.telemetry.badge_count == 2);
    REQUIRE(result.telemetry.location == "Pewter City");
    REQUIRE(result.telemetry.playtime == Playtime{ 12, 34, 56 });
    REQUIRE(result.telemetry.position.has_value());
    REQUIRE(result.telemetry.position->x == 10);
    REQUIRE(result.telemetry.position->y == -3);
    REQUIRE(result.telemetry.party.size() == 2);
    REQUIRE(warnings.size() == 1);
}

namespace {
class EmptyProvider : public ISnapshotProvider
{
public:
    std::optional<SnapshotBuffer> CaptureSnapshot() override { return std::nullopt; }
};
} // namespace

TEST_CASE("Engine - Error callback replaced during extraction", "[engine][errors][threads]") {
    Engine engine;
    std::atomic<int> first{ 0 };
    std::atomic<int> second{ 0 };
    engine.set_error_callback([&first](const ErrorInfo&) { ++first; });

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&engine] {
            EmptyProvider provider;
            for (int i = 0; i < 50; ++i)
                engine.capture_and_extract(provider);
        });
    }
    for (int i = 0; i < 50; ++i) {
        if (i % 2 == 0)
            engine.set_error_callback([&second](const ErrorInfo&) { ++second; });
        else
            engine.set_error_callback([&first](const ErrorInfo&) { ++first; });
    }
    for (auto& worker : workers)
        worker.join();

    REQUIRE(first + second == 200);
}

TEST_CASE("Engine - Configuration", "[engine][config]") {
    SECTION("Defaults") {
        Engine engine;
        REQUIRE(engine.config().cache_ttl == std::chrono::milliseconds(500));
        REQUIRE(engine.config().not_found_ttl == std::chrono::milliseconds(200));
        REQUIRE(engine.config().enable_full_scan);
    }

    SECTION("Full scan disabled") {
        SyntheticSnapshotBuilder builder(0x1000);
        builder.WithSaveBlockPointers().WithPlayerName("RED");

        Config cfg;
        cfg.enable_full_scan = false;
        Engine engine;
        REQUIRE(engine.initialize(cfg));

        auto result = engine.extract(builder.Build());
        REQUIRE(result.status == ExtractStatus::LayoutNotFound);
        REQUIRE(engine.locator_stats().Invocations(LocatorStrategyKind::PointerPairScan) == 0);
        REQUIRE(engine.locator_stats().Invocations(LocatorStrategyKind::TitleSignature) == 1);
    }
}

TEST_CASE("Engine - Events across readings", "[engine][events]") {
    SyntheticSnapshotBuilder builder;
    builder.WithTypicalGame();

    Engine engine;
    auto before = engine.extract(builder.Build(1));

    builder.WithMap(3, 20);
    test_support::SyntheticPartyMember charmander;
    charmander.nickname = "CHARMANDER";
    charmander.level = 13;
    charmander.pid = 0x1A2B3C4D;
    charmander.ot_id = 0x00012345;
    builder.WriteBytes(0x02024284, SyntheticSnapshotBuilder::EncodePartyRecord(charmander));

    auto after = engine.extract(builder.Build(2));
    REQUIRE(before.ok());
    REQUIRE(after.ok());

    auto events = TelemetryEvents::Diff(before.telemetry, after.telemetry);
    REQUIRE(events.size() == 2);
    REQUIRE(events[0] == GameEvent{ LocationChangeEvent{ "Pewter City", "Route 2" } });
    REQUIRE(events[1] == GameEvent{ LevelUpEvent{ "CHARMANDER", 12, 13 } });
}

TEST_CASE("FileSnapshotProvider - Reads state files", "[engine][file]") {
    SyntheticSnapshotBuilder builder;
    builder.WithTypicalGame();

    auto path = std::filesystem::temp_directory_path() / "savescan_test_state.ss0";
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(builder.Bytes().data()),
                  static_cast<std::streamsize>(builder.Bytes().size()));
    }

    FileSnapshotProvider provider(path);
    auto first = provider.CaptureSnapshot();
    auto second = provider.CaptureSnapshot();
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(first->size() == builder.Bytes().size());
    REQUIRE(first->capture_id() == second->capture_id());

    Engine engine;
    REQUIRE(engine.capture_and_extract(provider).ok());

    std::filesystem::remove(path);

    SECTION("Missing file") {
        FileSnapshotProvider missing(path);
        REQUIRE_FALSE(missing.CaptureSnapshot().has_value());
        REQUIRE_FALSE(missing.last_error().empty());
    }
}
