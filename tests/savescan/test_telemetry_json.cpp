#include <catch2/catch_test_macros.hpp>
#include "savescan/api/telemetry_json.hpp"

using namespace savescan;
using nlohmann::json;

TEST_CASE("Telemetry JSON - Current state", "[json]") {
    SECTION("Empty telemetry serializes nulls") {
        auto j = ToJson(GameTelemetry{});
        REQUIRE(j["playerName"].is_null());
        REQUIRE(j["location"].is_null());
        REQUIRE(j["badges"].is_null());
        REQUIRE(j["money"].is_null());
        REQUIRE(j["playtime"].is_null());
        REQUIRE(j["position"].is_null());
        REQUIRE(j["party"].is_array());
        REQUIRE(j["party"].empty());
    }

    SECTION("Populated telemetry") {
        GameTelemetry telemetry;
        telemetry.player_name = "RED";
        telemetry.location = "Pewter City";
        telemetry.badge_count = 2;
        telemetry.money = 3000;
        telemetry.playtime = Playtime{ 12, 34, 56 };
        telemetry.position = Position{ 10, -3 };

        PartyMember member;
        member.nickname = "CHARMANDER";
        member.level = 12;
        member.current_hp = 30;
        member.max_hp = 34;
        member.pid = 0x1A2B3C4D;
        member.species_id = 4;
        telemetry.party.push_back(member);

        auto j = ToJson(telemetry);
        REQUIRE(j["playerName"] == "RED");
        REQUIRE(j["location"] == "Pewter City");
        REQUIRE(j["badges"] == 2);
        REQUIRE(j["money"] == 3000);
        REQUIRE(j["playtime"] == json{ { "hours", 12 }, { "minutes", 34 }, { "seconds", 56 } });
        REQUIRE(j["position"]["x"] == 10);
        REQUIRE(j["position"]["y"] == -3);

        const auto& lead = j["party"][0];
        REQUIRE(lead["nickname"] == "CHARMANDER");
        REQUIRE(lead["level"] == 12);
        REQUIRE(lead["currentHp"] == 30);
        REQUIRE(lead["maxHp"] == 34);
        REQUIRE(lead["pid"] == 0x1A2B3C4D);
        REQUIRE(lead["speciesId"] == 4);
        REQUIRE(lead.contains("specialAttack"));
        REQUIRE(lead.contains("specialDefense"));
    }

    SECTION("Unverified species is null") {
        PartyMember member;
        member.nickname = "BAD";
        REQUIRE(ToJson(member)["speciesId"].is_null());
    }
}

TEST_CASE("Telemetry JSON - Payload", "[json][payload]") {
    GameTelemetry telemetry;
    telemetry.location = "Route 1";

    std::vector<GameEvent> events{ LocationChangeEvent{ "Pallet Town", "Route 1" },
                                   LevelUpEvent{ "Pidgey", 7, 8 } };

    auto j = BuildPayload(telemetry, events, "2024-05-01T12:00:00Z");
    REQUIRE(j["timestamp"] == "2024-05-01T12:00:00Z");
    REQUIRE(j["currentState"]["location"] == "Route 1");

    REQUIRE(j["events"].size() == 2);
    REQUIRE(j["events"][0]["type"] == "location_change");
    REQUIRE(j["events"][0]["data"] == json{ { "from", "Pallet Town" }, { "to", "Route 1" } });
    REQUIRE(j["events"][0]["timestamp"] == "2024-05-01T12:00:00Z");

    REQUIRE(j["events"][1]["type"] == "level_up");
    REQUIRE(j["events"][1]["data"]["pokemon"] == "Pidgey");
    REQUIRE(j["events"][1]["data"]["oldLevel"] == 7);
    REQUIRE(j["events"][1]["data"]["newLevel"] == 8);

    SECTION("Current state matches the game-state server schema") {
        REQUIRE(j["currentState"]["inBattle"].is_boolean());
        REQUIRE(j["currentState"]["inBattle"] == false);
        REQUIRE(j["currentState"]["playtime"].is_null());

        telemetry.playtime = Playtime{ 12, 34, 56 };
        auto timed = BuildPayload(telemetry, {}, "t");
        REQUIRE(timed["currentState"]["playtime"].is_number_integer());
        REQUIRE(timed["currentState"]["playtime"] == 12 * 3600 + 34 * 60 + 56);
        REQUIRE(ToJson(telemetry)["playtime"].is_object());
    }

    SECTION("No events still carries an array") {
        auto quiet = BuildPayload(telemetry, {}, "t");
        REQUIRE(quiet["events"].is_array());
        REQUIRE(quiet["events"].empty());
    }
}
