#include <catch2/catch_test_macros.hpp>
#include "savescan/decoding/DomainDecoder.hpp"
#include "savescan/decoding/LocationTable.hpp"
#include "savescan/decoding/PartyRecord.hpp"
#include "utils/synthetic_snapshot.hpp"

#include <string>
#include <vector>

using namespace savescan;
using test_support::SyntheticPartyMember;
using test_support::SyntheticSnapshotBuilder;

namespace {

GameTelemetry DecodeAll(const SyntheticSnapshotBuilder& builder, Logger logger = {}) {
    const auto& bytes = builder.Bytes();
    VirtualMemoryReader reader(bytes.data(), bytes.size(), builder.ExpectedLayout(LocatorStrategyKind::KnownOffset));
    DomainDecoder decoder(reader, std::move(logger));
    return decoder.Decode();
}

} // namespace

TEST_CASE("DomainDecoder - Typical game", "[decoder]") {
    SyntheticSnapshotBuilder builder;
    builder.WithTypicalGame();

    auto telemetry = DecodeAll(builder);

    REQUIRE(telemetry.player_name == "RED");
    REQUIRE(telemetry.location == "Pewter City");
    REQUIRE(telemetry.badge_count == 2);
    REQUIRE(telemetry.money == 3000u);
    REQUIRE(telemetry.playtime == Playtime{ 12, 34, 56 });
    REQUIRE(telemetry.position == Position{ 10, -3 });

    REQUIRE(telemetry.party.size() == 2);
    const auto& lead = telemetry.party[0];
    REQUIRE(lead.nickname == "CHARMANDER");
    REQUIRE(lead.level == 12);
    REQUIRE(lead.current_hp == 30);
    REQUIRE(lead.max_hp == 34);
    REQUIRE(lead.attack == 19);
    REQUIRE(lead.defense == 16);
    REQUIRE(lead.speed == 21);
    REQUIRE(lead.special_attack == 18);
    REQUIRE(lead.special_defense == 17);
    REQUIRE(lead.pid == 0x1A2B3C4Du);
    REQUIRE(lead.species_id == 4);

    REQUIRE(telemetry.party[1].nickname == "Pidgey");
    REQUIRE(telemetry.party[1].species_id == 16);
}

TEST_CASE("DomainDecoder - Badge bits", "[decoder][badges]") {
    REQUIRE(DomainDecoder::CountBadgeBits(0x00) == 0);
    REQUIRE(DomainDecoder::CountBadgeBits(0xFF) == 8);
    REQUIRE(DomainDecoder::CountBadgeBits(0b00010001) == 2);
    REQUIRE(DomainDecoder::CountBadgeBits(0b10000000) == 1);

    SyntheticSnapshotBuilder builder;
    builder.WithSaveBlockPointers().WithBadges(0xFF);
    REQUIRE(DecodeAll(builder).badge_count == 8);
}

TEST_CASE("DomainDecoder - Money", "[decoder][money]") {
    SECTION("XOR is its own inverse") {
        for (uint32_t key : { 0x00000001u, 0xA5A5A5A5u, 0xFFFFFFFFu, 0x12345678u }) {
            for (uint32_t money : { 0u, 1u, 3000u, 999999u }) {
                REQUIRE(DomainDecoder::XorCrypt(DomainDecoder::XorCrypt(money, key), key) == money);
            }
        }
    }

    SECTION("Encrypted value") {
        SyntheticSnapshotBuilder builder;
        builder.WithSaveBlockPointers().WithMoney(123456, 0x0F0F0F0F);
        REQUIRE(DecodeAll(builder).money == 123456u);
    }

    SECTION("Zero key means plain storage") {
        SyntheticSnapshotBuilder builder;
        builder.WithSaveBlockPointers().WithMoney(4200, 0);
        REQUIRE(DecodeAll(builder).money == 4200u);
    }

    SECTION("Upper bound is inclusive") {
        SyntheticSnapshotBuilder builder;
        builder.WithSaveBlockPointers().WithMoney(999999, 0x1234);
        REQUIRE(DecodeAll(builder).money == 999999u);
    }

    SECTION("Implausible value is dropped with a warning") {
        SyntheticSnapshotBuilder builder;
        builder.WithTypicalGame().WithMoney(1000000, 0xA5A5A5A5);

        std::vector<std::string> warnings;
        Logger logger;
        logger.warn = [&warnings](const std::string& msg) { warnings.push_back(msg); };

        auto telemetry = DecodeAll(builder, logger);
        REQUIRE_FALSE(telemetry.money.has_value());
        REQUIRE(warnings.size() == 1);
        REQUIRE(warnings[0].find("1000000") != std::string::npos);

        // The other fields are unaffected
        REQUIRE(telemetry.player_name == "RED");
        REQUIRE(telemetry.location == "Pewter City");
        REQUIRE(telemetry.badge_count == 2);
        REQUIRE(telemetry.party.size() == 2);
    }
}

TEST_CASE("DomainDecoder - Location", "[decoder][location]") {
    SECTION("Known map") {
        SyntheticSnapshotBuilder builder;
        builder.WithSaveBlockPointers().WithMap(3, 0);
        REQUIRE(DecodeAll(builder).location == "Pallet Town");
    }

    SECTION("Unknown map falls back to its numbers") {
        SyntheticSnapshotBuilder builder;
        builder.WithSaveBlockPointers().WithMap(99, 99);
        REQUIRE(DecodeAll(builder).location == "Map 99-99");
    }

    SECTION("Table lookups") {
        REQUIRE(LocationTable::MakeKey(3, 19) == "3:19");
        REQUIRE(LocationTable::Lookup(3, 19) == "Route 1");
        REQUIRE(LocationTable::Lookup(3, 43) == "Route 25");
        REQUIRE_FALSE(LocationTable::Lookup(3, 44).has_value());
        REQUIRE(LocationTable::Describe(4, 3) == "Oak's Lab");
    }
}

TEST_CASE("DomainDecoder - Player name", "[decoder][name]") {
    SECTION("Direct address wins when valid") {
        SyntheticSnapshotBuilder builder;
        builder.WithSaveBlockPointers().WithPlayerName("RED").WithDirectPlayerName("Leaf");
        REQUIRE(DecodeAll(builder).player_name == "Leaf");
    }

    SECTION("Save block copy when the direct slot is empty") {
        SyntheticSnapshotBuilder builder;
        builder.WithSaveBlockPointers().WithPlayerName("ASH");
        REQUIRE(DecodeAll(builder).player_name == "ASH");
    }

    SECTION("Neither location holds a name") {
        SyntheticSnapshotBuilder builder;
        builder.WithSaveBlockPointers();
        REQUIRE_FALSE(DecodeAll(builder).player_name.has_value());
    }
}

TEST_CASE("DomainDecoder - Party", "[decoder][party]") {
    SECTION("Empty roster") {
        SyntheticSnapshotBuilder builder;
        builder.WithSaveBlockPointers().WithPartyCount(0);
        REQUIRE(DecodeAll(builder).party.empty());
    }

    SECTION("Six members, no more") {
        std::vector<SyntheticPartyMember> members;
        for (uint32_t i = 0; i < 6; ++i) {
            SyntheticPartyMember member;
            member.nickname = "MON" + std::to_string(i);
            member.pid = 0x100 + i;
            member.level = static_cast<uint8_t>(10 + i);
            members.push_back(member);
        }
        SyntheticSnapshotBuilder builder;
        builder.WithParty(members);
        // A seventh record right after the party must not be read
        builder.WriteBytes(0x02024284 + 6 * 100, SyntheticSnapshotBuilder::EncodePartyRecord(members[0]));

        auto party = DecodeAll(builder).party;
        REQUIRE(party.size() == 6);
        REQUIRE(party[5].nickname == "MON5");
        REQUIRE(party[5].level == 15);
    }

    SECTION("PID zero ends the scan") {
        SyntheticPartyMember first;
        first.nickname = "ONE";
        SyntheticPartyMember hole;
        hole.pid = 0;
        hole.nickname = "HOLE";
        SyntheticPartyMember third;
        third.nickname = "THREE";
        third.pid = 0x777;

        SyntheticSnapshotBuilder builder;
        builder.WithParty({ first, hole, third });

        auto party = DecodeAll(builder).party;
        REQUIRE(party.size() == 1);
        REQUIRE(party[0].nickname == "ONE");
    }

    SECTION("Checksum mismatch keeps the member without a species") {
        SyntheticPartyMember member;
        member.nickname = "BAD";
        member.corrupt_checksum = true;

        SyntheticSnapshotBuilder builder;
        builder.WithParty({ member });

        auto party = DecodeAll(builder).party;
        REQUIRE(party.size() == 1);
        REQUIRE(party[0].nickname == "BAD");
        REQUIRE_FALSE(party[0].species_id.has_value());
    }

    SECTION("Party is absolute and survives bad save block pointers") {
        SyntheticPartyMember member;
        member.nickname = "SOLO";

        SyntheticSnapshotBuilder builder;
        builder.WithParty({ member });
        builder.WriteU32(0x03005008, 0x08000000);

        auto telemetry = DecodeAll(builder);
        REQUIRE(telemetry.party.size() == 1);
        REQUIRE_FALSE(telemetry.money.has_value());
        REQUIRE_FALSE(telemetry.location.has_value());
        REQUIRE_FALSE(telemetry.position.has_value());
        REQUIRE_FALSE(telemetry.badge_count.has_value());
        REQUIRE_FALSE(telemetry.playtime.has_value());
        REQUIRE_FALSE(telemetry.player_name.has_value());
    }
}

TEST_CASE("PartyRecord - Substructure order", "[decoder][party][record]") {
    REQUIRE(PartyRecord::SubstructOrder(0) == "GAEM");
    REQUIRE(PartyRecord::SubstructOrder(5) == "GMEA");
    REQUIRE(PartyRecord::SubstructOrder(23) == "MEAG");
    REQUIRE(PartyRecord::SubstructOrder(24) == "GAEM");
    REQUIRE(PartyRecord::SubstructIndex(23, 'G') == 3);
    REQUIRE(PartyRecord::SubstructIndex(6, 'G') == 1);

    SECTION("Short buffer") {
        std::vector<uint8_t> record(PartyRecord::kSize - 1, 0x11);
        REQUIRE_FALSE(PartyRecord::Decode(record.data(), record.size()).has_value());
    }

    SECTION("Encrypting twice restores the block") {
        std::vector<uint8_t> block(PartyRecord::kSubstructBlockSize);
        for (size_t i = 0; i < block.size(); ++i)
            block[i] = static_cast<uint8_t>(i * 7);
        auto original = block;

        PartyRecord::CryptSubstructs(block.data(), 0xCAFEBABE);
        REQUIRE(block != original);
        PartyRecord::CryptSubstructs(block.data(), 0xCAFEBABE);
        REQUIRE(block == original);
    }
}
