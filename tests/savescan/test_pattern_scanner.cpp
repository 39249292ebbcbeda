#include <catch2/catch_test_macros.hpp>
#include "savescan/pattern/Pattern.hpp"
#include "savescan/pattern/PatternScanner.hpp"
#include "savescan/signatures/Signatures.hpp"

#include <vector>

using namespace savescan;

TEST_CASE("Pattern - FromString parsing", "[pattern][parse]") {
    SECTION("Simple hex pattern") {
        auto pattern = Pattern::FromString("07 00 00 01");
        REQUIRE(pattern.Size() == 4);
        REQUIRE(pattern.bytes[0] == 0x07);
        REQUIRE(pattern.bytes[3] == 0x01);
        REQUIRE_FALSE(pattern.HasWildcards());
    }

    SECTION("Pattern with wildcards") {
        auto pattern = Pattern::FromString("?? 00 . 01");
        REQUIRE(pattern.Size() == 4);
        REQUIRE(pattern.mask[0] == false);
        REQUIRE(pattern.mask[1] == true);
        REQUIRE(pattern.mask[2] == false);
        REQUIRE(pattern.mask[3] == true);
        REQUIRE(pattern.HasWildcards());
    }

    SECTION("Invalid token yields an invalid pattern") {
        auto pattern = Pattern::FromString("07 ZZ 01");
        REQUIRE_FALSE(pattern.IsValid());
    }
}

TEST_CASE("Pattern - FromAscii", "[pattern][bytes]") {
    auto pattern = Pattern::FromAscii("BPRE");
    REQUIRE(pattern.Size() == 4);
    REQUIRE(pattern.bytes == std::vector<uint8_t>{ 'B', 'P', 'R', 'E' });
    REQUIRE_FALSE(pattern.HasWildcards());
}

TEST_CASE("PatternScanner - Buffer search", "[scanner][buffer]") {
    std::vector<uint8_t> buffer(256, 0xEE);
    buffer[10] = 0x07; buffer[11] = 0x00; buffer[12] = 0x00; buffer[13] = 0x01;
    buffer[200] = 0x03; buffer[201] = 0x00; buffer[202] = 0x00; buffer[203] = 0x01;

    SECTION("Exact pattern uses the first match") {
        auto hit = PatternScanner::Find(buffer.data(), buffer.size(), Pattern::FromString("07 00 00 01"));
        REQUIRE(hit.has_value());
        REQUIRE(*hit == 10);
    }

    SECTION("Wildcard pattern finds every match") {
        auto hits = PatternScanner::FindAll(buffer.data(), buffer.size(), Pattern::FromString("?? 00 00 01"));
        REQUIRE(hits == std::vector<size_t>{ 10, 200 });
    }

    SECTION("Missing pattern") {
        auto hit = PatternScanner::Find(buffer.data(), buffer.size(), Pattern::FromString("DE AD BE EF"));
        REQUIRE_FALSE(hit.has_value());
    }

    SECTION("Pattern longer than buffer") {
        auto hit = PatternScanner::Find(buffer.data(), 2, Pattern::FromString("07 00 00 01"));
        REQUIRE_FALSE(hit.has_value());
    }

    SECTION("Null buffer") {
        REQUIRE(PatternScanner::FindAll(nullptr, 100, Pattern::FromString("07")).empty());
    }

    SECTION("Exact pattern reports overlapping matches") {
        std::vector<uint8_t> run(8, 0xAA);
        auto hits = PatternScanner::FindAll(run.data(), run.size(), Pattern::FromString("AA AA AA"));
        REQUIRE(hits == std::vector<size_t>{ 0, 1, 2, 3, 4, 5 });
    }

    SECTION("Match at a given offset") {
        auto magic = Pattern::FromString("?? 00 00 01");
        REQUIRE(PatternScanner::MatchesAt(buffer.data(), buffer.size(), 200, magic));
        REQUIRE_FALSE(PatternScanner::MatchesAt(buffer.data(), buffer.size(), 201, magic));
        REQUIRE_FALSE(PatternScanner::MatchesAt(buffer.data(), buffer.size(), 254, magic));
    }
}

TEST_CASE("Signatures - Save state format tables", "[signatures]") {
    SECTION("Header magic tags") {
        for (uint32_t tag : Signatures::GetHeaderMagicTags()) {
            REQUIRE(Signatures::IsHeaderMagic(tag));
        }
        REQUIRE(Signatures::GetHeaderMagicTags().size() == 10);
        REQUIRE_FALSE(Signatures::IsHeaderMagic(0x0100000A));
        REQUIRE_FALSE(Signatures::IsHeaderMagic(0x02000000));
        REQUIRE(Signatures::GetHeaderMagicPattern().IsValid());
    }

    SECTION("Known offsets") {
        const auto& offsets = Signatures::GetKnownHeaderOffsets();
        REQUIRE(offsets == std::vector<size_t>{ 0x0, 0x10, 0x40, 0x100, 0x200 });
    }

    SECTION("Title signatures") {
        const auto* title = Signatures::GetTitleSignature("rom_title");
        REQUIRE(title != nullptr);
        REQUIRE(title->header_offset == 0x10);
        REQUIRE(title->pattern.IsValid());

        const auto* code = Signatures::GetTitleSignature("game_code");
        REQUIRE(code != nullptr);
        REQUIRE(code->header_offset == 0x1C);

        REQUIRE(Signatures::GetTitleSignature("nonexistent") == nullptr);
    }
}
