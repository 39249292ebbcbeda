#pragma once

#include "../api/game_telemetry.hpp"
#include "../api/logger.hpp"
#include "../memory/VirtualMemoryReader.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace savescan
{

/**
 * @brief Decodes game telemetry through a located VirtualMemoryReader
 *
 * Each field is decoded on its own. A field whose read goes out of
 * bounds or whose value is implausible comes back empty and never stops
 * the other fields.
 */
class DomainDecoder
{
public:
    static constexpr uint32_t kMaxMoney = 999999;

    explicit DomainDecoder(const VirtualMemoryReader& reader, Logger logger = {});

    GameTelemetry Decode() const;

    std::optional<std::string> DecodePlayerName() const;
    std::optional<std::string> DecodeLocation() const;
    std::optional<uint8_t> DecodeBadgeCount() const;
    std::optional<uint32_t> DecodeMoney() const;
    std::optional<Playtime> DecodePlaytime() const;
    std::optional<Position> DecodePosition() const;
    std::vector<PartyMember> DecodeParty() const;

    static uint8_t CountBadgeBits(uint8_t flags);

    /// Money cipher; the same operation encrypts and decrypts
    static uint32_t XorCrypt(uint32_t value, uint32_t key) { return value ^ key; }

private:
    std::optional<std::string> DecodeNameAt(std::optional<uint32_t> address) const;

    void Warn(const std::string& message) const;
    void Debug(const std::string& message) const;

    const VirtualMemoryReader& reader_;
    Logger logger_;
};

} // namespace savescan
