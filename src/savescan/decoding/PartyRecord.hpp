#pragma once

#include "../api/game_telemetry.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace savescan
{

/**
 * @brief Layout of one 100-byte party creature record
 *
 * The 48-byte substructure block holds four 12-byte parts (Growth,
 * Attacks, EVs, Misc) in an order chosen by PID % 24, XOR-encrypted
 * word by word with PID ^ OTID. The record checksum is the 16-bit sum of
 * the decrypted block's halfwords.
 */
class PartyRecord
{
public:
    static constexpr size_t kSize = 100;

    static constexpr size_t kPidOffset = 0x00;
    static constexpr size_t kOtIdOffset = 0x04;
    static constexpr size_t kNicknameOffset = 0x08;
    static constexpr size_t kNicknameLength = 10;
    static constexpr size_t kChecksumOffset = 0x1C;
    static constexpr size_t kSubstructOffset = 0x20;
    static constexpr size_t kSubstructBlockSize = 48;
    static constexpr size_t kSubstructSize = 12;
    static constexpr size_t kLevelOffset = 0x54;
    static constexpr size_t kCurrentHpOffset = 0x56;
    static constexpr size_t kMaxHpOffset = 0x58;
    static constexpr size_t kAttackOffset = 0x5A;
    static constexpr size_t kDefenseOffset = 0x5C;
    static constexpr size_t kSpeedOffset = 0x5E;
    static constexpr size_t kSpecialAttackOffset = 0x60;
    static constexpr size_t kSpecialDefenseOffset = 0x62;

    /**
     * @brief Decode a record
     * @return std::nullopt for an empty slot (PID 0) or a short buffer
     */
    static std::optional<PartyMember> Decode(const uint8_t* record, size_t size);

    /// Species id from the Growth part, or std::nullopt on checksum mismatch
    static std::optional<uint16_t> DecodeSpecies(const uint8_t* record, size_t size);

    /// Four letters (G, A, E, M) giving the stored order of the parts
    static std::string_view SubstructOrder(uint32_t pid);

    /// Index of a part ('G', 'A', 'E' or 'M') within the stored block
    static size_t SubstructIndex(uint32_t pid, char part);

    /// XOR each little-endian word of the block with key; applying twice restores it
    static void CryptSubstructs(uint8_t* block, uint32_t key);

    static uint16_t Checksum(const uint8_t* decrypted_block);
};

} // namespace savescan
