#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace mostrix::crypto {

// Compute the 64-byte BIP-39 seed:
//   seed = PBKDF2-HMAC-SHA512(sentence, "mnemonic" + passphrase, 2048, 64)
//
// The sentence is normalized first (lowercase, single spaces), so callers may
// pass operator input directly once it validates.
std::array<std::uint8_t, 64> MnemonicSeedFromSentence(const std::string& mnemonic_sentence,
                                                      const std::string& passphrase);

// Return the canonical 2048-word English mnemonic wordlist.
const std::vector<std::string>& EnglishMnemonicWordlist();

// Lowercase the words and join them with single ASCII spaces.
std::string NormalizeMnemonic(std::string_view mnemonic_sentence);

// Validate an English mnemonic of 12, 15, 18, 21 or 24 words:
// - every word must exist in the embedded English wordlist
// - the trailing checksum bits must match SHA-256 of the entropy
//
// Returns true if valid; on failure writes a human-readable reason to `error`.
bool ValidateMnemonic(std::string_view mnemonic_sentence, std::string* error = nullptr);

// Fresh mnemonic from secure randomness. word_count must be one of the sizes
// accepted by ValidateMnemonic; throws std::invalid_argument otherwise.
std::string GenerateMnemonic(std::size_t word_count = 12);

}  // namespace mostrix::crypto
