#include "crypto/mnemonic.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include "crypto/hash.hpp"
#include "crypto/mnemonic_wordlist_en.hpp"
#include "util/csprng.hpp"
#include "util/pbkdf2.hpp"
#include "util/secure_wipe.hpp"

namespace mostrix::crypto {

namespace {

const std::unordered_map<std::string, std::uint16_t>& EnglishMnemonicWordIndex() {
  static const std::unordered_map<std::string, std::uint16_t> index = [] {
    std::unordered_map<std::string, std::uint16_t> out;
    const auto& wordlist = EnglishMnemonicWordlist();
    out.reserve(wordlist.size());
    for (std::size_t i = 0; i < wordlist.size(); ++i) {
      out.emplace(wordlist[i], static_cast<std::uint16_t>(i));
    }
    return out;
  }();
  return index;
}

bool IsSpace(char ch) {
  return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

std::vector<std::string> SplitWords(std::string_view sentence) {
  std::vector<std::string> words;
  std::size_t pos = 0;
  while (pos < sentence.size()) {
    while (pos < sentence.size() && IsSpace(sentence[pos])) {
      ++pos;
    }
    const std::size_t start = pos;
    while (pos < sentence.size() && !IsSpace(sentence[pos])) {
      ++pos;
    }
    if (pos > start) {
      std::string word(sentence.substr(start, pos - start));
      for (char& ch : word) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
      }
      words.push_back(std::move(word));
    }
  }
  return words;
}

bool IsSupportedWordCount(std::size_t count) {
  return count >= 12 && count <= 24 && count % 3 == 0;
}

}  // namespace

std::array<std::uint8_t, 64> MnemonicSeedFromSentence(const std::string& mnemonic_sentence,
                                                      const std::string& passphrase) {
  std::string normalized = NormalizeMnemonic(mnemonic_sentence);
  // salt = "mnemonic" + passphrase (UTF-8, no NUL terminator).
  std::string salt = "mnemonic";
  salt.append(passphrase);
  auto seed_vec = util::Pbkdf2HmacSha512(normalized, AsBytes(salt), 2048u, 64u);

  std::array<std::uint8_t, 64> seed{};
  std::copy_n(seed_vec.begin(), seed.size(), seed.begin());
  util::SecureWipe(seed_vec);
  util::SecureWipe(salt);
  util::SecureWipe(normalized);
  return seed;
}

const std::vector<std::string>& EnglishMnemonicWordlist() {
  static const std::vector<std::string> wordlist = []() {
    std::vector<std::string> out;
    out.reserve(kEnglishMnemonicWordlistEn.size());
    for (const auto word : kEnglishMnemonicWordlistEn) {
      out.emplace_back(word);
    }
    return out;
  }();
  return wordlist;
}

std::string NormalizeMnemonic(std::string_view mnemonic_sentence) {
  auto words = SplitWords(mnemonic_sentence);
  std::string out;
  for (std::size_t i = 0; i < words.size(); ++i) {
    if (i > 0) {
      out.push_back(' ');
    }
    out += words[i];
    util::SecureWipe(words[i]);
  }
  return out;
}

bool ValidateMnemonic(std::string_view mnemonic_sentence, std::string* error) {
  if (error) {
    error->clear();
  }
  auto words = SplitWords(mnemonic_sentence);
  if (!IsSupportedWordCount(words.size())) {
    if (error) {
      *error = "mnemonic must contain 12, 15, 18, 21 or 24 words";
    }
    for (auto& word : words) {
      util::SecureWipe(word);
    }
    return false;
  }

  const auto& index = EnglishMnemonicWordIndex();
  std::vector<std::uint16_t> indices;
  indices.reserve(words.size());
  bool unknown_word = false;
  for (auto& word : words) {
    auto it = index.find(word);
    if (it == index.end()) {
      unknown_word = true;
    } else {
      indices.push_back(it->second);
    }
    util::SecureWipe(word);
  }
  if (unknown_word) {
    if (error) {
      *error = "mnemonic contains a word not in the English wordlist";
    }
    return false;
  }

  // Total bits = entropy + checksum, with checksum = entropy / 32.
  const std::size_t total_bits = indices.size() * 11;
  const std::size_t checksum_bits = total_bits / 33;
  const std::size_t entropy_bits = total_bits - checksum_bits;
  std::vector<std::uint8_t> packed((total_bits + 7) / 8, 0);
  std::size_t bit_pos = 0;
  for (std::uint16_t value : indices) {
    for (int bit = 10; bit >= 0; --bit) {
      if ((value >> bit) & 0x01u) {
        packed[bit_pos / 8] =
            static_cast<std::uint8_t>(packed[bit_pos / 8] | (1u << (7 - (bit_pos % 8))));
      }
      ++bit_pos;
    }
  }
  std::fill(indices.begin(), indices.end(), 0);

  std::vector<std::uint8_t> entropy(packed.begin(),
                                    packed.begin() + static_cast<std::ptrdiff_t>(entropy_bits / 8));
  const std::uint8_t checksum = packed[entropy_bits / 8];
  util::SecureWipe(packed);
  const auto expected_hash = Sha256(entropy);
  util::SecureWipe(entropy);
  const std::uint8_t mask = static_cast<std::uint8_t>(0xFFu << (8 - checksum_bits));
  if ((expected_hash[0] & mask) != (checksum & mask)) {
    if (error) {
      *error = "mnemonic checksum mismatch";
    }
    return false;
  }
  return true;
}

std::string GenerateMnemonic(std::size_t word_count) {
  if (!IsSupportedWordCount(word_count)) {
    throw std::invalid_argument("unsupported mnemonic length: " + std::to_string(word_count));
  }
  const std::size_t entropy_bits = word_count * 11 * 32 / 33;
  auto entropy = util::SecureRandomBytes(entropy_bits / 8);
  const auto hash = Sha256(entropy);
  std::vector<std::uint8_t> bits_source = entropy;
  bits_source.push_back(hash[0]);
  util::SecureWipe(entropy);

  const auto& wordlist = EnglishMnemonicWordlist();
  std::string sentence;
  for (std::size_t w = 0; w < word_count; ++w) {
    std::uint16_t value = 0;
    for (std::size_t b = 0; b < 11; ++b) {
      const std::size_t bit_pos = w * 11 + b;
      const bool set = (bits_source[bit_pos / 8] >> (7 - (bit_pos % 8))) & 0x01u;
      value = static_cast<std::uint16_t>((value << 1) | (set ? 1u : 0u));
    }
    if (w > 0) {
      sentence.push_back(' ');
    }
    sentence += wordlist[value];
  }
  util::SecureWipe(bits_source);
  return sentence;
}

}  // namespace mostrix::crypto
