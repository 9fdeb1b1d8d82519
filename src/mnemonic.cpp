#include "mnemonic.hpp"

#include <cstdint>
#include <stdexcept>

namespace relaycp {

namespace {

// Order matters: indices are part of the label derivation.
const char* const kWords[] = {
    "anchor", "apple", "atom", "award", "basketball", "bell", "bicycle", "bolt",
    "bomb", "book", "box", "brain", "briefcase", "bug", "cake", "calculator",
    "camera", "campground", "car", "carrot", "cat", "knight", "rook", "cloud",
    "code", "gear", "compass", "cookie", "crow", "cube", "diamond", "dog",
    "dove", "dragon", "droplet", "drum", "earth", "egg", "envelope", "fan",
    "feather", "fire", "fish", "flag", "flask", "floppy", "folder", "football",
    "frog", "gamepad", "gavel", "gem", "ghost", "gift", "guitar", "hammer",
    "cowboy", "wizard", "heart", "helicopter", "helmet", "hippo", "horse", "hourglass",
    "snowflake", "key", "leaf", "lightbulb", "magnet", "map", "microphone", "moon",
    "mountain", "mug", "music", "paintbrush", "paper", "paw", "pen", "pepper",
    "rocket", "road", "school", "screwdriver", "scroll", "seedling", "shield", "ship",
    "skull", "sliders", "splotch", "spider", "star", "sun", "toolbox", "tornado",
    "tree", "trophy", "truck", "astronaut", "wand", "wrench", "pizza", "burger",
    "lemon",
};

constexpr size_t kWordCount = sizeof(kWords) / sizeof(kWords[0]);
static_assert(kWordCount == 105, "vocabulary size is part of the label derivation");

constexpr uint32_t kReplacementChar = 0xFFFD;

// Decodes the UTF-8 sequence at pos and advances past it. A malformed
// sequence (overlong, surrogate, above U+10FFFF, truncated) yields U+FFFD
// and consumes a single byte.
uint32_t next_code_point(const std::string& s, size_t& pos) {
    const unsigned char b0 = static_cast<unsigned char>(s[pos]);
    if (b0 < 0x80) {
        ++pos;
        return b0;
    }

    size_t len = 0;
    uint32_t cp = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        len = 2;
        cp = b0 & 0x1F;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        len = 3;
        cp = b0 & 0x0F;
        if (b0 == 0xE0) lo = 0xA0;
        if (b0 == 0xED) hi = 0x9F;
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        len = 4;
        cp = b0 & 0x07;
        if (b0 == 0xF0) lo = 0x90;
        if (b0 == 0xF4) hi = 0x8F;
    } else {
        ++pos;
        return kReplacementChar;
    }
    if (s.size() - pos < len) {
        ++pos;
        return kReplacementChar;
    }

    for (size_t i = 1; i < len; ++i) {
        const unsigned char b = static_cast<unsigned char>(s[pos + i]);
        const unsigned char min = i == 1 ? lo : 0x80;
        const unsigned char max = i == 1 ? hi : 0xBF;
        if (b < min || b > max) {
            ++pos;
            return kReplacementChar;
        }
        cp = (cp << 6) | (b & 0x3F);
    }
    pos += len;
    return cp;
}

} // namespace

size_t mnemonic_vocabulary_size() {
    return kWordCount;
}

const char* mnemonic_word(size_t index) {
    if (index >= kWordCount) throw std::out_of_range("mnemonic word index");
    return kWords[index];
}

std::string make_mnemonic(const std::string& peer_id) {
    // Hashed per code point, so non-ASCII ids get the same label as on
    // other implementations.
    uint64_t h = 0;
    size_t pos = 0;
    while (pos < peer_id.size()) {
        h = (h * 31 + next_code_point(peer_id, pos)) & 0x7FFFFFFFu;
    }

    const uint64_t n = kWordCount;
    uint64_t i1 = h % n;
    uint64_t i2 = (h / n) % n;
    uint64_t i3 = (h / (n * n)) % n;

    if (i2 == i1) i2 = (i2 + 1) % n;
    if (i3 == i1 || i3 == i2) {
        i3 = (i3 + 1) % n;
        if (i3 == i1) i3 = (i3 + 1) % n;
    }

    return std::string(kWords[i1]) + "-" + kWords[i2] + "-" + kWords[i3];
}

} // namespace relaycp
