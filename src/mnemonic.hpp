#pragma once

#include <cstddef>
#include <string>

namespace relaycp {

// Number of words in the icon vocabulary.
size_t mnemonic_vocabulary_size();
const char* mnemonic_word(size_t index);

// Deterministic, cosmetic three-word label for a peer id, e.g.
// "anchor-tree-wand". Has no security role.
std::string make_mnemonic(const std::string& peer_id);

} // namespace relaycp
