#include "payload_source.hpp"

#include "crypto/Crypto.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace relaycp {

size_t MemorySource::read(uint8_t* out, size_t max) {
    size_t n = std::min(max, data_.size() - pos_);
    if (n > 0) std::memcpy(out, data_.data() + pos_, n);
    pos_ += n;
    return n;
}

FileSource::FileSource(const std::string& path)
    : path_(path), in_(path, std::ios::in | std::ios::binary) {
    if (!in_.is_open()) throw std::runtime_error("cannot open " + path);
    in_.seekg(0, std::ios::end);
    auto end = in_.tellg();
    if (end < 0) throw std::runtime_error("cannot determine size of " + path);
    size_ = static_cast<uint64_t>(end);
    in_.seekg(0, std::ios::beg);
}

size_t FileSource::read(uint8_t* out, size_t max) {
    if (max == 0) return 0;
    in_.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(max));
    std::streamsize n = in_.gcount();
    if (in_.bad()) throw std::runtime_error("read failed: " + path_);
    return static_cast<size_t>(n);
}

void FileSource::rewind() {
    in_.clear();
    in_.seekg(0, std::ios::beg);
    if (!in_) throw std::runtime_error("seek failed: " + path_);
}

std::string hash_source(PayloadSource& src) {
    src.rewind();
    crypto::Sha256 h;
    std::vector<uint8_t> buf(64 * 1024);
    for (;;) {
        size_t n = src.read(buf.data(), buf.size());
        if (n == 0) break;
        h.Update(buf.data(), n);
    }
    src.rewind();
    return crypto::HexDigest(h.Final());
}

} // namespace relaycp
