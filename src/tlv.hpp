#pragma once
#include <cstdint>
#include <vector>
#include <string>
#include <stdexcept>

namespace tlv {

// TLV item: [tag:u16][len:u32][value:bytes]
// 32-bit lengths so a whole encrypted chunk fits in one item.
using Bytes = std::vector<uint8_t>;

void write_u16(Bytes& out, uint16_t v);
void write_u32(Bytes& out, uint32_t v);
uint16_t read_u16(const Bytes& in, size_t& off);
uint32_t read_u32(const Bytes& in, size_t& off);

void write_tlv(Bytes& out, uint16_t tag, const Bytes& val);
void write_tlv_str(Bytes& out, uint16_t tag, const std::string& s);
void write_tlv_u32(Bytes& out, uint16_t tag, uint32_t v);

struct Item {
    uint16_t tag{};
    Bytes value{};
};

// Throws std::runtime_error on truncated input.
std::vector<Item> parse_all(const Bytes& in, size_t off = 0);

uint32_t item_u32(const Item& it);

// helpers
Bytes str_bytes(const std::string& s);
std::string bytes_str(const Bytes& b);

} // namespace tlv
