#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace relaycp {

// Sequential plaintext for one outbound transfer.
class PayloadSource {
public:
    virtual ~PayloadSource() = default;

    virtual uint64_t size() const = 0;
    // Up to max bytes; 0 at the end. Throws std::runtime_error on I/O errors.
    virtual size_t read(uint8_t* out, size_t max) = 0;
    virtual void rewind() = 0;
};

class MemorySource final : public PayloadSource {
public:
    explicit MemorySource(std::vector<uint8_t> data) : data_(std::move(data)) {}

    uint64_t size() const override { return data_.size(); }
    size_t read(uint8_t* out, size_t max) override;
    void rewind() override { pos_ = 0; }

private:
    std::vector<uint8_t> data_;
    size_t pos_ = 0;
};

class FileSource final : public PayloadSource {
public:
    // Throws std::runtime_error when the file cannot be opened.
    explicit FileSource(const std::string& path);

    uint64_t size() const override { return size_; }
    size_t read(uint8_t* out, size_t max) override;
    void rewind() override;

private:
    std::string path_;
    std::ifstream in_;
    uint64_t size_ = 0;
};

// Lowercase hex SHA-256 of the whole source; leaves it rewound.
std::string hash_source(PayloadSource& src);

} // namespace relaycp
