#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace zackathon {
namespace utils {

// Big-endian fixed-width integers, varint length prefixes for strings and
// byte vectors. Reads past the end throw std::runtime_error.
class ByteBuffer {
public:
    ByteBuffer();
    explicit ByteBuffer(const std::vector<uint8_t>& data);

    void writeUint8(uint8_t value);
    void writeUint16(uint16_t value);
    void writeUint32(uint32_t value);
    void writeUint64(uint64_t value);
    void writeBool(bool value);
    void writeVarInt(uint64_t value);
    void writeString(const std::string& value);
    void writeBytes(const std::vector<uint8_t>& value);
    void writeFixedBytes(const uint8_t* data, size_t length);

    template<size_t N>
    void writeArray(const std::array<uint8_t, N>& value) {
        writeFixedBytes(value.data(), N);
    }

    uint8_t readUint8();
    uint16_t readUint16();
    uint32_t readUint32();
    uint64_t readUint64();
    bool readBool();
    uint64_t readVarInt();
    std::string readString();
    std::vector<uint8_t> readBytes();
    void readFixedBytes(uint8_t* dest, size_t length);

    template<size_t N>
    std::array<uint8_t, N> readArray() {
        std::array<uint8_t, N> out{};
        readFixedBytes(out.data(), N);
        return out;
    }

    const std::vector<uint8_t>& data() const { return data_; }
    size_t size() const { return data_.size(); }
    size_t remaining() const { return data_.size() - readPos_; }
    size_t position() const { return readPos_; }
    void reset() { readPos_ = 0; }

private:
    std::vector<uint8_t> data_;
    size_t readPos_;

    void checkRead(size_t bytes) const;
};

using Word256 = std::array<uint8_t, 32>;

Word256 wordFromUint64(uint64_t value);
// False when the word does not fit in 64 bits.
bool wordToUint64(const Word256& word, uint64_t& out);

// ABI static encoding of a tuple of unsigned integers: one 32-byte
// big-endian word per value, no head/tail section.
std::vector<uint8_t> abiEncodeWords(const std::vector<Word256>& words);
std::vector<uint8_t> abiEncodeUints(const std::vector<uint64_t>& values);
bool abiDecodeWords(const std::vector<uint8_t>& encoded, std::vector<Word256>& out);

}
}
