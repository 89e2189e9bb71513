#include "utils/serialize.h"
#include <cstring>
#include <stdexcept>

namespace zackathon {
namespace utils {

ByteBuffer::ByteBuffer() : readPos_(0) {}

ByteBuffer::ByteBuffer(const std::vector<uint8_t>& data) : data_(data), readPos_(0) {}

void ByteBuffer::writeUint8(uint8_t value) {
    data_.push_back(value);
}

void ByteBuffer::writeUint16(uint16_t value) {
    data_.push_back(static_cast<uint8_t>(value >> 8));
    data_.push_back(static_cast<uint8_t>(value & 0xFF));
}

void ByteBuffer::writeUint32(uint32_t value) {
    for (int i = 3; i >= 0; i--) {
        data_.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

void ByteBuffer::writeUint64(uint64_t value) {
    for (int i = 7; i >= 0; i--) {
        data_.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

void ByteBuffer::writeBool(bool value) {
    writeUint8(value ? 1 : 0);
}

void ByteBuffer::writeVarInt(uint64_t value) {
    while (value >= 0x80) {
        data_.push_back(static_cast<uint8_t>((value & 0x7F) | 0x80));
        value >>= 7;
    }
    data_.push_back(static_cast<uint8_t>(value));
}

void ByteBuffer::writeString(const std::string& value) {
    writeVarInt(value.length());
    data_.insert(data_.end(), value.begin(), value.end());
}

void ByteBuffer::writeBytes(const std::vector<uint8_t>& value) {
    writeVarInt(value.size());
    data_.insert(data_.end(), value.begin(), value.end());
}

void ByteBuffer::writeFixedBytes(const uint8_t* data, size_t length) {
    data_.insert(data_.end(), data, data + length);
}

uint8_t ByteBuffer::readUint8() {
    checkRead(1);
    return data_[readPos_++];
}

uint16_t ByteBuffer::readUint16() {
    checkRead(2);
    uint16_t value = static_cast<uint16_t>((static_cast<uint16_t>(data_[readPos_]) << 8) |
                                           static_cast<uint16_t>(data_[readPos_ + 1]));
    readPos_ += 2;
    return value;
}

uint32_t ByteBuffer::readUint32() {
    checkRead(4);
    uint32_t value = 0;
    for (int i = 0; i < 4; i++) {
        value = (value << 8) | static_cast<uint32_t>(data_[readPos_ + i]);
    }
    readPos_ += 4;
    return value;
}

uint64_t ByteBuffer::readUint64() {
    checkRead(8);
    uint64_t value = 0;
    for (int i = 0; i < 8; i++) {
        value = (value << 8) | static_cast<uint64_t>(data_[readPos_ + i]);
    }
    readPos_ += 8;
    return value;
}

bool ByteBuffer::readBool() {
    return readUint8() != 0;
}

uint64_t ByteBuffer::readVarInt() {
    uint64_t value = 0;
    int shift = 0;

    while (true) {
        checkRead(1);
        uint8_t byte = data_[readPos_++];
        value |= static_cast<uint64_t>(byte & 0x7F) << shift;
        if ((byte & 0x80) == 0) break;
        shift += 7;
        if (shift >= 64) {
            throw std::runtime_error("VarInt overflow");
        }
    }
    return value;
}

std::string ByteBuffer::readString() {
    uint64_t length = readVarInt();
    checkRead(length);
    std::string value(data_.begin() + readPos_, data_.begin() + readPos_ + length);
    readPos_ += length;
    return value;
}

std::vector<uint8_t> ByteBuffer::readBytes() {
    uint64_t length = readVarInt();
    checkRead(length);
    std::vector<uint8_t> value(data_.begin() + readPos_, data_.begin() + readPos_ + length);
    readPos_ += length;
    return value;
}

void ByteBuffer::readFixedBytes(uint8_t* dest, size_t length) {
    checkRead(length);
    std::memcpy(dest, data_.data() + readPos_, length);
    readPos_ += length;
}

void ByteBuffer::checkRead(size_t bytes) const {
    if (bytes > data_.size() || readPos_ > data_.size() - bytes) {
        throw std::runtime_error("Buffer underflow");
    }
}

Word256 wordFromUint64(uint64_t value) {
    Word256 word{};
    for (int i = 0; i < 8; i++) {
        word[31 - i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFF);
    }
    return word;
}

bool wordToUint64(const Word256& word, uint64_t& out) {
    for (size_t i = 0; i < 24; i++) {
        if (word[i] != 0) return false;
    }
    out = 0;
    for (size_t i = 24; i < 32; i++) {
        out = (out << 8) | word[i];
    }
    return true;
}

std::vector<uint8_t> abiEncodeWords(const std::vector<Word256>& words) {
    std::vector<uint8_t> out;
    out.reserve(words.size() * 32);
    for (const auto& w : words) {
        out.insert(out.end(), w.begin(), w.end());
    }
    return out;
}

std::vector<uint8_t> abiEncodeUints(const std::vector<uint64_t>& values) {
    std::vector<Word256> words;
    words.reserve(values.size());
    for (uint64_t v : values) words.push_back(wordFromUint64(v));
    return abiEncodeWords(words);
}

bool abiDecodeWords(const std::vector<uint8_t>& encoded, std::vector<Word256>& out) {
    if (encoded.size() % 32 != 0) return false;
    out.clear();
    for (size_t off = 0; off < encoded.size(); off += 32) {
        Word256 w{};
        std::memcpy(w.data(), encoded.data() + off, 32);
        out.push_back(w);
    }
    return true;
}

}
}
