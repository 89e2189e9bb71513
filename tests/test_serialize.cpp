#include "utils/serialize.h"
#include <cassert>
#include <cstdint>
#include <iostream>
#include <stdexcept>

using namespace zackathon::utils;

static void testFixedWidthIsBigEndian() {
    ByteBuffer buf;
    buf.writeUint16(0x0102);
    buf.writeUint32(0x03040506);
    buf.writeUint64(0x0708090a0b0c0d0eULL);
    const auto& d = buf.data();
    assert(d.size() == 14);
    assert(d[0] == 0x01 && d[1] == 0x02);
    assert(d[2] == 0x03 && d[5] == 0x06);
    assert(d[6] == 0x07 && d[13] == 0x0e);

    ByteBuffer in(d);
    assert(in.readUint16() == 0x0102);
    assert(in.readUint32() == 0x03040506);
    assert(in.readUint64() == 0x0708090a0b0c0d0eULL);
    assert(in.remaining() == 0);
}

static void testVarIntBoundaries() {
    ByteBuffer buf;
    buf.writeVarInt(0x7f);
    assert(buf.size() == 1);
    buf.writeVarInt(0x80);
    assert(buf.size() == 3);
    buf.writeVarInt(UINT64_MAX);

    ByteBuffer in(buf.data());
    assert(in.readVarInt() == 0x7f);
    assert(in.readVarInt() == 0x80);
    assert(in.readVarInt() == UINT64_MAX);
}

static void testStringsAndBytes() {
    ByteBuffer buf;
    buf.writeString("team rocket");
    buf.writeBytes({0xde, 0xad});
    buf.writeBool(true);

    ByteBuffer in(buf.data());
    assert(in.readString() == "team rocket");
    auto b = in.readBytes();
    assert(b.size() == 2 && b[0] == 0xde && b[1] == 0xad);
    assert(in.readBool());
}

static void testUnderflowThrows() {
    ByteBuffer truncated(std::vector<uint8_t>{0x05, 'a', 'b'});
    bool threw = false;
    try {
        truncated.readString();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    ByteBuffer empty;
    threw = false;
    try {
        empty.readUint8();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
}

static void testWordConversion() {
    Word256 w = wordFromUint64(0x1234);
    assert(w[30] == 0x12 && w[31] == 0x34);
    for (size_t i = 0; i < 30; i++) assert(w[i] == 0);

    uint64_t out = 0;
    assert(wordToUint64(w, out) && out == 0x1234);

    Word256 big{};
    big[23] = 1;
    assert(!wordToUint64(big, out));
}

static void testAbiEncodesOneWordPerValue() {
    auto encoded = abiEncodeUints({18, 40, 40});
    assert(encoded.size() == 96);
    assert(encoded[31] == 18);
    assert(encoded[63] == 40);
    assert(encoded[95] == 40);

    std::vector<Word256> words;
    assert(abiDecodeWords(encoded, words));
    assert(words.size() == 3);
    uint64_t v = 0;
    assert(wordToUint64(words[0], v) && v == 18);

    encoded.pop_back();
    assert(!abiDecodeWords(encoded, words));

    assert(abiEncodeUints({}).empty());
}

int main() {
    testFixedWidthIsBigEndian();
    testVarIntBoundaries();
    testStringsAndBytes();
    testUnderflowThrows();
    testWordConversion();
    testAbiEncodesOneWordPerValue();
    std::cout << "serialize tests passed" << std::endl;
    return 0;
}
