#ifndef HEADER_RIME_TEST_BYTES
#define HEADER_RIME_TEST_BYTES


#include <initializer_list>
#include <stdexcept>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "rime/binary.hpp"


typedef std::vector<byte_t> bytes;

inline bytes operator+(bytes x, const bytes& y) {
    x.insert(x.end(), y.begin(), y.end());
    return x;
}

inline int hex_digit(char c) {
    if ('0' <= c and c <= '9') return c - '0';
    if ('a' <= c and c <= 'f') return c - 'a' + 10;
    if ('A' <= c and c <= 'F') return c - 'A' + 10;
    throw std::invalid_argument(std::string("Not a hex digit: ") + c);
}

// "00 61 73 6d"_bytes, whitespace between pairs is ignored
inline bytes operator""_bytes(const char* s, size_t n) {
    bytes r;
    int hi = -1;

    for (size_t i = 0; i < n; ++i) {
        if (s[i] == ' ')
            continue;

        const auto d = hex_digit(s[i]);
        if (hi < 0) {
            hi = d;
        } else {
            r.push_back(byte_t((hi << 4) | d));
            hi = -1;
        }
    }

    if (hi >= 0)
        throw std::invalid_argument("Odd number of hex digits");

    return r;
}

// Minimal LEB128 for v
template<typename T>
bytes leb(T v) {
    byte_t buf[16];
    Writer w(buf, buf + sizeof(buf));
    w.write_leb128<T>(v);
    return bytes(buf, buf + w.relpos());
}

inline bytes make_name(const std::string& name) {
    return leb(uint32_t(name.size())) + bytes(name.begin(), name.end());
}

inline bytes make_vec(std::initializer_list<bytes> elems) {
    bytes r = leb(uint32_t(elems.size()));
    for (const auto& elem : elems)
        r = r + elem;
    return r;
}

inline bytes make_section(byte_t id, const bytes& content) {
    return bytes{id} + leb(uint32_t(content.size())) + content;
}

// Section header claiming `size` payload bytes regardless of the content that follows
inline bytes make_invalid_size_section(byte_t id, uint32_t size, const bytes& content) {
    return bytes{id} + leb(size) + content;
}

// Code section entry: body size prefix, locals, instructions (terminating end included by the caller)
inline bytes make_body(const bytes& locals, const bytes& instructions) {
    const auto body = locals + instructions;
    return leb(uint32_t(body.size())) + body;
}

static const bytes wasm_prefix = "0061736d 01000000"_bytes;

inline bytes make_module(std::initializer_list<bytes> sections) {
    bytes r = wasm_prefix;
    for (const auto& section : sections)
        r = r + section;
    return r;
}

inline Reader make_reader(const bytes& input, const DecodeOptions& options = {}) {
    return Reader(input.data(), input.data() + input.size(), options);
}

#define EXPECT_DECODE_ERROR(statement, expected_kind)                       \
    do {                                                                    \
        try {                                                               \
            statement;                                                      \
            ADD_FAILURE() << "Expected DecodeError " << (expected_kind);    \
        } catch (const DecodeError& err) {                                  \
            EXPECT_EQ(err.kind, expected_kind) << err;                      \
        }                                                                   \
    } while (0)

#define EXPECT_DECODE_ERROR_AT(statement, expected_kind, expected_offset)   \
    do {                                                                    \
        try {                                                               \
            statement;                                                      \
            ADD_FAILURE() << "Expected DecodeError " << (expected_kind);    \
        } catch (const DecodeError& err) {                                  \
            EXPECT_EQ(err.kind, expected_kind) << err;                      \
            EXPECT_EQ(err.offset, size_t(expected_offset)) << err;          \
        }                                                                   \
    } while (0)


#endif
