#ifndef HEADER_RIME_BINARY
#define HEADER_RIME_BINARY


#include <bit>
#include <cstdint>
#include <cstring>
#include <ostream>
#include <string>
#include <vector>
#include "common.hpp"


static_assert(std::endian::native == std::endian::little, "Fixed width reads assume a little endian host");


struct DecodeOptions {
    uint32_t max_depth = 1024;  // nested block/loop/if constructs
    bool permissive = false;    // accept out of range LEB128 padding bits and non-zero reserved bytes
};


template<typename T>
class Binary
{
protected:
    T* begin;
    T* end;
    T* fp;
    size_t base;

    Binary(T* begin, T* end, size_t base)
        : begin(begin), end(end), fp(begin), base(base)
    {
    }
public:
    size_t remaining() const {
        return end - fp;
    }

    bool atend() const {
        return fp >= end;
    }

    ptrdiff_t relpos() const {
        return fp - begin;
    }

    // Absolute position within the outermost input
    size_t offset() const {
        return base + relpos();
    }
};


class Reader : public Binary<const byte_t> {
    DecodeOptions opts;
    uint32_t nesting;
    error_kind_t underrun;

    Reader(const byte_t* begin, const byte_t* end, const DecodeOptions& options, size_t base, uint32_t nesting, error_kind_t underrun)
        : Binary(begin, end, base), opts(options), nesting(nesting), underrun(underrun) {}
public:
    Reader(const byte_t* begin, const byte_t* end, const DecodeOptions& options = {})
        : Reader(begin, end, options, 0, 0, error_kind_t::END_OF_INPUT) {}

    const DecodeOptions& options() const {
        return opts;
    }

    void need(size_t n) const {
        if (remaining() < n)
            error(underrun, offset(), "need", n, "byte(s) but only", remaining(), "remain");
    }

    template<typename T>
    T read() {
        static_assert(std::is_trivially_copyable<T>::value);
        need(sizeof(T));
        T t;
        std::memcpy(&t, fp, sizeof(T));
        fp += sizeof(T);
        return t;
    }

    template<typename T>
    T peek() const {
        static_assert(std::is_trivially_copyable<T>::value);
        need(sizeof(T));
        T t;
        std::memcpy(&t, fp, sizeof(T));
        return t;
    }

    range_t<const byte_t> read_bytes(size_t n) {
        need(n);
        const auto p = fp;
        fp += n;
        return make_range(p, n);
    }

    uint64_t read_uleb128(unsigned width);
    int64_t read_sleb128(unsigned width);

    // Carve the next n bytes off into a bounded reader; running short inside it reports `underrun`
    Reader slice(size_t n, error_kind_t underrun);

    struct Nested {
        Reader& rdr;

        explicit Nested(Reader& rdr);
        ~Nested() {--rdr.nesting;}

        Nested(const Nested&) = delete;
        Nested& operator=(const Nested&) = delete;
    };
};


class Writer : public Binary<byte_t> {
public:
    Writer(byte_t* begin, byte_t* end)
        : Binary(begin, end, 0) {}

    template<typename T>
    void write(T v) {
        check(remaining() >= sizeof(T), error_kind_t::END_OF_INPUT, offset(), "Writer overflow");
        std::memcpy(fp, &v, sizeof(T));
        fp += sizeof(T);
    }

    template<typename T>
    void write_leb128(T v);
};


template<typename T>
struct VarType {
    using type = T;
};

template<typename T>
struct ReaderFor;

template<typename T>
typename VarType<T>::type read(Reader& rdr) {
    return ReaderFor<T>::read(rdr);
}

// Non-consuming probe for whether T can be read at the cursor
template<typename T>
bool isa(const Reader& rdr);


template<> byte_t read<byte_t>(Reader& rdr);

struct varuint1_t;
template<> struct VarType<varuint1_t> {using type = uint8_t;};
template<> uint8_t read<varuint1_t>(Reader& rdr);

struct varuint7_t;
template<> struct VarType<varuint7_t> {using type = uint8_t;};
template<> uint8_t read<varuint7_t>(Reader& rdr);

struct varuint32_t;
template<> struct VarType<varuint32_t> {using type = uint32_t;};
template<> uint32_t read<varuint32_t>(Reader& rdr);

struct varuint64_t;
template<> struct VarType<varuint64_t> {using type = uint64_t;};
template<> uint64_t read<varuint64_t>(Reader& rdr);

struct varsint7_t;
template<> struct VarType<varsint7_t> {using type = int8_t;};
template<> int8_t read<varsint7_t>(Reader& rdr);

struct varsint32_t;
template<> struct VarType<varsint32_t> {using type = int32_t;};
template<> int32_t read<varsint32_t>(Reader& rdr);

struct varsint33_t;
template<> struct VarType<varsint33_t> {using type = int64_t;};
template<> int64_t read<varsint33_t>(Reader& rdr);

struct varsint64_t;
template<> struct VarType<varsint64_t> {using type = int64_t;};
template<> int64_t read<varsint64_t>(Reader& rdr);

typedef float float32_t;
typedef double float64_t;

template<> float read<float32_t>(Reader& rdr);
template<> double read<float64_t>(Reader& rdr);

// Length prefixed UTF-8 name
typedef std::string identifier_t;

template<> identifier_t read<identifier_t>(Reader& rdr);

bool valid_utf8(const byte_t* begin, const byte_t* end);


template<typename T>
struct Arr : std::vector<typename VarType<T>::type> {
    using std::vector<typename VarType<T>::type>::vector;
};

template<typename T>
struct VarType<Arr<T>> {
    using type = Arr<T>;
};

template<typename T>
struct ReaderFor<Arr<T>> {
    static Arr<T> read(Reader& rdr) {
        const auto count = ::read<varuint32_t>(rdr);

        // every element takes at least a byte, so a count beyond the input is a truncation
        rdr.need(count);

        Arr<T> v;
        v.reserve(count);
        for (uint32_t i = 0; i < count; ++i)
            v.push_back(::read<T>(rdr));

        return v;
    }
};


#endif
