#ifndef COMMON_HEADER
#define COMMON_HEADER

#include <cstdint>
#include <cstddef>
#include <utility>
#include <type_traits>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <string>


typedef uint8_t byte_t;

using std::size_t;
using std::ptrdiff_t;

static_assert(sizeof(byte_t) == 1, "Invalid byte size");

#define enumval(enumtype, name) (std::underlying_type<enumtype>::type(enumtype::name))


extern bool tracing_on;

#ifdef TRACE_SWITCH
    #define IF_TRACING(...) if (tracing_on) {__VA_ARGS__}
#else
    #define IF_TRACING(...)
#endif


template <typename... Ts>
std::ostream& fprint(std::ostream& os, Ts&&... args) {
    int i = 0;

    ([&]{
        if (i != 0) os << ' ';
        os << args;
        ++i;
    } (), ...);

    return os;
}

template <typename... Ts>
void warn(const char* message, Ts&&... args) {
    fprint(std::cerr, "WARN:", message, std::forward<Ts>(args)...) << std::endl;
}


struct hex {
    uint64_t value;
    int width = 2;
};

std::ostream& operator<<(std::ostream& os, hex h);


enum class error_kind_t : uint8_t {
    MALFORMED_INTEGER,
    END_OF_INPUT,
    INVALID_DISCRIMINANT,
    INVALID_OPCODE,
    INVALID_PREAMBLE,
    SECTION_SIZE_MISMATCH,
    DEPTH_EXCEEDED,
    INVALID_UTF8,
};

std::ostream& operator<<(std::ostream& os, error_kind_t kind);

struct DecodeError {
    error_kind_t kind;
    size_t offset;
    std::string message;
};

std::ostream& operator<<(std::ostream& os, const DecodeError& err);

template <typename... Ts>
[[noreturn]] void error(error_kind_t kind, size_t offset, const char* message, Ts&&... args) {
    std::ostringstream os;
    fprint(os, message, std::forward<Ts>(args)...);

    DecodeError err{.kind=kind, .offset=offset, .message=os.str()};

    IF_TRACING(std::cout << "!! " << err << std::endl;)

    throw err;
}

template <typename... Ts>
void check(bool cond, error_kind_t kind, size_t offset, const char* message, Ts&&... args) {
    if (not cond)
        error(kind, offset, message, std::forward<Ts>(args)...);
}


template<typename T=void>
class range_t {
    T* b;
    T* e;
public:
    range_t() : b(nullptr), e(nullptr) {}
    range_t(T* begin, T* end) : b(begin), e(end) {}
    range_t(T* begin, size_t size) : range_t(begin, begin + size) {}

    template<typename S>
    range_t(const range_t<S>& r) : b(r.begin()), e(r.end()) {}

    T* begin() const {return b;}
    T* end() const {return e;}
    ptrdiff_t size() const {return e - b;}

    T& operator[](size_t n) {return b[n];}
    const T& operator[](size_t n) const {return b[n];}
};

template<typename S>
range_t<S> make_range(S* begin, S* end) {
    return range_t<S>(begin, end);
}

template<typename S>
range_t<S> make_range(S* begin, size_t size) {
    return range_t<S>(begin, size);
}


template<typename T> struct float_uint;

template<> struct float_uint<float>  {static_assert (sizeof(float)  == sizeof(uint32_t)); using type = uint32_t;};
template<> struct float_uint<double> {static_assert (sizeof(double) == sizeof(uint64_t)); using type = uint64_t;};

template <typename T, typename U>
inline T reinterpret(const U& u) {
    static_assert(sizeof(T) == sizeof(U));
    T t;
    __builtin_memcpy(&t, &u, sizeof(T));
    return t;
}

inline auto float_bits(float f) {
    return reinterpret<typename float_uint<float>::type>(f);
}

inline auto float_bits(double d) {
    return reinterpret<typename float_uint<double>::type>(d);
}

template<typename F, typename U>
auto float_from_bits(U u) {
    static_assert(sizeof(typename float_uint<F>::type) == sizeof(U));
    return reinterpret<F>(u);
}

#endif
