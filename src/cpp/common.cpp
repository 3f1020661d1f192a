#include "common.hpp"


bool tracing_on = false;


std::ostream& operator<<(std::ostream& os, hex h) {
    const auto flags = os.flags();
    const auto fill = os.fill();

    os << "0x" << std::hex << std::setw(h.width) << std::setfill('0') << h.value;

    os.flags(flags);
    os.fill(fill);
    return os;
}

std::ostream& operator<<(std::ostream& os, error_kind_t kind) {
    switch(kind) {
        case error_kind_t::MALFORMED_INTEGER: return os << "malformed integer";
        case error_kind_t::END_OF_INPUT: return os << "unexpected end of input";
        case error_kind_t::INVALID_DISCRIMINANT: return os << "invalid discriminant";
        case error_kind_t::INVALID_OPCODE: return os << "invalid opcode";
        case error_kind_t::INVALID_PREAMBLE: return os << "invalid preamble";
        case error_kind_t::SECTION_SIZE_MISMATCH: return os << "section size mismatch";
        case error_kind_t::DEPTH_EXCEEDED: return os << "nesting depth exceeded";
        case error_kind_t::INVALID_UTF8: return os << "invalid utf-8";
    };

    return os << "error(" << (int) kind << ")";
}

std::ostream& operator<<(std::ostream& os, const DecodeError& err) {
    return os << err.kind << " @" << err.offset << ": " << err.message;
}
