#include "rime/binary.hpp"
#include <algorithm>


uint64_t Reader::read_uleb128(unsigned width) {
    const auto start = offset();
    uint64_t result = 0;

    for (unsigned shift = 0;; shift += 7) {
        const uint64_t byte = read<byte_t>();
        result |= (byte & 0x7f) << shift;

        if (shift + 7 >= width) {
            check((byte & 0x80) == 0, error_kind_t::MALFORMED_INTEGER, start, "LEB128 longer than", width, "bits");

            const unsigned used = width - shift;
            if (used < 7 and (byte & 0x7f) >> used != 0) {
                if (not opts.permissive)
                    error(error_kind_t::MALFORMED_INTEGER, start, "LEB128 value exceeds", width, "bits, final byte", hex{byte});

                warn("Truncating LEB128 value to", width, "bits @", start);
            }
            break;
        }

        if ((byte & 0x80) == 0)
            break;
    }

    if (width < 64)
        result &= (uint64_t(1) << width) - 1;

    return result;
}

int64_t Reader::read_sleb128(unsigned width) {
    const auto start = offset();
    uint64_t result = 0;
    unsigned nbits = 0;

    for (unsigned shift = 0;; shift += 7) {
        const uint64_t byte = read<byte_t>();
        result |= (byte & 0x7f) << shift;

        if (shift + 7 >= width) {
            check((byte & 0x80) == 0, error_kind_t::MALFORMED_INTEGER, start, "LEB128 longer than", width, "bits");

            // bits from the sign position upwards must be a pure sign extension
            const unsigned used = width - shift;
            const uint64_t mask = (0x7f >> (used - 1)) << (used - 1);
            const uint64_t top = byte & mask;
            if (top != 0 and top != mask) {
                if (not opts.permissive)
                    error(error_kind_t::MALFORMED_INTEGER, start, "LEB128 value exceeds", width, "bits, final byte", hex{byte});

                warn("Truncating LEB128 value to", width, "bits @", start);
            }

            nbits = width;
            break;
        }

        if ((byte & 0x80) == 0) {
            nbits = shift + 7;
            break;
        }
    }

    if (nbits < 64) {
        result &= (uint64_t(1) << nbits) - 1;
        if ((result >> (nbits - 1)) & 1)
            result |= uint64_t(-1) << nbits;
    }

    return (int64_t) result;
}

Reader Reader::slice(size_t n, error_kind_t underrun) {
    need(n);

    Reader sub(fp, fp + n, opts, offset(), nesting, underrun);
    fp += n;

    return sub;
}

Reader::Nested::Nested(Reader& rdr)
    : rdr(rdr)
{
    check(rdr.nesting < rdr.opts.max_depth, error_kind_t::DEPTH_EXCEEDED, rdr.offset(), "Block nesting deeper than", rdr.opts.max_depth);
    ++rdr.nesting;
}


template<typename T>
void Writer::write_leb128(T v)
{
    const auto signbit = std::is_signed<T>::value ? 0x40 : 0x00;

    while (true) {
        byte_t b = v & 0x7f;
        v >>= 7;

        const auto p = ((b & signbit ? v == T(-1) : v == 0) ? 0x00 : 0x80);

        write<byte_t>(p | b);

        if (p == 0)
            break;
    }
}

template void Writer::write_leb128<uint64_t>(uint64_t);
template void Writer::write_leb128<int64_t>(int64_t);
template void Writer::write_leb128<uint32_t>(uint32_t);
template void Writer::write_leb128<int32_t>(int32_t);
template void Writer::write_leb128<uint8_t>(uint8_t);
template void Writer::write_leb128<int8_t>(int8_t);


template<> byte_t read<byte_t>(Reader& rdr) {
    return rdr.read<byte_t>();
}

template<> uint8_t read<varuint1_t>(Reader& rdr) {
    return rdr.read_uleb128(1);
}

template<> uint8_t read<varuint7_t>(Reader& rdr) {
    return rdr.read_uleb128(7);
}

template<> uint32_t read<varuint32_t>(Reader& rdr) {
    return rdr.read_uleb128(32);
}

template<> uint64_t read<varuint64_t>(Reader& rdr) {
    return rdr.read_uleb128(64);
}

template<> int8_t read<varsint7_t>(Reader& rdr) {
    return rdr.read_sleb128(7);
}

template<> int32_t read<varsint32_t>(Reader& rdr) {
    return rdr.read_sleb128(32);
}

template<> int64_t read<varsint33_t>(Reader& rdr) {
    return rdr.read_sleb128(33);
}

template<> int64_t read<varsint64_t>(Reader& rdr) {
    return rdr.read_sleb128(64);
}

template<> float read<float32_t>(Reader& rdr) {
    return float_from_bits<float>(rdr.read<uint32_t>());
}

template<> double read<float64_t>(Reader& rdr) {
    return float_from_bits<double>(rdr.read<uint64_t>());
}

template<> identifier_t read<identifier_t>(Reader& rdr) {
    const auto start = rdr.offset();
    const auto size = read<varuint32_t>(rdr);
    const auto chars = rdr.read_bytes(size);

    check(valid_utf8(chars.begin(), chars.end()), error_kind_t::INVALID_UTF8, start, "Name is not valid UTF-8");

    return identifier_t(chars.begin(), chars.end());
}

bool valid_utf8(const byte_t* p, const byte_t* end) {
    while (p < end) {
        const byte_t c = *p++;

        if (c < 0x80)
            continue;

        int ntrail;
        uint32_t cp;
        if ((c & 0xe0) == 0xc0)      {ntrail = 1; cp = c & 0x1f;}
        else if ((c & 0xf0) == 0xe0) {ntrail = 2; cp = c & 0x0f;}
        else if ((c & 0xf8) == 0xf0) {ntrail = 3; cp = c & 0x07;}
        else
            return false;

        if (end - p < ntrail)
            return false;

        for (auto i = 0; i < ntrail; ++i) {
            if ((*p & 0xc0) != 0x80)
                return false;
            cp = (cp << 6) | (*p++ & 0x3f);
        }

        static constexpr uint32_t min_cp[] = {0, 0x80, 0x800, 0x10000};

        if (cp < min_cp[ntrail] or cp > 0x10ffff or (0xd800 <= cp and cp <= 0xdfff))
            return false;
    }

    return true;
}
