#include "rime/instructions.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>


static constexpr byte_t ELSE = 0x05;
static constexpr byte_t END = 0x0B;

static const opcode_info_t opcode_table[] = {
#define WASM_OPCODE(prefix, code, name, mnemonic, immediates) {opcode_t::name, prefix, code, mnemonic, immediate_t::immediates},
#include "rime/opcodes.def"
#undef WASM_OPCODE
};

struct DispatchTable {
    const opcode_info_t* single[256] = {};
    const opcode_info_t* fc[256] = {};
    const opcode_info_t* fd[256] = {};

    DispatchTable() {
        for (const auto& info : opcode_table) {
            switch (info.prefix) {
                case 0x00: single[info.code] = &info; break;
                case 0xFC: fc[info.code] = &info; break;
                case 0xFD: fd[info.code] = &info; break;
            }
        }
    }
};

static const DispatchTable& dispatch() {
    static const DispatchTable table;
    return table;
}

const opcode_info_t* lookup_opcode(byte_t prefix, uint32_t code) {
    if (code > 0xFF)
        return nullptr;

    switch (prefix) {
        case 0x00: return dispatch().single[code];
        case 0xFC: return dispatch().fc[code];
        case 0xFD: return dispatch().fd[code];
        default: return nullptr;
    }
}

const opcode_info_t& opcode_info(opcode_t opcode) {
    if (opcode == opcode_t::IF_ELSE)
        opcode = opcode_t::IF;

    const auto value = uint16_t(opcode);
    const auto info = lookup_opcode(value >> 8, value & 0xFF);

    if (info == nullptr)
        error(error_kind_t::INVALID_OPCODE, 0, "No table entry for opcode", hex{value, 4});

    return *info;
}

range_t<const opcode_info_t> all_opcodes() {
    return make_range(std::begin(opcode_table), std::end(opcode_table));
}

std::ostream& operator<<(std::ostream& os, opcode_t opcode) {
    return os << opcode_info(opcode).mnemonic;
}


template<> memarg_t read<memarg_t>(Reader& rdr) {
    memarg_t r;
    r.align = read<varuint32_t>(rdr);
    r.offset = read<varuint32_t>(rdr);

    return r;
}

bool operator==(const memarg_t& x, const memarg_t& y) {
    return x.align == y.align and x.offset == y.offset;
}

std::ostream& operator<<(std::ostream& os, const memarg_t& memarg) {
    os << "offset=" << memarg.offset << " align=";
    if (memarg.align < 64)
        return os << (uint64_t(1) << memarg.align);
    return os << "2^" << memarg.align;
}

template<> block_signature_type_t read<block_signature_type_t>(Reader& rdr) {
    using kind_t = block_signature_type_t::kind_t;

    const auto start = rdr.offset();

    if (rdr.peek<byte_t>() == 0x40) {
        rdr.read<byte_t>();
        return {.kind = kind_t::EMPTY, .value = {}, .index = 0};
    }

    if (isa<value_type_t>(rdr))
        return {.kind = kind_t::VALUE, .value = read<value_type_t>(rdr), .index = 0};

    const auto index = read<varsint33_t>(rdr);
    check(index >= 0, error_kind_t::INVALID_DISCRIMINANT, start, "Negative type index", index, "in block type");

    return {.kind = kind_t::INDEX, .value = {}, .index = uint32_t(index)};
}

bool operator==(const block_signature_type_t& x, const block_signature_type_t& y) {
    using kind_t = block_signature_type_t::kind_t;

    if (x.kind != y.kind)
        return false;

    switch (x.kind) {
        case kind_t::EMPTY: return true;
        case kind_t::VALUE: return x.value == y.value;
        case kind_t::INDEX: return x.index == y.index;
    }

    return false;
}

std::ostream& operator<<(std::ostream& os, const block_signature_type_t& type) {
    using kind_t = block_signature_type_t::kind_t;

    switch (type.kind) {
        case kind_t::EMPTY: return os;
        case kind_t::VALUE: return os << "(result " << type.value << ')';
        case kind_t::INDEX: return os << "(type " << type.index << ')';
    }

    return os;
}


static void read_reserved(Reader& rdr, const opcode_info_t& info) {
    const auto start = rdr.offset();
    const auto value = rdr.read<byte_t>();

    if (value != 0x00) {
        if (not rdr.options().permissive)
            error(error_kind_t::INVALID_DISCRIMINANT, start, "Reserved byte of", info.mnemonic, "is", hex{value}, "not 0x00");

        warn("Ignoring reserved byte", hex{value}, "of", info.mnemonic, "@", start);
    }
}

// Decodes into seq up to `end`, or `else` when allowed, and returns the terminator consumed
static byte_t read_sequence(Reader& rdr, expr_t& seq, bool allow_else) {
    while (true) {
        const auto next = rdr.peek<byte_t>();

        if (next == END or (allow_else and next == ELSE)) {
            rdr.read<byte_t>();
            return next;
        }

        seq.push_back(read<instr_t>(rdr));
    }
}

template<> instr_t read<instr_t>(Reader& rdr) {
    const auto start = rdr.offset();
    const auto prefix = rdr.read<byte_t>();
    const opcode_info_t* info;

    if (prefix == 0xFC or prefix == 0xFD) {
        const auto code = read<varuint32_t>(rdr);
        info = lookup_opcode(prefix, code);

        if (info == nullptr)
            error(error_kind_t::INVALID_OPCODE, start, "Bad opcode", hex{prefix}, hex{code}, "while reading instruction");
    } else {
        info = lookup_opcode(0x00, prefix);

        if (info == nullptr)
            error(error_kind_t::INVALID_OPCODE, start, "Bad opcode", hex{prefix}, "while reading instruction");
    }

    instr_t r{};
    r.opcode = info->opcode;

    switch (info->immediates) {
        case immediate_t::NONE:
            break;

        case immediate_t::BLOCK: {
            Reader::Nested nested(rdr);
            r.block_type = read<block_signature_type_t>(rdr);
            read_sequence(rdr, r.body, false);
            break;
        }

        case immediate_t::IF: {
            Reader::Nested nested(rdr);
            r.block_type = read<block_signature_type_t>(rdr);

            if (read_sequence(rdr, r.body, true) == ELSE) {
                r.opcode = opcode_t::IF_ELSE;
                read_sequence(rdr, r.orelse, false);
            }
            break;
        }

        case immediate_t::LABEL:
        case immediate_t::INDEX:
            r.index = read<varuint32_t>(rdr);
            break;

        case immediate_t::BR_TABLE:
            r.labels = read<Arr<varuint32_t>>(rdr);
            r.index = read<varuint32_t>(rdr);
            break;

        case immediate_t::INDEX_PAIR:
            r.pair.first = read<varuint32_t>(rdr);
            r.pair.second = read<varuint32_t>(rdr);
            break;

        case immediate_t::REF_TYPE:
            r.ref_type = read<reference_type_t>(rdr);
            break;

        case immediate_t::SELECT_T:
            r.types = read<Arr<value_type_t>>(rdr);
            break;

        case immediate_t::MEMARG:
            r.memarg = read<memarg_t>(rdr);
            break;

        case immediate_t::RESERVED:
            read_reserved(rdr, *info);
            break;

        case immediate_t::I32:
            r.i32 = read<varsint32_t>(rdr);
            break;

        case immediate_t::I64:
            r.i64 = read<varsint64_t>(rdr);
            break;

        case immediate_t::F32:
            r.f32 = read<float32_t>(rdr);
            break;

        case immediate_t::F64:
            r.f64 = read<float64_t>(rdr);
            break;

        case immediate_t::MEMORY_INIT:
            r.index = read<varuint32_t>(rdr);
            read_reserved(rdr, *info);
            break;

        case immediate_t::MEMORY_COPY:
            read_reserved(rdr, *info);
            read_reserved(rdr, *info);
            break;

        case immediate_t::V128:
        case immediate_t::SHUFFLE: {
            const auto bytes = rdr.read_bytes(sizeof(r.bytes));
            std::copy(bytes.begin(), bytes.end(), r.bytes);
            break;
        }

        case immediate_t::LANE:
            r.lane = rdr.read<byte_t>();
            break;

        case immediate_t::MEMARG_LANE:
            r.memarg = read<memarg_t>(rdr);
            r.lane = rdr.read<byte_t>();
            break;
    }

    return r;
}

template<> expr_t read<expr_t>(Reader& rdr) {
    expr_t r;
    read_sequence(rdr, r, false);

    return r;
}

bool operator==(const instr_t& x, const instr_t& y) {
    if (x.opcode != y.opcode)
        return false;

    switch (x.immediates()) {
        case immediate_t::NONE:
        case immediate_t::RESERVED:
        case immediate_t::MEMORY_COPY:
            return true;

        case immediate_t::BLOCK:
            return x.block_type == y.block_type and x.body == y.body;

        case immediate_t::IF:
            return x.block_type == y.block_type and x.body == y.body and x.orelse == y.orelse;

        case immediate_t::LABEL:
        case immediate_t::INDEX:
        case immediate_t::MEMORY_INIT:
            return x.index == y.index;

        case immediate_t::BR_TABLE:
            return x.labels == y.labels and x.index == y.index;

        case immediate_t::INDEX_PAIR:
            return x.pair.first == y.pair.first and x.pair.second == y.pair.second;

        case immediate_t::REF_TYPE:
            return x.ref_type == y.ref_type;

        case immediate_t::SELECT_T:
            return x.types == y.types;

        case immediate_t::MEMARG:
            return x.memarg == y.memarg;

        case immediate_t::I32:
            return x.i32 == y.i32;

        case immediate_t::I64:
            return x.i64 == y.i64;

        // bitwise, so NaN payloads compare
        case immediate_t::F32:
            return float_bits(x.f32) == float_bits(y.f32);

        case immediate_t::F64:
            return float_bits(x.f64) == float_bits(y.f64);

        case immediate_t::V128:
        case immediate_t::SHUFFLE:
            return std::memcmp(x.bytes, y.bytes, sizeof(x.bytes)) == 0;

        case immediate_t::LANE:
            return x.lane == y.lane;

        case immediate_t::MEMARG_LANE:
            return x.memarg == y.memarg and x.lane == y.lane;
    }

    return false;
}


// Round trips through text; NaNs print their payload as in `nan:0x400001`
template<typename F>
static void print_float(std::ostream& os, F value) {
    if (std::isnan(value)) {
        const uint64_t bits = float_bits(value);
        const uint64_t payload = bits & ((uint64_t(1) << (std::numeric_limits<F>::digits - 1)) - 1);
        os << (std::signbit(value) ? "-nan:" : "nan:") << hex{payload, 1};
        return;
    }

    const auto precision = os.precision(std::numeric_limits<F>::max_digits10);
    os << value;
    os.precision(precision);
}

static void print(std::ostream& os, const instr_t& instr, int indent);

static void print(std::ostream& os, const expr_t& expr, int indent) {
    for (const auto& instr : expr) {
        os << '\n' << std::string(indent, ' ');
        print(os, instr, indent);
    }
}

static void print(std::ostream& os, const instr_t& instr, int indent) {
    using kind_t = block_signature_type_t::kind_t;

    const auto& info = opcode_info(instr.opcode);
    os << info.mnemonic;

    switch (info.immediates) {
        case immediate_t::NONE:
        case immediate_t::RESERVED:
        case immediate_t::MEMORY_COPY:
            break;

        case immediate_t::BLOCK:
        case immediate_t::IF:
            if (instr.block_type.kind != kind_t::EMPTY)
                os << ' ' << instr.block_type;

            print(os, instr.body, indent + 2);

            if (instr.opcode == opcode_t::IF_ELSE) {
                os << '\n' << std::string(indent, ' ') << "else";
                print(os, instr.orelse, indent + 2);
            }

            os << '\n' << std::string(indent, ' ') << "end";
            break;

        case immediate_t::LABEL:
        case immediate_t::INDEX:
        case immediate_t::MEMORY_INIT:
            os << ' ' << instr.index;
            break;

        case immediate_t::BR_TABLE:
            for (const auto label : instr.labels)
                os << ' ' << label;
            os << ' ' << instr.index;
            break;

        case immediate_t::INDEX_PAIR:
            os << ' ' << instr.pair.first << ' ' << instr.pair.second;
            break;

        case immediate_t::REF_TYPE:
            os << (instr.ref_type == reference_type_t::FUNCREF ? " func" : " extern");
            break;

        case immediate_t::SELECT_T:
            os << " (result";
            for (const auto type : instr.types)
                os << ' ' << type;
            os << ')';
            break;

        case immediate_t::MEMARG:
            os << ' ' << instr.memarg;
            break;

        case immediate_t::I32:
            os << ' ' << instr.i32;
            break;

        case immediate_t::I64:
            os << ' ' << instr.i64;
            break;

        case immediate_t::F32:
            os << ' ';
            print_float(os, instr.f32);
            break;

        case immediate_t::F64:
            os << ' ';
            print_float(os, instr.f64);
            break;

        case immediate_t::V128:
            os << " i8x16";
            for (const auto b : instr.bytes)
                os << ' ' << (int) b;
            break;

        case immediate_t::SHUFFLE:
            for (const auto b : instr.bytes)
                os << ' ' << (int) b;
            break;

        case immediate_t::LANE:
            os << ' ' << (int) instr.lane;
            break;

        case immediate_t::MEMARG_LANE:
            os << ' ' << instr.memarg << ' ' << (int) instr.lane;
            break;
    }
}

std::ostream& operator<<(std::ostream& os, const instr_t& instr) {
    print(os, instr, 0);
    return os;
}

std::ostream& operator<<(std::ostream& os, const expr_t& expr) {
    bool first = true;
    for (const auto& instr : expr) {
        if (not first)
            os << '\n';
        print(os, instr, 0);
        first = false;
    }
    return os;
}


template<> instantiation_time_initializer_t read<instantiation_time_initializer_t>(Reader& rdr) {
    return {.instructions = read<expr_t>(rdr)};
}

std::ostream& operator<<(std::ostream& os, const instantiation_time_initializer_t& init) {
    return os << init.instructions;
}
