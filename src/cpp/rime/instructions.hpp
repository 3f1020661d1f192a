#ifndef HEADER_RIME_INSTRUCTIONS
#define HEADER_RIME_INSTRUCTIONS


#include <vector>
#include "rime/types.hpp"


// Opcodes are keyed by (prefix << 8) | code, prefix 0x00 for the single byte space
enum class opcode_t : uint16_t {
#define WASM_OPCODE(prefix, code, name, mnemonic, immediates) name = ((prefix) << 8) | (code),
#include "rime/opcodes.def"
#undef WASM_OPCODE

    // `if` with an else arm, keyed on the else marker which is never an instruction of its own
    IF_ELSE = 0x0005,
};

std::ostream& operator<<(std::ostream& os, opcode_t opcode);

// Immediate operand layout following the opcode
enum class immediate_t : uint8_t {
    NONE,
    BLOCK,          // blocktype, body, end
    IF,             // blocktype, body, [else, body], end
    LABEL,          // labelidx
    BR_TABLE,       // vec(labelidx), labelidx
    INDEX,          // one varuint32 index
    INDEX_PAIR,     // two varuint32 indices
    REF_TYPE,       // reftype byte
    SELECT_T,       // vec(valtype)
    MEMARG,         // align, offset
    RESERVED,       // one zero byte
    I32,
    I64,
    F32,
    F64,
    MEMORY_INIT,    // dataidx, zero byte
    MEMORY_COPY,    // two zero bytes
    V128,           // 16 byte constant
    SHUFFLE,        // 16 lane indices
    LANE,           // lane index byte
    MEMARG_LANE,    // align, offset, lane index byte
};

struct opcode_info_t {
    opcode_t opcode;
    byte_t prefix;
    byte_t code;
    const char* mnemonic;
    immediate_t immediates;
};

// nullptr when (prefix, code) names no instruction
const opcode_info_t* lookup_opcode(byte_t prefix, uint32_t code);

const opcode_info_t& opcode_info(opcode_t opcode);

// Every table entry, in declaration order
range_t<const opcode_info_t> all_opcodes();

struct memarg_t {
    uint32_t align;
    uint32_t offset;
};

template<> memarg_t read<memarg_t>(Reader& rdr);

bool operator==(const memarg_t& x, const memarg_t& y);

std::ostream& operator<<(std::ostream& os, const memarg_t& memarg);

struct block_signature_type_t {
    enum class kind_t : uint8_t {
        EMPTY,
        VALUE,
        INDEX,
    };

    kind_t kind;
    value_type_t value;     // kind == VALUE
    uint32_t index;         // kind == INDEX, into the type section
};

template<> block_signature_type_t read<block_signature_type_t>(Reader& rdr);

bool operator==(const block_signature_type_t& x, const block_signature_type_t& y);

std::ostream& operator<<(std::ostream& os, const block_signature_type_t& type);

struct instr_t;

typedef std::vector<instr_t> expr_t;

struct instr_t {
    opcode_t opcode;
    union {
        uint32_t index;
        struct {
            uint32_t first;
            uint32_t second;
        } pair;                             // call_indirect (type, table), table.init (elem, table), table.copy (dst, src)
        memarg_t memarg;
        block_signature_type_t block_type;
        reference_type_t ref_type;
        int32_t i32;
        int64_t i64;
        float32_t f32;
        float64_t f64;
        byte_t bytes[16];                   // v128.const value, i8x16.shuffle lanes
    };
    byte_t lane;
    Arr<value_type_t> types;                // select t*
    Arr<varuint32_t> labels;                // br_table targets, default target in index
    expr_t body;
    expr_t orelse;

    immediate_t immediates() const {
        return opcode_info(opcode).immediates;
    }
};

template<> instr_t read<instr_t>(Reader& rdr);

// Instruction sequence up to and including its closing `end`
template<> expr_t read<expr_t>(Reader& rdr);

bool operator==(const instr_t& x, const instr_t& y);

std::ostream& operator<<(std::ostream& os, const instr_t& instr);

std::ostream& operator<<(std::ostream& os, const expr_t& expr);

struct instantiation_time_initializer_t {
    expr_t instructions;
};

template<> instantiation_time_initializer_t read<instantiation_time_initializer_t>(Reader& rdr);

std::ostream& operator<<(std::ostream& os, const instantiation_time_initializer_t& init);


#endif
