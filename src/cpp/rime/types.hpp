#ifndef HEADER_RIME_TYPES
#define HEADER_RIME_TYPES


#include "rime/binary.hpp"


enum class value_type_t : int8_t {
    I32 = -0x01,
    I64 = -0x02,
    F32 = -0x03,
    F64 = -0x04,
    V128 = -0x05,
    FUNCREF = -0x10,
    EXTERNREF = -0x11,
};

template<> value_type_t read<value_type_t>(Reader& rdr);
template<> bool isa<value_type_t>(const Reader& rdr);

std::ostream& operator<<(std::ostream& os, value_type_t value);

enum class reference_type_t : int8_t {
    FUNCREF = enumval(value_type_t, FUNCREF),
    EXTERNREF = enumval(value_type_t, EXTERNREF),
};

template<> reference_type_t read<reference_type_t>(Reader& rdr);

std::ostream& operator<<(std::ostream& os, reference_type_t value);

enum class signature_type_t : int8_t {
    FUNC = -0x20,
};

template<> signature_type_t read<signature_type_t>(Reader& rdr);

std::ostream& operator<<(std::ostream& os, signature_type_t value);

enum class external_kind_t : uint8_t {
    FUNCTION = 0x00,
    TABLE = 0x01,
    MEMORY = 0x02,
    GLOBAL = 0x03,
};

template<> external_kind_t read<external_kind_t>(Reader& rdr);

std::ostream& operator<<(std::ostream& os, external_kind_t value);

struct resizable_limits_t {
    byte_t flags;
    uint32_t minimum;
    uint32_t maximum;   // only when flags == 0x01

    bool has_maximum() const {return flags == 0x01;}
};

template<> resizable_limits_t read<resizable_limits_t>(Reader& rdr);

std::ostream& operator<<(std::ostream& os, const resizable_limits_t& limits);

struct function_signature_t {
    signature_type_t form;
    Arr<value_type_t> params;
    Arr<value_type_t> returns;
};

template<> function_signature_t read<function_signature_t>(Reader& rdr);

std::ostream& operator<<(std::ostream& os, const function_signature_t& fn_sig);

bool operator==(const function_signature_t& x, const function_signature_t& y);

function_signature_t sig(const std::initializer_list<value_type_t>& params, const std::initializer_list<value_type_t>& returns);

struct table_description_t {
    reference_type_t element_type;
    resizable_limits_t limits;
};

template<> table_description_t read<table_description_t>(Reader& rdr);

struct linear_memory_description_t {
    resizable_limits_t limits;
};

template<> linear_memory_description_t read<linear_memory_description_t>(Reader& rdr);

struct global_description_t {
    value_type_t type;
    uint8_t mutability;
};

template<> global_description_t read<global_description_t>(Reader& rdr);

template<typename T>
std::ostream& operator<<(std::ostream& os, const Arr<T>& arr) {
    os << '(';
    bool first = true;
    for (const auto& elem : arr) {
        if (not first) os << ", ";
        os << elem;
        first = false;
    }
    return os << ')';
}

static constexpr auto I32 = value_type_t::I32;
static constexpr auto I64 = value_type_t::I64;
static constexpr auto F32 = value_type_t::F32;
static constexpr auto F64 = value_type_t::F64;
static constexpr auto V128 = value_type_t::V128;


#endif
