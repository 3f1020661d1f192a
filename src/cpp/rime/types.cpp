#include "rime/types.hpp"


// Type constructors are single byte varsint7 values
static int8_t sleb7(byte_t b) {
    return int8_t(byte_t(b << 1)) >> 1;
}

static bool is_value_type(int8_t value) {
    switch(value) {
        case enumval(value_type_t, I32):
        case enumval(value_type_t, I64):
        case enumval(value_type_t, F32):
        case enumval(value_type_t, F64):
        case enumval(value_type_t, V128):
        case enumval(value_type_t, FUNCREF):
        case enumval(value_type_t, EXTERNREF):
            return true;
        default:
            return false;
    }
}

template<> value_type_t read<value_type_t>(Reader& rdr) {
    const auto start = rdr.offset();
    const auto value = read<varsint7_t>(rdr);

    check(is_value_type(value), error_kind_t::INVALID_DISCRIMINANT, start, "Unhandled enum value for value_type_t", hex{byte_t(value & 0x7f)});

    return value_type_t(value);
}

template<> bool isa<value_type_t>(const Reader& rdr) {
    if (rdr.atend())
        return false;

    const auto b = rdr.peek<byte_t>();
    return (b & 0x80) == 0 and is_value_type(sleb7(b));
}

std::ostream& operator<<(std::ostream& os, value_type_t value) {
    switch(value) {
        case value_type_t::I32: return os << "i32";
        case value_type_t::I64: return os << "i64";
        case value_type_t::F32: return os << "f32";
        case value_type_t::F64: return os << "f64";
        case value_type_t::V128: return os << "v128";
        case value_type_t::FUNCREF: return os << "funcref";
        case value_type_t::EXTERNREF: return os << "externref";
    };

    return os << "valtype(" << hex{(byte_t) value} << ")";
}

template<> reference_type_t read<reference_type_t>(Reader& rdr) {
    const auto start = rdr.offset();
    const auto value = read<varsint7_t>(rdr);
    reference_type_t e;

    switch(value) {
        case enumval(reference_type_t, FUNCREF): e = reference_type_t::FUNCREF; break;
        case enumval(reference_type_t, EXTERNREF): e = reference_type_t::EXTERNREF; break;

        default:
            error(error_kind_t::INVALID_DISCRIMINANT, start, "Unhandled enum value for reference_type_t", hex{byte_t(value & 0x7f)});
    };

    return e;
}

std::ostream& operator<<(std::ostream& os, reference_type_t value) {
    return os << value_type_t(value);
}

template<> signature_type_t read<signature_type_t>(Reader& rdr) {
    const auto start = rdr.offset();
    const auto value = read<varsint7_t>(rdr);

    check(value == enumval(signature_type_t, FUNC), error_kind_t::INVALID_DISCRIMINANT, start, "Unhandled enum value for signature_type_t", hex{byte_t(value & 0x7f)});

    return signature_type_t::FUNC;
}

std::ostream& operator<<(std::ostream& os, signature_type_t value) {
    if (value == signature_type_t::FUNC)
        return os << "func";

    return os << "form(" << hex{(byte_t) value} << ")";
}

template<> external_kind_t read<external_kind_t>(Reader& rdr) {
    const auto start = rdr.offset();
    const auto value = rdr.read<byte_t>();
    external_kind_t e;

    switch(value) {
        case 0x00: e = external_kind_t::FUNCTION; break;
        case 0x01: e = external_kind_t::TABLE; break;
        case 0x02: e = external_kind_t::MEMORY; break;
        case 0x03: e = external_kind_t::GLOBAL; break;

        default:
            error(error_kind_t::INVALID_DISCRIMINANT, start, "Unhandled enum value for external_kind_t", hex{value});
    };

    return e;
}

std::ostream& operator<<(std::ostream& os, external_kind_t value) {
    switch(value) {
        case external_kind_t::FUNCTION: return os << "func";
        case external_kind_t::TABLE: return os << "table";
        case external_kind_t::MEMORY: return os << "memory";
        case external_kind_t::GLOBAL: return os << "global";
    };

    return os << "kind(" << hex{(byte_t) value} << ")";
}

template<> resizable_limits_t read<resizable_limits_t>(Reader& rdr) {
    const auto start = rdr.offset();
    resizable_limits_t r{};
    r.flags = rdr.read<byte_t>();

    if (r.flags == 0x00) {
        r.minimum = read<varuint32_t>(rdr);
    } else if (r.flags == 0x01) {
        r.minimum = read<varuint32_t>(rdr);
        r.maximum = read<varuint32_t>(rdr);
    } else
        error(error_kind_t::INVALID_DISCRIMINANT, start, "Unhandled condition for resizable_limits_t", hex{r.flags});

    return r;
}

std::ostream& operator<<(std::ostream& os, const resizable_limits_t& limits) {
    os << limits.minimum;
    if (limits.has_maximum())
        os << ' ' << limits.maximum;
    return os;
}

template<> function_signature_t read<function_signature_t>(Reader& rdr) {
    function_signature_t r;
    r.form = read<signature_type_t>(rdr);
    r.params = read<Arr<value_type_t>>(rdr);
    r.returns = read<Arr<value_type_t>>(rdr);

    return r;
}

std::ostream& operator<<(std::ostream& os, const function_signature_t& fn_sig) {
    return os << fn_sig.params << " -> " << fn_sig.returns;
}

bool operator==(const function_signature_t& x, const function_signature_t& y) {
    return x.form == y.form and x.params == y.params and x.returns == y.returns;
}

function_signature_t sig(const std::initializer_list<value_type_t>& params, const std::initializer_list<value_type_t>& returns) {
    return function_signature_t{
        .form = signature_type_t::FUNC,
        .params = Arr<value_type_t>(params),
        .returns = Arr<value_type_t>(returns),
    };
}

template<> table_description_t read<table_description_t>(Reader& rdr) {
    table_description_t r;
    r.element_type = read<reference_type_t>(rdr);
    r.limits = read<resizable_limits_t>(rdr);

    return r;
}

template<> linear_memory_description_t read<linear_memory_description_t>(Reader& rdr) {
    return {.limits = read<resizable_limits_t>(rdr)};
}

template<> global_description_t read<global_description_t>(Reader& rdr) {
    global_description_t r;
    r.type = read<value_type_t>(rdr);

    const auto start = rdr.offset();
    const auto mutability = rdr.read<byte_t>();

    if (mutability > 1) {
        if (not rdr.options().permissive)
            error(error_kind_t::INVALID_DISCRIMINANT, start, "Invalid global mutability", hex{mutability});

        warn("Treating global mutability", hex{mutability}, "as mutable @", start);
    }

    r.mutability = mutability != 0;

    return r;
}
