#include "rime/module.hpp"


std::ostream& operator<<(std::ostream& os, section_id_t id) {
    switch(id) {
        case section_id_t::CUSTOM: return os << "custom";
        case section_id_t::TYPE: return os << "type";
        case section_id_t::IMPORT: return os << "import";
        case section_id_t::FUNCTION: return os << "function";
        case section_id_t::TABLE: return os << "table";
        case section_id_t::MEMORY: return os << "memory";
        case section_id_t::GLOBAL: return os << "global";
        case section_id_t::EXPORT: return os << "export";
        case section_id_t::START: return os << "start";
        case section_id_t::ELEMENT: return os << "element";
        case section_id_t::CODE: return os << "code";
        case section_id_t::DATA: return os << "data";
        case section_id_t::DATA_COUNT: return os << "datacount";
    };

    return os << "section(" << hex{(byte_t) id} << ")";
}


template<> import_t read<import_t>(Reader& rdr) {
    import_t r;
    r.module_name = read<identifier_t>(rdr);
    r.export_name = read<identifier_t>(rdr);
    r.kind = read<external_kind_t>(rdr);

    switch (r.kind) {
        case external_kind_t::FUNCTION: r.function.sig_index = read<varuint32_t>(rdr); break;
        case external_kind_t::TABLE: r.table.desc = read<table_description_t>(rdr); break;
        case external_kind_t::MEMORY: r.memory.desc = read<linear_memory_description_t>(rdr); break;
        case external_kind_t::GLOBAL: r.global.desc = read<global_description_t>(rdr); break;
    }

    return r;
}

template<> global_declaration_t read<global_declaration_t>(Reader& rdr) {
    global_declaration_t r;
    r.desc = read<global_description_t>(rdr);
    r.init = read<instantiation_time_initializer_t>(rdr);

    return r;
}

template<> export_t read<export_t>(Reader& rdr) {
    export_t r;
    r.name = read<identifier_t>(rdr);
    r.kind = read<external_kind_t>(rdr);
    r.index = read<varuint32_t>(rdr);

    return r;
}

// Element kind of the function index encodings, only funcref (0x00) is defined
static void read_elemkind(Reader& rdr) {
    const auto start = rdr.offset();
    const auto elemkind = rdr.read<byte_t>();

    check(elemkind == 0x00, error_kind_t::INVALID_DISCRIMINANT, start, "Unhandled element kind", hex{elemkind});
}

template<> table_initializer_t read<table_initializer_t>(Reader& rdr) {
    const auto start = rdr.offset();
    table_initializer_t r{};
    r.flags = read<varuint32_t>(rdr);
    r.elemtype = reference_type_t::FUNCREF;

    if (r.flags == 0x00) {
        r.offset = read<instantiation_time_initializer_t>(rdr);
        r.funcs = read<Arr<varuint32_t>>(rdr);
    } else if (r.flags == 0x01) {
        read_elemkind(rdr);
        r.funcs = read<Arr<varuint32_t>>(rdr);
    } else if (r.flags == 0x02) {
        r.tableidx = read<varuint32_t>(rdr);
        r.offset = read<instantiation_time_initializer_t>(rdr);
        read_elemkind(rdr);
        r.funcs = read<Arr<varuint32_t>>(rdr);
    } else if (r.flags == 0x03) {
        read_elemkind(rdr);
        r.funcs = read<Arr<varuint32_t>>(rdr);
    } else if (r.flags == 0x04) {
        r.offset = read<instantiation_time_initializer_t>(rdr);
        r.exprs = read<Arr<instantiation_time_initializer_t>>(rdr);
    } else if (r.flags == 0x05) {
        r.elemtype = read<reference_type_t>(rdr);
        r.exprs = read<Arr<instantiation_time_initializer_t>>(rdr);
    } else if (r.flags == 0x06) {
        r.tableidx = read<varuint32_t>(rdr);
        r.offset = read<instantiation_time_initializer_t>(rdr);
        r.elemtype = read<reference_type_t>(rdr);
        r.exprs = read<Arr<instantiation_time_initializer_t>>(rdr);
    } else if (r.flags == 0x07) {
        r.elemtype = read<reference_type_t>(rdr);
        r.exprs = read<Arr<instantiation_time_initializer_t>>(rdr);
    } else
        error(error_kind_t::INVALID_DISCRIMINANT, start, "Unhandled condition for table_initializer_t", r.flags);

    return r;
}

template<> local_entry_t read<local_entry_t>(Reader& rdr) {
    local_entry_t r;
    r.count = read<varuint32_t>(rdr);
    r.type = read<value_type_t>(rdr);

    return r;
}

template<> function_body_t read<function_body_t>(Reader& rdr) {
    function_body_t r;
    r.body_size = read<varuint32_t>(rdr);

    auto body = rdr.slice(r.body_size, error_kind_t::SECTION_SIZE_MISMATCH);
    r.locals = read<Arr<local_entry_t>>(body);
    r.instructions = read<expr_t>(body);

    check(body.atend(), error_kind_t::SECTION_SIZE_MISMATCH, body.offset(), "Function body of", r.body_size, "byte(s) has", body.remaining(), "trailing byte(s)");

    return r;
}

template<> data_initializer_t read<data_initializer_t>(Reader& rdr) {
    const auto start = rdr.offset();
    data_initializer_t r{};
    r.flags = read<varuint32_t>(rdr);

    if (r.flags == 0x00) {
        r.offset = read<instantiation_time_initializer_t>(rdr);
        r.data = read<Arr<byte_t>>(rdr);
    } else if (r.flags == 0x01) {
        r.data = read<Arr<byte_t>>(rdr);
    } else if (r.flags == 0x02) {
        r.memidx = read<varuint32_t>(rdr);
        r.offset = read<instantiation_time_initializer_t>(rdr);
        r.data = read<Arr<byte_t>>(rdr);
    } else
        error(error_kind_t::INVALID_DISCRIMINANT, start, "Unhandled condition for data_initializer_t", r.flags);

    return r;
}


static std::vector<byte_t> read_rest(Reader& rdr) {
    const auto bytes = rdr.read_bytes(rdr.remaining());
    return std::vector<byte_t>(bytes.begin(), bytes.end());
}

static std::unique_ptr<Section> read_payload(byte_t id, Reader& payload) {
    switch (section_id_t(id)) {
        case section_id_t::CUSTOM: {
            auto r = std::make_unique<CustomSection>();
            r->name = read<identifier_t>(payload);
            r->bytes = read_rest(payload);
            return r;
        }
        case section_id_t::TYPE: {
            auto r = std::make_unique<TypeSection>();
            r->types = read<Arr<function_signature_t>>(payload);
            return r;
        }
        case section_id_t::IMPORT: {
            auto r = std::make_unique<ImportSection>();
            r->imports = read<Arr<import_t>>(payload);
            return r;
        }
        case section_id_t::FUNCTION: {
            auto r = std::make_unique<FunctionSection>();
            r->sig_indices = read<Arr<varuint32_t>>(payload);
            return r;
        }
        case section_id_t::TABLE: {
            auto r = std::make_unique<TableSection>();
            r->tables = read<Arr<table_description_t>>(payload);
            return r;
        }
        case section_id_t::MEMORY: {
            auto r = std::make_unique<LinearMemorySection>();
            r->memories = read<Arr<linear_memory_description_t>>(payload);
            return r;
        }
        case section_id_t::GLOBAL: {
            auto r = std::make_unique<GlobalSection>();
            r->globals = read<Arr<global_declaration_t>>(payload);
            return r;
        }
        case section_id_t::EXPORT: {
            auto r = std::make_unique<ExportSection>();
            r->exports = read<Arr<export_t>>(payload);
            return r;
        }
        case section_id_t::START: {
            auto r = std::make_unique<StartSection>();
            r->index = read<varuint32_t>(payload);
            return r;
        }
        case section_id_t::ELEMENT: {
            auto r = std::make_unique<ElementSection>();
            r->segments = read<Arr<table_initializer_t>>(payload);
            return r;
        }
        case section_id_t::CODE: {
            auto r = std::make_unique<CodeSection>();
            r->bodies = read<Arr<function_body_t>>(payload);
            return r;
        }
        case section_id_t::DATA: {
            auto r = std::make_unique<DataSection>();
            r->segments = read<Arr<data_initializer_t>>(payload);
            return r;
        }
        case section_id_t::DATA_COUNT: {
            auto r = std::make_unique<DataCountSection>();
            r->count = read<varuint32_t>(payload);
            return r;
        }
    }

    auto r = std::make_unique<UnknownSection>();
    r->bytes = read_rest(payload);
    return r;
}

template<> std::unique_ptr<const Section> read<Section>(Reader& rdr) {
    const auto id = rdr.read<byte_t>();
    const auto size = read<varuint32_t>(rdr);

    auto payload = rdr.slice(size, error_kind_t::SECTION_SIZE_MISMATCH);
    const auto offset = payload.offset();

    IF_TRACING(std::cout << "Section " << section_id_t(id) << " @" << offset << " size " << size << std::endl;)

    auto r = read_payload(id, payload);

    check(payload.atend(), error_kind_t::SECTION_SIZE_MISMATCH, payload.offset(), "Section", section_id_t(id), "declared", size, "byte(s) but decoded", payload.relpos());

    r->id = id;
    r->size = size;
    r->offset = offset;

    return r;
}

std::ostream& operator<<(std::ostream& os, const Section& section) {
    os << section_id_t(section.id) << " @" << section.offset << " size " << section.size;

    if (section.is<CustomSection>())
        os << " \"" << section.as<CustomSection>().name << '"';

    return os;
}


template<> Module read<Module>(Reader& rdr) {
    Module r;

    const auto magic_at = rdr.offset();
    r.magic_cookie = rdr.read<uint32_t>();
    check(r.magic_cookie == Module::MAGIC_COOKIE, error_kind_t::INVALID_PREAMBLE, magic_at, "Bad magic cookie, expected", hex{Module::MAGIC_COOKIE, 8}, "found", hex{r.magic_cookie, 8});

    const auto version_at = rdr.offset();
    r.version = rdr.read<uint32_t>();
    check(r.version == Module::VERSION, error_kind_t::INVALID_PREAMBLE, version_at, "Unsupported version, expected", Module::VERSION, "found", r.version);

    while (not rdr.atend())
        r.sections.push_back(read<Section>(rdr));

    IF_TRACING(std::cout << "Module of " << r.sections.size() << " section(s)" << std::endl;)

    return r;
}

std::ostream& operator<<(std::ostream& os, const Module& module) {
    os << "module version " << module.version;

    for (const auto& section : module.sections)
        os << "\n  " << *section;

    return os;
}

Module read_module(const byte_t* begin, const byte_t* end, const DecodeOptions& options) {
    Reader rdr(begin, end, options);
    return read<Module>(rdr);
}
