#ifndef HEADER_RIME_MODULE
#define HEADER_RIME_MODULE


#include <memory>
#include <typeinfo>
#include <vector>
#include "rime/instructions.hpp"


enum class section_id_t : byte_t {
    CUSTOM = 0,
    TYPE = 1,
    IMPORT = 2,
    FUNCTION = 3,
    TABLE = 4,
    MEMORY = 5,
    GLOBAL = 6,
    EXPORT = 7,
    START = 8,
    ELEMENT = 9,
    CODE = 10,
    DATA = 11,
    DATA_COUNT = 12,
};

std::ostream& operator<<(std::ostream& os, section_id_t id);


struct import_t {
    identifier_t module_name;
    identifier_t export_name;
    external_kind_t kind;
    union {
        struct {
            uint32_t sig_index;
        } function;
        struct {
            table_description_t desc;
        } table;
        struct {
            linear_memory_description_t desc;
        } memory;
        struct {
            global_description_t desc;
        } global;
    };
};

template<> import_t read<import_t>(Reader& rdr);

struct global_declaration_t {
    global_description_t desc;
    instantiation_time_initializer_t init;
};

template<> global_declaration_t read<global_declaration_t>(Reader& rdr);

struct export_t {
    identifier_t name;
    external_kind_t kind;
    uint32_t index;
};

template<> export_t read<export_t>(Reader& rdr);

// Element segment, one of the eight encodings selected by flags
struct table_initializer_t {
    uint32_t flags;
    uint32_t tableidx;                                  // flags 2, 6; otherwise table 0
    instantiation_time_initializer_t offset;            // active segments
    reference_type_t elemtype;                          // funcref unless flags 5, 6, 7 say otherwise
    Arr<varuint32_t> funcs;                             // flags 0-3
    Arr<instantiation_time_initializer_t> exprs;        // flags 4-7

    bool is_active() const {return (flags & 0x01) == 0;}
    bool is_declarative() const {return (flags & 0x03) == 0x03;}
    bool has_exprs() const {return (flags & 0x04) != 0;}
};

template<> table_initializer_t read<table_initializer_t>(Reader& rdr);

struct local_entry_t {
    uint32_t count;
    value_type_t type;
};

template<> local_entry_t read<local_entry_t>(Reader& rdr);

struct function_body_t {
    uint32_t body_size;
    Arr<local_entry_t> locals;
    expr_t instructions;
};

template<> function_body_t read<function_body_t>(Reader& rdr);

// Data segment: 0 active in memory 0, 1 passive, 2 active with explicit memory
struct data_initializer_t {
    uint32_t flags;
    uint32_t memidx;
    instantiation_time_initializer_t offset;
    Arr<byte_t> data;

    bool is_active() const {return flags != 0x01;}
};

template<> data_initializer_t read<data_initializer_t>(Reader& rdr);


struct Section {
    byte_t id = 0;
    uint32_t size = 0;          // declared payload length
    size_t offset = 0;          // of the payload within the module

    virtual ~Section() = default;

    template<typename T>
    bool is() const {return dynamic_cast<const T*>(this) != nullptr;}

    // Throws std::bad_cast when the section is not a T
    template<typename T>
    const T& as() const {return dynamic_cast<const T&>(*this);}
};

std::ostream& operator<<(std::ostream& os, const Section& section);

struct CustomSection : Section {
    identifier_t name;
    std::vector<byte_t> bytes;
};

struct TypeSection : Section {
    Arr<function_signature_t> types;
};

struct ImportSection : Section {
    Arr<import_t> imports;
};

struct FunctionSection : Section {
    Arr<varuint32_t> sig_indices;
};

struct TableSection : Section {
    Arr<table_description_t> tables;
};

struct LinearMemorySection : Section {
    Arr<linear_memory_description_t> memories;
};

struct GlobalSection : Section {
    Arr<global_declaration_t> globals;
};

struct ExportSection : Section {
    Arr<export_t> exports;
};

struct StartSection : Section {
    uint32_t index = 0;
};

struct ElementSection : Section {
    Arr<table_initializer_t> segments;
};

struct CodeSection : Section {
    Arr<function_body_t> bodies;
};

struct DataSection : Section {
    Arr<data_initializer_t> segments;
};

struct DataCountSection : Section {
    uint32_t count = 0;
};

// Any id outside the known range, payload kept verbatim
struct UnknownSection : Section {
    std::vector<byte_t> bytes;
};

template<>
struct VarType<Section> {
    using type = std::unique_ptr<const Section>;
};

template<> std::unique_ptr<const Section> read<Section>(Reader& rdr);


struct Module {
    static constexpr uint32_t MAGIC_COOKIE = 0x6d736100;   // "\0asm"
    static constexpr uint32_t VERSION = 0x00000001;

    uint32_t magic_cookie;
    uint32_t version;
    std::vector<std::unique_ptr<const Section>> sections;

    // First section of kind T, nullptr when absent
    template<typename T>
    const T* find() const {
        for (const auto& section : sections) {
            if (section->is<T>())
                return &section->as<T>();
        }
        return nullptr;
    }

    template<typename T>
    std::vector<const T*> sections_of() const {
        std::vector<const T*> r;
        for (const auto& section : sections) {
            if (section->is<T>())
                r.push_back(&section->as<T>());
        }
        return r;
    }
};

template<> Module read<Module>(Reader& rdr);

std::ostream& operator<<(std::ostream& os, const Module& module);

Module read_module(const byte_t* begin, const byte_t* end, const DecodeOptions& options = {});


#endif
