// ==============================================================================
// registry.cpp - Section Type Registry и декодирование payload
// ==============================================================================
//
// Встроенные типы секций: UEFI 2.6, N.2.2 Section Descriptor.
// Дескрипторы полей заданы только для Firmware Error Record Reference
// (UEFI 2.6, N.2.10), остальные типы декодируются как hex-дамп.
//
// ==============================================================================

#include <bertread/section_registry.hpp>

#include <cctype>

namespace bertread::section {

namespace {

SectionTypeRegistry make_builtin_registry() {
    SectionTypeRegistry registry;

    registry.add(guids::PROCESSOR_GENERIC, {"Processor Generic", {}});
    registry.add(guids::PROCESSOR_IA32_X64, {"Processor Specific - IA32/X64", {}});
    registry.add(guids::PROCESSOR_IPF, {"Processor Specific - IPF", {}});
    registry.add(guids::PROCESSOR_ARM, {"Processor Specific - ARM", {}});
    registry.add(guids::PLATFORM_MEMORY, {"Platform Memory", {}});
    registry.add(guids::PCIE, {"PCIe", {}});
    registry.add(guids::FIRMWARE_ERROR_RECORD_REFERENCE,
                 {"Firmware Error Record Reference",
                  {
                      {"firmware_error_record_type", 0, 1, FieldKind::Byte},
                      {"reserved", 1, 7, FieldKind::Hex},
                      {"record_identifier", 8, 8, FieldKind::Hex},
                  }});
    registry.add(guids::PCI_BUS, {"PCI/PCI-X Bus", {}});
    registry.add(guids::DMAR_GENERIC, {"DMAr Generic", {}});
    registry.add(guids::DMAR_VTD, {"Intel\xc2\xae VT for Directed I/O specific DMAr section", {}});
    registry.add(guids::DMAR_IOMMU, {"IOMMU specific DMAr section", {}});

    return registry;
}

}  // anonymous namespace

// ============================================================================
// FieldKind
// ============================================================================

const char* field_kind_to_string(FieldKind kind) {
    switch (kind) {
        case FieldKind::Byte:
            return "byte";
        case FieldKind::Hex:
            return "hex";
        case FieldKind::String:
            return "string";
        case FieldKind::Int:
            return "int";
        case FieldKind::Guid:
            return "guid";
    }
    return "unknown";
}

std::optional<FieldKind> field_kind_from_string(std::string_view text) {
    if (text == "byte")
        return FieldKind::Byte;
    if (text == "hex")
        return FieldKind::Hex;
    if (text == "string")
        return FieldKind::String;
    if (text == "int")
        return FieldKind::Int;
    if (text == "guid")
        return FieldKind::Guid;
    return std::nullopt;
}

std::optional<std::size_t> field_kind_fixed_length(FieldKind kind) {
    switch (kind) {
        case FieldKind::Byte:
            return 1;
        case FieldKind::Int:
            return 4;
        case FieldKind::Guid:
            return io::GUID_SIZE;
        case FieldKind::Hex:
        case FieldKind::String:
            return std::nullopt;
    }
    return std::nullopt;
}

// ============================================================================
// GUID normalization
// ============================================================================

std::optional<std::string> normalize_guid(std::string_view text) {
    // Допускаются фигурные скобки: {81212A96-09ED-...}
    if (text.size() >= 2 && text.front() == '{' && text.back() == '}') {
        text = text.substr(1, text.size() - 2);
    }

    bool dashed = text.size() == 36;
    if (!dashed && text.size() != io::GUID_SIZE * 2) {
        return std::nullopt;
    }

    std::string result;
    result.reserve(io::GUID_SIZE * 2);
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (dashed && (i == 8 || i == 13 || i == 18 || i == 23)) {
            if (c != '-') {
                return std::nullopt;
            }
            continue;
        }
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return result;
}

// ============================================================================
// SectionTypeRegistry
// ============================================================================

const SectionTypeRegistry& SectionTypeRegistry::builtin() {
    static const SectionTypeRegistry registry = make_builtin_registry();
    return registry;
}

bool SectionTypeRegistry::add(std::string_view guid, SectionTypeSchema schema) {
    auto canonical = normalize_guid(guid);
    if (!canonical) {
        return false;
    }
    schemas_[*canonical] = std::move(schema);
    return true;
}

const SectionTypeSchema* SectionTypeRegistry::find(std::string_view guid) const {
    auto it = schemas_.find(guid);
    if (it == schemas_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::string SectionTypeRegistry::name_of(std::string_view guid) const {
    const SectionTypeSchema* schema = find(guid);
    return schema != nullptr ? schema->name : UNKNOWN_SECTION_NAME;
}

// ============================================================================
// Payload decoding
// ============================================================================

io::DecodeResult<FieldValue> decode_field(const io::ByteCursor& payload,
                                          const FieldDescriptor& field) {
    // Каждый kind отображается на свой примитив ByteCursor
    switch (field.kind) {
        case FieldKind::Byte: {
            auto r = payload.read_byte(field.offset);
            if (auto* err = std::get_if<io::DecodeError>(&r)) {
                return *err;
            }
            return FieldValue{std::get<std::uint8_t>(r)};
        }
        case FieldKind::Int: {
            auto r = payload.read_int32(field.offset);
            if (auto* err = std::get_if<io::DecodeError>(&r)) {
                return *err;
            }
            return FieldValue{std::get<std::int32_t>(r)};
        }
        case FieldKind::Hex: {
            auto r = payload.read_hex(field.offset, field.length);
            if (auto* err = std::get_if<io::DecodeError>(&r)) {
                return *err;
            }
            return FieldValue{std::move(std::get<std::string>(r))};
        }
        case FieldKind::String: {
            auto r = payload.read_ascii(field.offset, field.length);
            if (auto* err = std::get_if<io::DecodeError>(&r)) {
                return *err;
            }
            return FieldValue{std::move(std::get<std::string>(r))};
        }
        case FieldKind::Guid: {
            auto r = payload.read_guid(field.offset);
            if (auto* err = std::get_if<io::DecodeError>(&r)) {
                return *err;
            }
            return FieldValue{std::move(std::get<std::string>(r))};
        }
    }
    return io::DecodeError{io::DecodeErrorKind::OutOfBounds,
                           "unsupported field kind for '" + field.name + "'",
                           payload.base_offset() + field.offset};
}

io::DecodeResult<Payload> decode_payload(const io::ByteCursor& payload,
                                         const SectionTypeSchema* schema) {
    if (schema == nullptr || schema->fields.empty()) {
        return Payload{OpaquePayload{io::bytes_to_hex(payload.data(), payload.size())}};
    }

    DecodedFields fields;
    fields.reserve(schema->fields.size());
    for (const auto& descriptor : schema->fields) {
        auto value = decode_field(payload, descriptor);
        if (auto* err = std::get_if<io::DecodeError>(&value)) {
            err->message = "field '" + descriptor.name + "' of section '" + schema->name +
                           "': " + err->message;
            return *err;
        }
        fields.push_back(
            DecodedField{descriptor.name, descriptor.kind, std::move(std::get<FieldValue>(value))});
    }
    return Payload{std::move(fields)};
}

std::string field_value_to_string(const FieldValue& value) {
    if (const auto* b = std::get_if<std::uint8_t>(&value)) {
        return std::to_string(static_cast<unsigned>(*b));
    }
    if (const auto* i = std::get_if<std::int32_t>(&value)) {
        return std::to_string(*i);
    }
    return std::get<std::string>(value);
}

}  // namespace bertread::section
