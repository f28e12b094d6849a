// ==============================================================================
// json.cpp - JSON представление таблиц (RapidJSON)
// ==============================================================================
//
// Ключи - snake_case имена полей. Строки копируются в allocator документа.
// ASCII поля (oem_id, fru_text, ...) выводятся как в тексте, через display_text.
// Payload записи:
// - "payload": {...} в порядке дескрипторов схемы
// - "payload_hex": "aa bb ..." для непрозрачного payload
//
// ==============================================================================

#include <bertread/render.hpp>

namespace bertread::render {

namespace {

rapidjson::Value make_string(std::string_view s, Allocator& alloc) {
    return rapidjson::Value(s.data(), static_cast<rapidjson::SizeType>(s.size()), alloc);
}

void add_string(rapidjson::Value& obj, const char* key, std::string_view value,
                Allocator& alloc) {
    obj.AddMember(rapidjson::StringRef(key), make_string(value, alloc), alloc);
}

void add_header(rapidjson::Value& obj, const acpi::AcpiTableHeader& header, Allocator& alloc) {
    add_string(obj, "header_signature", header.signature, alloc);
    obj.AddMember("length", header.length, alloc);
    obj.AddMember("revision", static_cast<unsigned>(header.revision), alloc);
    obj.AddMember("checksum", static_cast<unsigned>(header.checksum), alloc);
    add_string(obj, "oem_id", display_text(header.oem_id), alloc);
    add_string(obj, "oem_table_id", display_text(header.oem_table_id), alloc);
    obj.AddMember("oem_revision", header.oem_revision, alloc);
    add_string(obj, "creator_id", display_text(header.creator_id), alloc);
    obj.AddMember("creator_revision", header.creator_revision, alloc);
}

rapidjson::Value field_value_to_json(const section::FieldValue& value, Allocator& alloc) {
    if (const auto* b = std::get_if<std::uint8_t>(&value)) {
        return rapidjson::Value(static_cast<unsigned>(*b));
    }
    if (const auto* i = std::get_if<std::int32_t>(&value)) {
        return rapidjson::Value(*i);
    }
    return make_string(std::get<std::string>(value), alloc);
}

}  // anonymous namespace

rapidjson::Value bert_to_json(const acpi::BertRecord& record, Allocator& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    add_header(obj, record.header, alloc);
    obj.AddMember("boot_error_region_length", record.boot_error_region_length, alloc);
    add_string(obj, "boot_error_region", record.boot_error_region, alloc);
    add_string(obj, "hex", record.header_hex, alloc);
    return obj;
}

rapidjson::Value hest_to_json(const acpi::HestRecord& record, Allocator& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    add_header(obj, record.header, alloc);
    obj.AddMember("error_source_count", record.error_source_count, alloc);
    add_string(obj, "error_source_structures",
               io::bytes_to_hex(record.error_source_structures.data(),
                                record.error_source_structures.size()),
               alloc);
    add_string(obj, "hex", record.header_hex, alloc);
    return obj;
}

rapidjson::Value entry_to_json(const gesb::GenericErrorDataEntry& entry, Allocator& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    add_string(obj, "section_type", entry.section_type, alloc);
    add_string(obj, "section_name", entry.section_name, alloc);
    obj.AddMember("error_severity", entry.error_severity, alloc);
    add_string(obj, "error_severity_name",
               gesb::severity_name(entry.error_severity, gesb::SeverityScope::Entry), alloc);
    add_string(obj, "revision", entry.revision, alloc);
    add_string(obj, "validation_bits", entry.validation_bits, alloc);
    add_string(obj, "flags", entry.flags, alloc);
    obj.AddMember("error_data_length", entry.error_data_length, alloc);
    add_string(obj, "fru_id", entry.fru_id, alloc);
    add_string(obj, "fru_text", display_text(entry.fru_text), alloc);
    add_string(obj, "timestamp", entry.timestamp, alloc);
    obj.AddMember("offset", static_cast<std::uint64_t>(entry.offset), alloc);

    if (const auto* fields = std::get_if<section::DecodedFields>(&entry.payload)) {
        rapidjson::Value payload(rapidjson::kObjectType);
        for (const auto& field : *fields) {
            payload.AddMember(make_string(field.name, alloc),
                              field_value_to_json(field.value, alloc), alloc);
        }
        obj.AddMember("payload", payload, alloc);
    } else {
        add_string(obj, "payload_hex", std::get<section::OpaquePayload>(entry.payload).hex,
                   alloc);
    }
    return obj;
}

rapidjson::Value gesb_to_json(const gesb::GenericErrorStatusBlock& block, Allocator& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    add_string(obj, "block_status", block.block_status, alloc);
    obj.AddMember("raw_data_offset", block.raw_data_offset, alloc);
    obj.AddMember("raw_data_length", block.raw_data_length, alloc);
    obj.AddMember("data_length", block.data_length, alloc);
    obj.AddMember("error_severity", block.error_severity, alloc);
    add_string(obj, "error_severity_name",
               gesb::severity_name(block.error_severity, gesb::SeverityScope::Block), alloc);

    rapidjson::Value entries(rapidjson::kArrayType);
    for (const auto& entry : block.entries) {
        entries.PushBack(entry_to_json(entry, alloc), alloc);
    }
    obj.AddMember("entries", entries, alloc);
    obj.AddMember("consumed", static_cast<std::uint64_t>(block.consumed), alloc);

    if (block.error) {
        obj.AddMember("error", error_to_json(*block.error, alloc), alloc);
    }
    return obj;
}

rapidjson::Value error_to_json(const io::DecodeError& error, Allocator& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("kind", rapidjson::StringRef(io::decode_error_kind_to_string(error.kind)),
                  alloc);
    add_string(obj, "message", error.message, alloc);
    obj.AddMember("offset", static_cast<std::uint64_t>(error.offset), alloc);
    return obj;
}

}  // namespace bertread::render
