// ==============================================================================
// text.cpp - Текстовое представление таблиц
// ==============================================================================
//
// Формат:
//   ===========
//   BERT Table:
//   ===========
//   Filename: <path>
//   Header signature: BERT
//   ...
//   HEX data:
//   0.:	42 45 52 54 ...
//   16.:	...
//
// ==============================================================================

#include <bertread/render.hpp>

#include <cctype>
#include <sstream>

namespace bertread::render {

namespace {

// "xx " на байт, 16 байт на строку
constexpr std::size_t HEX_BYTES_PER_ROW = 16;
constexpr std::size_t HEX_CHARS_PER_ROW = HEX_BYTES_PER_ROW * 3;

constexpr const char* TABLE_RULE = "===========";
constexpr const char* BLOCK_RULE = "-----------";
constexpr const char* ENTRY_RULE = "-------------------";

void write_field(std::ostringstream& out, std::string_view key, std::string_view value) {
    out << field_label(key) << ": " << value << '\n';
}

void write_field(std::ostringstream& out, std::string_view key, std::int64_t value) {
    out << field_label(key) << ": " << value << '\n';
}

void write_header_fields(std::ostringstream& out, const acpi::AcpiTableHeader& header) {
    write_field(out, "header_signature", header.signature);
    write_field(out, "length", header.length);
    write_field(out, "revision", header.revision);
    write_field(out, "checksum", header.checksum);
    write_field(out, "oem_id", display_text(header.oem_id));
    write_field(out, "oem_table_id", display_text(header.oem_table_id));
    write_field(out, "oem_revision", header.oem_revision);
    write_field(out, "creator_id", display_text(header.creator_id));
    write_field(out, "creator_revision", header.creator_revision);
}

void write_severity(std::ostringstream& out, std::int32_t value, gesb::SeverityScope scope) {
    out << field_label("error_severity") << ": " << value << " ("
        << gesb::severity_name(value, scope) << ")\n";
}

}  // anonymous namespace

std::string field_label(std::string_view key) {
    std::string label(key);
    for (auto& c : label) {
        if (c == '_') {
            c = ' ';
        }
    }
    if (!label.empty()) {
        label[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(label[0])));
    }
    return label;
}

std::string format_hex_dump(std::string_view hex) {
    std::ostringstream out;
    out << "HEX data:\n";
    for (std::size_t pos = 0, row = 0; pos < hex.size(); pos += HEX_CHARS_PER_ROW, ++row) {
        auto line = hex.substr(pos, HEX_CHARS_PER_ROW);
        while (!line.empty() && line.back() == ' ') {
            line.remove_suffix(1);
        }
        out << row * HEX_BYTES_PER_ROW << ".:\t" << line << '\n';
    }
    return out.str();
}

std::string display_text(std::string_view text) {
    while (!text.empty() && (text.back() == '\0' || text.back() == ' ')) {
        text.remove_suffix(1);
    }
    std::string result(text);
    // Внутренние NUL не печатаются
    for (auto& c : result) {
        if (c == '\0') {
            c = ' ';
        }
    }
    return result;
}

std::string render_bert(const acpi::BertRecord& record, std::string_view filename) {
    std::ostringstream out;
    out << TABLE_RULE << '\n' << record.header.signature << " Table:\n" << TABLE_RULE << '\n';
    out << "Filename: " << filename << '\n';
    write_header_fields(out, record.header);
    write_field(out, "boot_error_region_length", record.boot_error_region_length);
    write_field(out, "boot_error_region", record.boot_error_region);
    out << format_hex_dump(record.header_hex);
    out << '\n';
    return out.str();
}

std::string render_hest(const acpi::HestRecord& record, std::string_view filename) {
    std::ostringstream out;
    out << TABLE_RULE << '\n' << record.header.signature << " Table:\n" << TABLE_RULE << '\n';
    out << "Filename: " << filename << '\n';
    write_header_fields(out, record.header);
    write_field(out, "error_source_count", record.error_source_count);
    out << format_hex_dump(record.header_hex);
    if (!record.error_source_structures.empty()) {
        out << "Error source structures (" << record.error_source_structures.size()
            << " bytes, not decoded):\n";
        out << format_hex_dump(io::bytes_to_hex(record.error_source_structures.data(),
                                                record.error_source_structures.size()));
    }
    out << '\n';
    return out.str();
}

std::string render_entry(const gesb::GenericErrorDataEntry& entry, std::size_t number) {
    std::ostringstream out;
    out << number << ". error data entry\n" << ENTRY_RULE << '\n';
    out << field_label("section_type") << ": " << entry.section_type << " ("
        << entry.section_name << ")\n";
    write_severity(out, entry.error_severity, gesb::SeverityScope::Entry);
    write_field(out, "revision", entry.revision);
    write_field(out, "validation_bits", entry.validation_bits);
    write_field(out, "flags", entry.flags);
    write_field(out, "error_data_length", entry.error_data_length);
    write_field(out, "fru_id", entry.fru_id);
    write_field(out, "fru_text", display_text(entry.fru_text));
    write_field(out, "timestamp", entry.timestamp);

    if (const auto* fields = std::get_if<section::DecodedFields>(&entry.payload)) {
        for (const auto& field : *fields) {
            write_field(out, field.name, section::field_value_to_string(field.value));
        }
    } else {
        out << format_hex_dump(std::get<section::OpaquePayload>(entry.payload).hex);
    }
    return out.str();
}

std::string render_gesb(const gesb::GenericErrorStatusBlock& block, std::string_view filename) {
    std::ostringstream out;
    out << BLOCK_RULE << '\n' << "Generic Error Status Block:\n" << BLOCK_RULE << '\n';
    out << "Filename: " << filename << '\n';
    write_field(out, "block_status", block.block_status);
    write_field(out, "raw_data_offset", block.raw_data_offset);
    write_field(out, "raw_data_length", block.raw_data_length);
    write_field(out, "data_length", block.data_length);
    write_severity(out, block.error_severity, gesb::SeverityScope::Block);

    for (std::size_t i = 0; i < block.entries.size(); ++i) {
        out << '\n' << render_entry(block.entries[i], i + 1);
    }

    if (block.error) {
        out << "\nDecoding stopped: " << block.error->format() << '\n';
    }
    out << '\n';
    return out.str();
}

}  // namespace bertread::render
