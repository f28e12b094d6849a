// ==============================================================================
// gesb.cpp - Реализация декодера Generic Error Status Block
// ==============================================================================
//
// Заголовок блока (20 байт):
//   0  Block Status        4  hex
//   4  Raw Data Offset     4  int
//   8  Raw Data Length     4  int
//  12  Data Length         4  int
//  16  Error Severity      4  int
//
// Заголовок записи (72 байта, смещения от начала записи):
//   0  Section Type        16 guid
//  16  Error Severity      4  int
//  20  Revision            2  hex
//  22  Validation Bits     1  hex
//  23  Flags               1  hex
//  24  Error Data Length   4  int
//  28  FRU Id              16 hex
//  44  FRU Text            20 ascii
//  64  Timestamp           8  hex
//  72  Payload (Error Data Length байт)
//
// ==============================================================================

#include <bertread/gesb.hpp>

#include <algorithm>

namespace bertread::gesb {

// ============================================================================
// Severity
// ============================================================================

std::string severity_name(std::int32_t value, SeverityScope scope) {
    switch (value) {
        case 0:
            return "Recoverable";
        case 1:
            return "Fatal";
        case 2:
            return "Corrected";
        case 3:
            return scope == SeverityScope::Block ? "None" : "Informational";
        default:
            return "unknown(" + std::to_string(value) + ")";
    }
}

// ============================================================================
// Entry
// ============================================================================

io::DecodeResult<GenericErrorDataEntry> decode_entry(const io::ByteCursor& entry_bytes,
                                                     const section::SectionTypeRegistry& registry) {
    io::FieldReader r(entry_bytes);

    GenericErrorDataEntry entry;
    entry.offset = entry_bytes.base_offset();
    entry.section_type = r.guid(0);
    entry.error_severity = r.int32(16);
    entry.revision = r.hex(20, 2);
    entry.validation_bits = r.hex(22, 1);
    entry.flags = r.hex(23, 1);
    entry.error_data_length = r.int32(24);
    entry.fru_id = r.hex(28, 16);
    entry.fru_text = r.ascii(44, 20);
    entry.timestamp = r.hex(64, 8);

    if (r.failed()) {
        return *r.error();
    }

    // Payload должен целиком помещаться в оставшуюся часть региона
    std::size_t available = entry_bytes.size() - ENTRY_HEADER_SIZE;
    if (entry.error_data_length < 0 ||
        static_cast<std::size_t>(entry.error_data_length) > available) {
        return io::DecodeError{io::DecodeErrorKind::TruncatedEntry,
                               "entry declares " + std::to_string(entry.error_data_length) +
                                   " bytes of error data, only " + std::to_string(available) +
                                   " bytes remain",
                               entry.offset + 24};
    }

    auto payload_bytes = entry_bytes.slice(ENTRY_HEADER_SIZE,
                                           static_cast<std::size_t>(entry.error_data_length));
    if (auto* err = std::get_if<io::DecodeError>(&payload_bytes)) {
        return *err;
    }

    const section::SectionTypeSchema* schema = registry.find(entry.section_type);
    entry.section_name = schema != nullptr ? schema->name : section::UNKNOWN_SECTION_NAME;

    auto payload = section::decode_payload(std::get<io::ByteCursor>(payload_bytes), schema);
    if (auto* err = std::get_if<io::DecodeError>(&payload)) {
        return *err;
    }
    entry.payload = std::move(std::get<section::Payload>(payload));

    return entry;
}

// ============================================================================
// Entry framing loop
// ============================================================================

EntryDecodeResult decode_entries(const io::ByteCursor& region,
                                 const section::SectionTypeRegistry& registry) {
    EntryDecodeResult result;

    std::size_t position = 0;
    while (region.size() - position >= ENTRY_HEADER_SIZE) {
        auto remaining = region.tail(position);
        if (auto* err = std::get_if<io::DecodeError>(&remaining)) {
            result.error = *err;
            break;
        }

        auto entry = decode_entry(std::get<io::ByteCursor>(remaining), registry);
        if (auto* err = std::get_if<io::DecodeError>(&entry)) {
            result.error = *err;
            break;
        }

        auto& decoded = std::get<GenericErrorDataEntry>(entry);
        position += decoded.encoded_size();
        result.entries.push_back(std::move(decoded));
    }

    result.consumed = position;
    return result;
}

// ============================================================================
// Generic Error Status Block
// ============================================================================

io::DecodeResult<GenericErrorStatusBlock> decode_gesb(const io::ByteCursor& buffer,
                                                      const section::SectionTypeRegistry& registry) {
    io::FieldReader r(buffer);

    GenericErrorStatusBlock block;
    block.block_status = r.hex(0, 4);
    block.raw_data_offset = r.int32(4);
    block.raw_data_length = r.int32(8);
    block.data_length = r.int32(12);
    block.error_severity = r.int32(16);

    if (r.failed()) {
        return *r.error();
    }

    // Отрицательная data_length трактуется как пустой регион
    std::size_t available = buffer.size() - BLOCK_HEADER_SIZE;
    std::size_t declared =
        block.data_length > 0 ? static_cast<std::size_t>(block.data_length) : std::size_t{0};

    auto region = buffer.slice(BLOCK_HEADER_SIZE, std::min(declared, available));
    if (auto* err = std::get_if<io::DecodeError>(&region)) {
        return *err;
    }

    auto entries = decode_entries(std::get<io::ByteCursor>(region), registry);
    block.entries = std::move(entries.entries);
    block.consumed = entries.consumed;
    block.error = std::move(entries.error);

    return block;
}

}  // namespace bertread::gesb
