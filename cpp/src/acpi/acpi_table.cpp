// ==============================================================================
// acpi_table.cpp - Реализация декодеров BERT / HEST
// ==============================================================================
//
// Раскладка (little-endian, смещения от начала таблицы):
//
//   0  Signature          4   ascii
//   4  Length             4   int
//   8  Revision           1   byte
//   9  Checksum           1   byte
//  10  OEM ID             6   ascii
//  16  OEM Table ID       8   ascii
//  24  OEM Revision       4   int
//  28  Creator ID         4   ascii
//  32  Creator Revision   4   int
//  --- BERT ---
//  36  Boot Error Region Length  4  int
//  40  Boot Error Region         8  hex
//  --- HEST ---
//  36  Error Source Count        4  int
//  40  Error Source Structure[]  ...
//
// Контрольная сумма не проверяется.
//
// ==============================================================================

#include <bertread/acpi_table.hpp>

namespace bertread::acpi {

namespace {

/// Проверить сигнатуру до чтения остальных полей
std::optional<io::DecodeError> check_signature(const io::ByteCursor& table,
                                               std::string_view expected) {
    auto sig = table.read_ascii(0, 4);
    if (auto* err = std::get_if<io::DecodeError>(&sig)) {
        return *err;
    }
    const auto& signature = std::get<std::string>(sig);
    if (signature != expected) {
        return io::DecodeError{io::DecodeErrorKind::HeaderMismatch,
                               "wrong header signature '" + signature + "', expected '" +
                                   std::string(expected) + "'",
                               table.base_offset()};
    }
    return std::nullopt;
}

}  // anonymous namespace

io::DecodeResult<AcpiTableHeader> decode_table_header(const io::ByteCursor& table,
                                                      std::string_view expected_signature) {
    if (auto err = check_signature(table, expected_signature)) {
        return *err;
    }

    io::FieldReader r(table);
    AcpiTableHeader header;
    header.signature = r.ascii(0, 4);
    header.length = r.int32(4);
    header.revision = r.byte(8);
    header.checksum = r.byte(9);
    header.oem_id = r.ascii(10, 6);
    header.oem_table_id = r.ascii(16, 8);
    header.oem_revision = r.int32(24);
    header.creator_id = r.ascii(28, 4);
    header.creator_revision = r.int32(32);

    if (r.failed()) {
        return *r.error();
    }
    return header;
}

io::DecodeResult<BertRecord> decode_bert(const io::ByteCursor& table,
                                         std::string_view expected_signature) {
    auto header = decode_table_header(table, expected_signature);
    if (auto* err = std::get_if<io::DecodeError>(&header)) {
        return *err;
    }

    io::FieldReader r(table);
    BertRecord record;
    record.header = std::move(std::get<AcpiTableHeader>(header));
    record.boot_error_region_length = r.int32(36);
    record.boot_error_region = r.hex(40, 8);
    record.header_hex = r.hex(0, BERT_TABLE_SIZE);

    if (r.failed()) {
        return *r.error();
    }
    return record;
}

io::DecodeResult<HestRecord> decode_hest(const io::ByteCursor& table,
                                         std::string_view expected_signature) {
    auto header = decode_table_header(table, expected_signature);
    if (auto* err = std::get_if<io::DecodeError>(&header)) {
        return *err;
    }

    io::FieldReader r(table);
    HestRecord record;
    record.header = std::move(std::get<AcpiTableHeader>(header));
    record.error_source_count = r.int32(36);
    record.header_hex = r.hex(0, HEST_HEADER_SIZE);

    if (r.failed()) {
        return *r.error();
    }

    // Хвост ограничен объявленной длиной, если она правдоподобна
    std::size_t end = table.size();
    if (record.header.length >= static_cast<std::int32_t>(HEST_HEADER_SIZE) &&
        static_cast<std::size_t>(record.header.length) < end) {
        end = static_cast<std::size_t>(record.header.length);
    }
    auto structures = table.read_bytes(HEST_HEADER_SIZE, end - HEST_HEADER_SIZE);
    if (auto* err = std::get_if<io::DecodeError>(&structures)) {
        return *err;
    }
    record.error_source_structures = std::move(std::get<std::vector<std::uint8_t>>(structures));

    return record;
}

}  // namespace bertread::acpi
