// ==============================================================================
// bertread/acpi_table.hpp - Декодеры таблиц BERT и HEST
// ==============================================================================
//
// Назначение:
// - Общий заголовок ACPI таблицы (36 байт, фиксированные смещения)
// - BERT (Boot Error Record Table): длина и адрес Boot Error Region
// - HEST (Hardware Error Source Table): число источников ошибок + хвост
//
// Ссылки:
// - ACPI 6.3, 5.2.6 System Description Table Header
// - ACPI 6.3, 18.3.1 Boot Error Source (BERT)
// - ACPI 6.3, 18.3.2 Hardware Error Source Table (HEST)
//
// ==============================================================================

#ifndef BERTREAD_ACPI_TABLE_HPP
#define BERTREAD_ACPI_TABLE_HPP

#include <bertread/byte_cursor.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace bertread::acpi {

// ----------------------------------------------------------------------------
// Константы формата
// ----------------------------------------------------------------------------

constexpr std::size_t ACPI_HEADER_SIZE = 36;
constexpr std::size_t BERT_TABLE_SIZE = 48;
constexpr std::size_t HEST_HEADER_SIZE = 40;

constexpr std::string_view BERT_SIGNATURE = "BERT";
constexpr std::string_view HEST_SIGNATURE = "HEST";

// ----------------------------------------------------------------------------
// AcpiTableHeader
// ----------------------------------------------------------------------------

/// Общий заголовок System Description Table
struct AcpiTableHeader {
    /// 4-символьная сигнатура ("BERT", "HEST", ...)
    std::string signature;

    /// Объявленная длина таблицы (включая заголовок)
    std::int32_t length = 0;

    std::uint8_t revision = 0;
    std::uint8_t checksum = 0;

    /// OEM ID (6 байт)
    std::string oem_id;

    /// OEM Table ID (8 байт)
    std::string oem_table_id;

    std::int32_t oem_revision = 0;

    /// Creator ID (4 байта)
    std::string creator_id;

    std::int32_t creator_revision = 0;
};

// ----------------------------------------------------------------------------
// BertRecord
// ----------------------------------------------------------------------------

/// Декодированная таблица BERT
struct BertRecord {
    AcpiTableHeader header;

    /// Длина Boot Error Region (GESB + записи)
    std::int32_t boot_error_region_length = 0;

    /// Физический адрес Boot Error Region как hex (не разыменовывается)
    std::string boot_error_region;

    /// Hex-дамп первых 48 байт таблицы
    std::string header_hex;
};

// ----------------------------------------------------------------------------
// HestRecord
// ----------------------------------------------------------------------------

/// Декодированный заголовок HEST
///
/// Hardware Error Source Structures не декодируются: они сохраняются как
/// непрозрачный хвост таблицы (байты после смещения 40).
struct HestRecord {
    AcpiTableHeader header;

    /// Число Hardware Error Source Structures
    std::int32_t error_source_count = 0;

    /// Сырые Hardware Error Source Structures
    std::vector<std::uint8_t> error_source_structures;

    /// Hex-дамп первых 40 байт таблицы
    std::string header_hex;
};

// ----------------------------------------------------------------------------
// Декодеры
// ----------------------------------------------------------------------------

/// Декодировать общий заголовок и проверить сигнатуру
/// @return HeaderMismatch если сигнатура не равна expected_signature
io::DecodeResult<AcpiTableHeader> decode_table_header(const io::ByteCursor& table,
                                                      std::string_view expected_signature);

/// Декодировать таблицу BERT (48 байт)
io::DecodeResult<BertRecord> decode_bert(const io::ByteCursor& table,
                                         std::string_view expected_signature = BERT_SIGNATURE);

/// Декодировать заголовок HEST (40 байт) и сохранить хвост таблицы
io::DecodeResult<HestRecord> decode_hest(const io::ByteCursor& table,
                                         std::string_view expected_signature = HEST_SIGNATURE);

}  // namespace bertread::acpi

#endif  // BERTREAD_ACPI_TABLE_HPP
