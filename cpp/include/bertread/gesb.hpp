// ==============================================================================
// bertread/gesb.hpp - Generic Error Status Block и Generic Error Data Entry
// ==============================================================================
//
// Назначение:
// - Декодирование 20-байтного заголовка Generic Error Status Block
// - Цикл разбора записей Generic Error Data Entry (72 байта заголовка +
//   payload длиной error_data_length, без терминатора)
// - Декодирование payload через SectionTypeRegistry или как hex-дамп
// - Отображение severity в имена
//
// Ссылки:
// - ACPI 6.3, 18.3.2.7.1 Generic Error Data
// - UEFI 2.8, Table 18-381 Generic Error Status Block
// - UEFI 2.8, Table 18-382 Generic Error Data Entry
//
// ==============================================================================

#ifndef BERTREAD_GESB_HPP
#define BERTREAD_GESB_HPP

#include <bertread/byte_cursor.hpp>
#include <bertread/section_registry.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bertread::gesb {

// ----------------------------------------------------------------------------
// Константы формата
// ----------------------------------------------------------------------------

constexpr std::size_t BLOCK_HEADER_SIZE = 20;
constexpr std::size_t ENTRY_HEADER_SIZE = 72;

// ----------------------------------------------------------------------------
// Severity
// ----------------------------------------------------------------------------

/// Контекст severity: в заголовке блока значение 3 называется "None",
/// в записи - "Informational"
enum class SeverityScope { Block, Entry };

/// Имя severity: 0 Recoverable, 1 Fatal, 2 Corrected, 3 None/Informational,
/// остальные значения - "unknown(N)"
std::string severity_name(std::int32_t value, SeverityScope scope = SeverityScope::Entry);

// ----------------------------------------------------------------------------
// GenericErrorDataEntry
// ----------------------------------------------------------------------------

/// Одна запись Generic Error Data Entry
struct GenericErrorDataEntry {
    /// GUID типа секции (канонический вид)
    std::string section_type;

    /// Имя типа секции из реестра или "Unknown"
    std::string section_name;

    std::int32_t error_severity = 0;
    std::string revision;         // 2 байта hex
    std::string validation_bits;  // 1 байт hex
    std::string flags;            // 1 байт hex

    /// Длина payload (без 72 байт заголовка)
    std::int32_t error_data_length = 0;

    std::string fru_id;  // 16 байт hex

    /// FRU text (20 байт, как есть, без обрезки по NUL)
    std::string fru_text;

    std::string timestamp;  // 8 байт hex

    /// Декодированные поля или непрозрачный hex-дамп
    section::Payload payload;

    /// Смещение записи от начала исходного буфера
    std::size_t offset = 0;

    /// Сколько байт занимает запись: заголовок + payload
    std::size_t encoded_size() const {
        return ENTRY_HEADER_SIZE + static_cast<std::size_t>(error_data_length);
    }

    /// Payload декодирован по схеме
    bool has_decoded_payload() const {
        return std::holds_alternative<section::DecodedFields>(payload);
    }
};

// ----------------------------------------------------------------------------
// Результат цикла разбора записей
// ----------------------------------------------------------------------------

/// Записи, разобранные до конца региона или до первой ошибки
struct EntryDecodeResult {
    /// Записи в порядке следования в буфере
    std::vector<GenericErrorDataEntry> entries;

    /// Сумма encoded_size() всех разобранных записей
    std::size_t consumed = 0;

    /// Ошибка, остановившая разбор (TruncatedEntry и т.п.)
    std::optional<io::DecodeError> error;
};

// ----------------------------------------------------------------------------
// GenericErrorStatusBlock
// ----------------------------------------------------------------------------

/// Generic Error Status Block с записями
struct GenericErrorStatusBlock {
    std::string block_status;  // 4 байта hex (битовое поле)
    std::int32_t raw_data_offset = 0;
    std::int32_t raw_data_length = 0;

    /// Длина региона записей после заголовка
    std::int32_t data_length = 0;

    std::int32_t error_severity = 0;

    std::vector<GenericErrorDataEntry> entries;

    /// Сколько байт региона занято записями
    std::size_t consumed = 0;

    /// Ошибка разбора записей; entries содержит всё, что было разобрано до неё
    std::optional<io::DecodeError> error;
};

// ----------------------------------------------------------------------------
// Декодеры
// ----------------------------------------------------------------------------

/// Декодировать одну запись, начинающуюся в начале entry_bytes
///
/// entry_bytes - оставшаяся часть региона записей. Если заголовок
/// объявляет payload длиннее оставшейся части - TruncatedEntry.
io::DecodeResult<GenericErrorDataEntry> decode_entry(
    const io::ByteCursor& entry_bytes,
    const section::SectionTypeRegistry& registry = section::SectionTypeRegistry::builtin());

/// Разобрать все записи региона
///
/// Разбор продолжается, пока в оставшейся части есть хотя бы один заголовок
/// записи (72 байта); более короткий остаток игнорируется.
EntryDecodeResult decode_entries(
    const io::ByteCursor& region,
    const section::SectionTypeRegistry& registry = section::SectionTypeRegistry::builtin());

/// Декодировать Generic Error Status Block и его записи
///
/// Регион записей: min(data_length, размер буфера - 20) байт после заголовка.
/// Ошибка возвращается только если не удалось прочитать заголовок блока;
/// ошибки записей сохраняются в GenericErrorStatusBlock::error.
io::DecodeResult<GenericErrorStatusBlock> decode_gesb(
    const io::ByteCursor& buffer,
    const section::SectionTypeRegistry& registry = section::SectionTypeRegistry::builtin());

}  // namespace bertread::gesb

#endif  // BERTREAD_GESB_HPP
