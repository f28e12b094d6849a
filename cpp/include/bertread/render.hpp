// ==============================================================================
// bertread/render.hpp - Представление декодированных таблиц
// ==============================================================================
//
// Назначение:
// - Текстовое представление BERT / HEST / GESB
// - Hex-дамп по 16 байт на строку с десятичным смещением
// - JSON представление (RapidJSON)
//
// ==============================================================================

#ifndef BERTREAD_RENDER_HPP
#define BERTREAD_RENDER_HPP

#include <bertread/acpi_table.hpp>
#include <bertread/byte_cursor.hpp>
#include <bertread/gesb.hpp>
#include <rapidjson/document.h>
#include <string>
#include <string_view>

namespace bertread::render {

// ----------------------------------------------------------------------------
// Текст
// ----------------------------------------------------------------------------

/// "boot_error_region" -> "Boot error region"
std::string field_label(std::string_view key);

/// Hex-дамп: "HEX data:\n" + строки "<offset>.:\t<16 байт>"
/// @param hex строка вида "aa bb cc ..." (ByteCursor::read_hex)
std::string format_hex_dump(std::string_view hex);

/// Строка FRU text для показа: завершающие NUL и пробелы удаляются
std::string display_text(std::string_view text);

std::string render_bert(const acpi::BertRecord& record, std::string_view filename);

std::string render_hest(const acpi::HestRecord& record, std::string_view filename);

std::string render_gesb(const gesb::GenericErrorStatusBlock& block, std::string_view filename);

/// Одна запись: "<n>. error data entry" + поля + payload
std::string render_entry(const gesb::GenericErrorDataEntry& entry, std::size_t number);

// ----------------------------------------------------------------------------
// JSON
// ----------------------------------------------------------------------------

using Allocator = rapidjson::Document::AllocatorType;

rapidjson::Value bert_to_json(const acpi::BertRecord& record, Allocator& alloc);

rapidjson::Value hest_to_json(const acpi::HestRecord& record, Allocator& alloc);

rapidjson::Value gesb_to_json(const gesb::GenericErrorStatusBlock& block, Allocator& alloc);

rapidjson::Value entry_to_json(const gesb::GenericErrorDataEntry& entry, Allocator& alloc);

/// {"kind": "...", "message": "...", "offset": N}
rapidjson::Value error_to_json(const io::DecodeError& error, Allocator& alloc);

}  // namespace bertread::render

#endif  // BERTREAD_RENDER_HPP
