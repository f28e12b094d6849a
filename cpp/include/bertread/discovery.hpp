// ==============================================================================
// bertread/discovery.hpp - Поиск и чтение файлов ACPI таблиц
// ==============================================================================
//
// Ожидаемая раскладка каталога (например, /sys/firmware/acpi/tables):
//   <dir>/BERT, <dir>/BERT1, <dir>/BERT2, ...  - таблицы BERT
//   <dir>/HEST                                 - таблица HEST
//   <dir>/data/BERT                            - Boot Error Region (GESB)
//
// Назначение:
// - Поиск файлов таблиц в каталоге
// - Детерминированный порядок результатов (сортировка по имени)
// - Чтение файла целиком в память
//
// ==============================================================================

#ifndef BERTREAD_DISCOVERY_HPP
#define BERTREAD_DISCOVERY_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace bertread::io {

// ----------------------------------------------------------------------------
// TableSet - найденные файлы таблиц
// ----------------------------------------------------------------------------

struct TableSet {
    /// BERT, BERT1, BERT2, ... (отсортированы по имени)
    std::vector<std::filesystem::path> bert_files;

    /// <dir>/HEST, если существует
    std::optional<std::filesystem::path> hest_file;

    /// <dir>/data/BERT, если существует
    std::optional<std::filesystem::path> bert_data_file;
};

/// Является ли имя файла именем таблицы BERT ("BERT" или "BERT<цифры>")
bool is_bert_table_name(std::string_view filename);

/// Найти файлы таблиц в каталоге
///
/// Поиск не рекурсивный, кроме <dir>/data/BERT.
/// Пустой результат - не ошибка.
///
/// @throws std::runtime_error если dir не существует или не является каталогом
TableSet discover_tables(const std::filesystem::path& dir);

// ----------------------------------------------------------------------------
// Чтение файла таблицы
// ----------------------------------------------------------------------------

enum class TableFileErrorKind {
    FileNotFound,  // Файл не найден
    IoError        // Ошибка чтения
};

struct TableFileError {
    TableFileErrorKind kind = TableFileErrorKind::IoError;
    std::string message;

    std::string format() const;
};

/// Прочитать файл целиком
std::variant<std::vector<std::uint8_t>, TableFileError> read_table_file(
    const std::filesystem::path& path);

}  // namespace bertread::io

#endif  // BERTREAD_DISCOVERY_HPP
