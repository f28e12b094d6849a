// ==============================================================================
// bertread/byte_cursor.hpp - Byte Cursor: чтение полей из байтового буфера
// ==============================================================================
//
// Назначение:
// - Чтение little-endian полей фиксированной ширины (int32, byte)
// - Чтение ASCII/UTF-8 строк известной длины
// - Hex-дамп диапазона байт ("aa bb cc")
// - Чтение GUID (16 байт wire format -> каноническая hex-строка)
// - Типизированные ошибки декодирования (DecodeError)
//
// Буфер не принадлежит курсору: ByteCursor - это view (указатель + размер),
// владелец буфера должен пережить все курсоры и декодированные view.
//
// ==============================================================================

#ifndef BERTREAD_BYTE_CURSOR_HPP
#define BERTREAD_BYTE_CURSOR_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace bertread::io {

// ----------------------------------------------------------------------------
// DecodeError - ошибки декодирования
// ----------------------------------------------------------------------------

/// Типы ошибок декодирования
enum class DecodeErrorKind {
    OutOfBounds,      // Чтение за границей буфера
    InvalidEncoding,  // Строковое поле не является валидным UTF-8
    HeaderMismatch,   // Сигнатура таблицы не совпадает с ожидаемой
    TruncatedEntry    // Длина payload записи выходит за границу региона
};

/// Преобразовать DecodeErrorKind в строку
const char* decode_error_kind_to_string(DecodeErrorKind kind);

/// Ошибка декодирования
struct DecodeError {
    DecodeErrorKind kind = DecodeErrorKind::OutOfBounds;
    std::string message;

    /// Смещение (от начала исходного буфера), на котором произошла ошибка
    std::size_t offset = 0;

    /// Форматировать ошибку: "<Kind> at offset <N>: <message>"
    std::string format() const;
};

/// Результат декодирования: значение или ошибка
template <typename T>
using DecodeResult = std::variant<T, DecodeError>;

// ----------------------------------------------------------------------------
// ByteCursor - view над байтовым буфером
// ----------------------------------------------------------------------------

/// Размер GUID в байтах
constexpr std::size_t GUID_SIZE = 16;

/// Неизменяемый view над буфером с проверкой границ для каждого чтения
class ByteCursor {
public:
    ByteCursor() = default;
    ByteCursor(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}
    explicit ByteCursor(const std::vector<std::uint8_t>& buffer)
        : data_(buffer.data()), size_(buffer.size()) {}

    /// Размер видимой области
    std::size_t size() const { return size_; }

    /// Указатель на начало видимой области
    const std::uint8_t* data() const { return data_; }

    /// Смещение этого view от начала исходного буфера (для сообщений об ошибках)
    std::size_t base_offset() const { return base_; }

    /// Проверить, что [offset, offset + length) лежит внутри буфера
    bool contains(std::size_t offset, std::size_t length) const;

    /// Под-view [offset, offset + length)
    DecodeResult<ByteCursor> slice(std::size_t offset, std::size_t length) const;

    /// Под-view [offset, size())
    DecodeResult<ByteCursor> tail(std::size_t offset) const;

    // -------------------------------------------------------------------------
    // Примитивы чтения
    // -------------------------------------------------------------------------

    /// Строка известной длины; InvalidEncoding если байты не UTF-8
    /// Байты копируются как есть (включая NUL), без обрезки
    DecodeResult<std::string> read_ascii(std::size_t offset, std::size_t length) const;

    /// Signed 32-bit little-endian
    DecodeResult<std::int32_t> read_int32(std::size_t offset) const;

    /// Unsigned 8-bit
    DecodeResult<std::uint8_t> read_byte(std::size_t offset) const;

    /// Hex-дамп в порядке байт на проводе: "aa bb cc"
    DecodeResult<std::string> read_hex(std::size_t offset, std::size_t length) const;

    /// GUID: первые три поля (4+2+2) переставляются как little-endian,
    /// последние 8 байт остаются как есть. Результат - 32 hex-символа
    DecodeResult<std::string> read_guid(std::size_t offset) const;

    /// Копия диапазона байт
    DecodeResult<std::vector<std::uint8_t>> read_bytes(std::size_t offset,
                                                       std::size_t length) const;

private:
    std::optional<DecodeError> check_bounds(std::size_t offset, std::size_t length) const;

    const std::uint8_t* data_ = nullptr;
    std::size_t size_ = 0;
    std::size_t base_ = 0;
};

// ----------------------------------------------------------------------------
// FieldReader - последовательное чтение полей с фиксацией первой ошибки
// ----------------------------------------------------------------------------
//
// Используется декодерами таблиц: после первой ошибки все последующие чтения
// возвращают пустые значения, а error() содержит первую ошибку.
//

class FieldReader {
public:
    explicit FieldReader(const ByteCursor& cursor) : cursor_(cursor) {}

    std::string ascii(std::size_t offset, std::size_t length);
    std::int32_t int32(std::size_t offset);
    std::uint8_t byte(std::size_t offset);
    std::string hex(std::size_t offset, std::size_t length);
    std::string guid(std::size_t offset);

    /// Была ли ошибка
    bool failed() const { return error_.has_value(); }

    /// Первая ошибка
    const std::optional<DecodeError>& error() const { return error_; }

private:
    template <typename T>
    T take(DecodeResult<T>&& result);

    ByteCursor cursor_;
    std::optional<DecodeError> error_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Hex-строка через пробел ("aa bb cc"), lowercase
std::string bytes_to_hex(const std::uint8_t* data, std::size_t length);

/// Проверка UTF-8 (ASCII - подмножество)
bool is_valid_utf8(const std::uint8_t* data, std::size_t length);

/// Отформатировать каноническую GUID-строку (32 hex) как 8-4-4-4-12
/// Строки другой длины возвращаются без изменений
std::string format_guid(std::string_view canonical);

}  // namespace bertread::io

#endif  // BERTREAD_BYTE_CURSOR_HPP
