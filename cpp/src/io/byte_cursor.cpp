// ==============================================================================
// byte_cursor.cpp - Реализация Byte Cursor
// ==============================================================================
//
// Все многобайтовые поля ACPI/UEFI - little-endian.
// GUID wire format (EFI_GUID):
//   Data1 (4 байта, LE) | Data2 (2 байта, LE) | Data3 (2 байта, LE) | Data4 (8 байт)
//
// ==============================================================================

#include <bertread/byte_cursor.hpp>

namespace bertread::io {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

/// Читать little-endian uint32
inline std::uint32_t read_u32_le(const std::uint8_t* data) {
    return static_cast<std::uint32_t>(data[0]) | (static_cast<std::uint32_t>(data[1]) << 8) |
           (static_cast<std::uint32_t>(data[2]) << 16) |
           (static_cast<std::uint32_t>(data[3]) << 24);
}

/// Дописать байт как два hex-символа
inline void append_hex_byte(std::string& out, std::uint8_t b) {
    out.push_back(HEX_DIGITS[b >> 4]);
    out.push_back(HEX_DIGITS[b & 0x0F]);
}

}  // anonymous namespace

// ============================================================================
// DecodeError
// ============================================================================

const char* decode_error_kind_to_string(DecodeErrorKind kind) {
    switch (kind) {
        case DecodeErrorKind::OutOfBounds:
            return "OutOfBounds";
        case DecodeErrorKind::InvalidEncoding:
            return "InvalidEncoding";
        case DecodeErrorKind::HeaderMismatch:
            return "HeaderMismatch";
        case DecodeErrorKind::TruncatedEntry:
            return "TruncatedEntry";
    }
    return "Unknown";
}

std::string DecodeError::format() const {
    return std::string(decode_error_kind_to_string(kind)) + " at offset " +
           std::to_string(offset) + ": " + message;
}

// ============================================================================
// ByteCursor
// ============================================================================

bool ByteCursor::contains(std::size_t offset, std::size_t length) const {
    // Без переполнения offset + length
    return offset <= size_ && length <= size_ - offset;
}

std::optional<DecodeError> ByteCursor::check_bounds(std::size_t offset,
                                                    std::size_t length) const {
    if (contains(offset, length)) {
        return std::nullopt;
    }
    return DecodeError{DecodeErrorKind::OutOfBounds,
                       "cannot read " + std::to_string(length) + " bytes, buffer has " +
                           std::to_string(size_) + " bytes",
                       base_ + offset};
}

DecodeResult<ByteCursor> ByteCursor::slice(std::size_t offset, std::size_t length) const {
    if (auto err = check_bounds(offset, length)) {
        return *err;
    }
    ByteCursor sub(data_ + offset, length);
    sub.base_ = base_ + offset;
    return sub;
}

DecodeResult<ByteCursor> ByteCursor::tail(std::size_t offset) const {
    if (offset > size_) {
        return DecodeError{DecodeErrorKind::OutOfBounds,
                           "offset is past the end of a " + std::to_string(size_) +
                               " byte buffer",
                           base_ + offset};
    }
    return slice(offset, size_ - offset);
}

DecodeResult<std::string> ByteCursor::read_ascii(std::size_t offset, std::size_t length) const {
    if (auto err = check_bounds(offset, length)) {
        return *err;
    }
    const std::uint8_t* p = data_ + offset;
    if (!is_valid_utf8(p, length)) {
        return DecodeError{DecodeErrorKind::InvalidEncoding,
                           "string field of " + std::to_string(length) +
                               " bytes is not valid UTF-8",
                           base_ + offset};
    }
    return std::string(reinterpret_cast<const char*>(p), length);
}

DecodeResult<std::int32_t> ByteCursor::read_int32(std::size_t offset) const {
    if (auto err = check_bounds(offset, 4)) {
        return *err;
    }
    return static_cast<std::int32_t>(read_u32_le(data_ + offset));
}

DecodeResult<std::uint8_t> ByteCursor::read_byte(std::size_t offset) const {
    if (auto err = check_bounds(offset, 1)) {
        return *err;
    }
    return data_[offset];
}

DecodeResult<std::string> ByteCursor::read_hex(std::size_t offset, std::size_t length) const {
    if (auto err = check_bounds(offset, length)) {
        return *err;
    }
    return bytes_to_hex(data_ + offset, length);
}

DecodeResult<std::string> ByteCursor::read_guid(std::size_t offset) const {
    if (auto err = check_bounds(offset, GUID_SIZE)) {
        return *err;
    }
    const std::uint8_t* p = data_ + offset;

    // Data1/Data2/Data3 - little-endian, Data4 - как есть
    static constexpr std::size_t ORDER[GUID_SIZE] = {3, 2, 1, 0, 5, 4, 7, 6,
                                                     8, 9, 10, 11, 12, 13, 14, 15};
    std::string result;
    result.reserve(GUID_SIZE * 2);
    for (std::size_t index : ORDER) {
        append_hex_byte(result, p[index]);
    }
    return result;
}

DecodeResult<std::vector<std::uint8_t>> ByteCursor::read_bytes(std::size_t offset,
                                                               std::size_t length) const {
    if (auto err = check_bounds(offset, length)) {
        return *err;
    }
    return std::vector<std::uint8_t>(data_ + offset, data_ + offset + length);
}

// ============================================================================
// FieldReader
// ============================================================================

template <typename T>
T FieldReader::take(DecodeResult<T>&& result) {
    if (auto* err = std::get_if<DecodeError>(&result)) {
        if (!error_) {
            error_ = std::move(*err);
        }
        return T{};
    }
    return std::move(std::get<T>(result));
}

std::string FieldReader::ascii(std::size_t offset, std::size_t length) {
    if (error_) {
        return {};
    }
    return take(cursor_.read_ascii(offset, length));
}

std::int32_t FieldReader::int32(std::size_t offset) {
    if (error_) {
        return 0;
    }
    return take(cursor_.read_int32(offset));
}

std::uint8_t FieldReader::byte(std::size_t offset) {
    if (error_) {
        return 0;
    }
    return take(cursor_.read_byte(offset));
}

std::string FieldReader::hex(std::size_t offset, std::size_t length) {
    if (error_) {
        return {};
    }
    return take(cursor_.read_hex(offset, length));
}

std::string FieldReader::guid(std::size_t offset) {
    if (error_) {
        return {};
    }
    return take(cursor_.read_guid(offset));
}

// ============================================================================
// Helper functions
// ============================================================================

std::string bytes_to_hex(const std::uint8_t* data, std::size_t length) {
    std::string result;
    if (length == 0) {
        return result;
    }
    result.reserve(length * 3 - 1);
    for (std::size_t i = 0; i < length; ++i) {
        if (i > 0) {
            result.push_back(' ');
        }
        append_hex_byte(result, data[i]);
    }
    return result;
}

bool is_valid_utf8(const std::uint8_t* data, std::size_t length) {
    std::size_t i = 0;
    while (i < length) {
        std::uint8_t lead = data[i];
        std::size_t extra = 0;
        std::uint32_t cp = 0;

        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            cp = lead & 0x07;
        } else {
            return false;
        }

        if (extra > length - i - 1) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            std::uint8_t cont = data[i + k];
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }

        // Overlong, surrogates, > U+10FFFF
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) ||
            (extra == 3 && cp < 0x10000) || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

std::string format_guid(std::string_view canonical) {
    if (canonical.size() != GUID_SIZE * 2) {
        return std::string(canonical);
    }
    std::string result;
    result.reserve(36);
    result.append(canonical.substr(0, 8));
    result.push_back('-');
    result.append(canonical.substr(8, 4));
    result.push_back('-');
    result.append(canonical.substr(12, 4));
    result.push_back('-');
    result.append(canonical.substr(16, 4));
    result.push_back('-');
    result.append(canonical.substr(20, 12));
    return result;
}

}  // namespace bertread::io
