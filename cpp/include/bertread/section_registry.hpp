// ==============================================================================
// bertread/section_registry.hpp - Section Type Registry
// ==============================================================================
//
// Назначение:
// - Таблица GUID типа секции -> {имя, список дескрипторов полей}
// - Декодирование payload записи по дескрипторам (закрытый набор FieldKind)
// - Загрузка дополнительных схем из YAML (yaml-cpp)
//
// GUID везде хранится в канонической форме: 32 hex-символа, lowercase, без
// разделителей, после перестановки байт из wire format (см. ByteCursor::read_guid).
//
// Новый тип секции = новая строка реестра (или YAML), без изменений в
// цикле декодирования записей.
//
// Ссылки:
// - UEFI 2.6, N.2.2 Section Descriptor (Section Type GUIDs)
// - UEFI 2.6, N.2.10 Firmware Error Record Reference
//
// ==============================================================================

#ifndef BERTREAD_SECTION_REGISTRY_HPP
#define BERTREAD_SECTION_REGISTRY_HPP

#include <bertread/byte_cursor.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace bertread::section {

// ----------------------------------------------------------------------------
// FieldKind - способ декодирования поля
// ----------------------------------------------------------------------------

/// Закрытый набор способов декодирования поля payload
enum class FieldKind {
    Byte,    // read_byte, длина 1
    Hex,     // read_hex, любая длина
    String,  // read_ascii, любая длина
    Int,     // read_int32, длина 4
    Guid     // read_guid, длина 16
};

/// Преобразовать FieldKind в строку ("byte", "hex", ...)
const char* field_kind_to_string(FieldKind kind);

/// Разобрать FieldKind из строки
std::optional<FieldKind> field_kind_from_string(std::string_view text);

/// Фиксированная длина для kind (nullopt для Hex/String)
std::optional<std::size_t> field_kind_fixed_length(FieldKind kind);

// ----------------------------------------------------------------------------
// Схема типа секции
// ----------------------------------------------------------------------------

/// Дескриптор поля payload
struct FieldDescriptor {
    std::string name;
    std::size_t offset = 0;
    std::size_t length = 0;
    FieldKind kind = FieldKind::Hex;
};

/// Схема типа секции
struct SectionTypeSchema {
    std::string name;

    /// Поля в порядке декодирования; пусто = payload непрозрачный
    std::vector<FieldDescriptor> fields;
};

/// Имя для GUID, отсутствующего в реестре
constexpr const char* UNKNOWN_SECTION_NAME = "Unknown";

// ----------------------------------------------------------------------------
// Известные GUID типов секций (канонический вид)
// ----------------------------------------------------------------------------

namespace guids {
constexpr const char* PROCESSOR_GENERIC = "9876ccad47b44bdbb65e16f193c4f3db";
constexpr const char* PROCESSOR_IA32_X64 = "dc3ea0b0a1444797b95b53fa242b6e1d";
constexpr const char* PROCESSOR_IPF = "e429faf13cb711d4bca70080c73c8881";
constexpr const char* PROCESSOR_ARM = "e19e3d16bc1111e49caac2051d5d46b0";
constexpr const char* PLATFORM_MEMORY = "a5bc11146f644edeb8633e83ed7c83b1";
constexpr const char* PCIE = "d995e954bbc1430fad91b44dcb3c6f35";
constexpr const char* FIRMWARE_ERROR_RECORD_REFERENCE = "81212a9609ed499694718d729c8e69ed";
constexpr const char* PCI_BUS = "c57539633b844095bf78eddad3f9c9dd";
constexpr const char* DMAR_GENERIC = "eb5e4685ca664769b6a226068b001326";
constexpr const char* DMAR_VTD = "71761d3732b245cda7d0b0fedd93e8cf";
constexpr const char* DMAR_IOMMU = "036f84e17f37428ca79e575fdfaa84ec";
}  // namespace guids

// ----------------------------------------------------------------------------
// SectionTypeRegistry
// ----------------------------------------------------------------------------

/// Реестр схем: канонический GUID -> SectionTypeSchema
///
/// builtin() строится один раз и не изменяется, поэтому безопасен для
/// одновременного чтения из нескольких потоков. Для расширения схемами из
/// YAML нужно сделать копию.
class SectionTypeRegistry {
public:
    using Map = std::map<std::string, SectionTypeSchema, std::less<>>;

    SectionTypeRegistry() = default;

    /// Встроенный реестр (типы секций UEFI N.2.2)
    static const SectionTypeRegistry& builtin();

    /// Добавить или заменить схему
    /// @param guid GUID в канонической или 8-4-4-4-12 форме
    /// @return false если guid не является валидным GUID
    bool add(std::string_view guid, SectionTypeSchema schema);

    /// Найти схему по каноническому GUID
    const SectionTypeSchema* find(std::string_view guid) const;

    /// Имя типа секции или "Unknown"
    std::string name_of(std::string_view guid) const;

    std::size_t size() const { return schemas_.size(); }

private:
    Map schemas_;
};

/// Привести GUID ("81212A96-09ED-..." или 32 hex) к каноническому виду
/// @return nullopt если строка не является GUID
std::optional<std::string> normalize_guid(std::string_view text);

// ----------------------------------------------------------------------------
// Загрузка схем из YAML
// ----------------------------------------------------------------------------
//
// Формат:
//   section_types:
//     - guid: a5bc1114-6f64-4ede-b863-3e83ed7c83b1
//       name: Platform Memory
//       fields:
//         - {name: validation_bits, offset: 0, length: 8, kind: hex}
//

/// Результат загрузки схем
struct SchemaLoadResult {
    bool ok = false;
    std::size_t loaded = 0;  // Число добавленных/заменённых схем
    std::string error;
};

/// Загрузить схемы из YAML файла в registry
SchemaLoadResult load_schema_file(const std::filesystem::path& path,
                                  SectionTypeRegistry& registry);

/// Загрузить схемы из YAML текста в registry
/// При ошибке registry не изменяется
SchemaLoadResult load_schema_yaml(const std::string& yaml_text, SectionTypeRegistry& registry);

// ----------------------------------------------------------------------------
// Декодирование payload
// ----------------------------------------------------------------------------

/// Значение поля: byte -> uint8, int -> int32, hex/string/guid -> string
using FieldValue = std::variant<std::uint8_t, std::int32_t, std::string>;

/// Декодированное поле payload
struct DecodedField {
    std::string name;
    FieldKind kind = FieldKind::Hex;
    FieldValue value;
};

/// Payload, декодированный по схеме (порядок = порядок дескрипторов)
using DecodedFields = std::vector<DecodedField>;

/// Payload без схемы: hex-дамп
struct OpaquePayload {
    std::string hex;
};

using Payload = std::variant<DecodedFields, OpaquePayload>;

/// Декодировать одно поле по дескриптору
io::DecodeResult<FieldValue> decode_field(const io::ByteCursor& payload,
                                          const FieldDescriptor& field);

/// Декодировать payload: по схеме если она есть и не пуста, иначе hex-дамп
io::DecodeResult<Payload> decode_payload(const io::ByteCursor& payload,
                                         const SectionTypeSchema* schema);

/// Строковое представление значения поля
std::string field_value_to_string(const FieldValue& value);

}  // namespace bertread::section

#endif  // BERTREAD_SECTION_REGISTRY_HPP
