// ==============================================================================
// schema_loader.cpp - Загрузка схем типов секций из YAML
// ==============================================================================
//
// YAML разбирается через yaml-cpp. Исключения yaml-cpp не выходят за
// пределы load_schema_*: они превращаются в SchemaLoadResult::error.
//
// ==============================================================================

#include <bertread/platform.hpp>
#include <bertread/section_registry.hpp>

#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace bertread::section {

namespace {

/// Разобрать один дескриптор поля
/// @return сообщение об ошибке или пустую строку
std::string parse_field(const YAML::Node& node, const std::string& section,
                        FieldDescriptor& out) {
    if (!node.IsMap()) {
        return "field of section '" + section + "' is not a mapping";
    }
    if (!node["name"] || !node["offset"] || !node["length"] || !node["kind"]) {
        return "field of section '" + section +
               "' requires 'name', 'offset', 'length' and 'kind'";
    }

    out.name = node["name"].as<std::string>();

    auto offset = node["offset"].as<long long>();
    auto length = node["length"].as<long long>();
    if (offset < 0 || length <= 0) {
        return "field '" + out.name + "' of section '" + section +
               "' has a negative offset or a non-positive length";
    }
    out.offset = static_cast<std::size_t>(offset);
    out.length = static_cast<std::size_t>(length);

    auto kind_text = node["kind"].as<std::string>();
    auto kind = field_kind_from_string(kind_text);
    if (!kind) {
        return "field '" + out.name + "' of section '" + section + "' has unknown kind '" +
               kind_text + "'";
    }
    out.kind = *kind;

    auto fixed = field_kind_fixed_length(out.kind);
    if (fixed && *fixed != out.length) {
        return "field '" + out.name + "' of section '" + section + "' of kind '" +
               field_kind_to_string(out.kind) + "' must have length " + std::to_string(*fixed);
    }
    return {};
}

SchemaLoadResult load_from_node(const YAML::Node& root, SectionTypeRegistry& registry) {
    SchemaLoadResult result;

    if (!root["section_types"] || !root["section_types"].IsSequence()) {
        result.error = "schema file missing 'section_types' sequence";
        return result;
    }

    // Изменения применяются к копии, registry меняется только при успехе
    SectionTypeRegistry staged = registry;
    for (const auto& entry : root["section_types"]) {
        if (!entry["guid"] || !entry["name"]) {
            result.error = "section type requires 'guid' and 'name'";
            return result;
        }

        auto guid_text = entry["guid"].as<std::string>();
        auto guid = normalize_guid(guid_text);
        if (!guid) {
            result.error = "invalid section type GUID '" + guid_text + "'";
            return result;
        }

        SectionTypeSchema schema;
        schema.name = entry["name"].as<std::string>();

        if (entry["fields"]) {
            if (!entry["fields"].IsSequence()) {
                result.error = "'fields' of section '" + schema.name + "' is not a sequence";
                return result;
            }
            for (const auto& field_node : entry["fields"]) {
                FieldDescriptor field;
                auto error = parse_field(field_node, schema.name, field);
                if (!error.empty()) {
                    result.error = std::move(error);
                    return result;
                }
                schema.fields.push_back(std::move(field));
            }
        }

        staged.add(*guid, std::move(schema));
        ++result.loaded;
    }

    registry = std::move(staged);
    result.ok = true;
    return result;
}

}  // anonymous namespace

SchemaLoadResult load_schema_yaml(const std::string& yaml_text, SectionTypeRegistry& registry) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        return load_from_node(root, registry);
    } catch (const YAML::Exception& e) {
        SchemaLoadResult result;
        result.error = std::string("YAML parse error: ") + e.what();
        return result;
    }
}

SchemaLoadResult load_schema_file(const std::filesystem::path& path,
                                  SectionTypeRegistry& registry) {
    std::ifstream file(path);
    if (!file.is_open()) {
        SchemaLoadResult result;
        result.error = "cannot open schema file: " + platform::path_to_utf8(path);
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = load_schema_yaml(buffer.str(), registry);
    if (!result.ok) {
        result.error = platform::path_to_utf8(path) + ": " + result.error;
    }
    return result;
}

}  // namespace bertread::section
