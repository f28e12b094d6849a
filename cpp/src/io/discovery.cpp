// ==============================================================================
// discovery.cpp - Поиск и чтение файлов ACPI таблиц
// ==============================================================================

#include "bertread/discovery.hpp"

#include "bertread/platform.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace bertread::io {

namespace {

constexpr std::string_view BERT_NAME = "BERT";
constexpr std::string_view HEST_NAME = "HEST";
constexpr std::string_view DATA_DIR_NAME = "data";

/// Существует ли обычный файл (ошибки файловой системы = "нет")
bool regular_file_exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && !ec;
}

}  // namespace

// ----------------------------------------------------------------------------
// Поиск
// ----------------------------------------------------------------------------

bool is_bert_table_name(std::string_view filename) {
    if (filename.substr(0, BERT_NAME.size()) != BERT_NAME) {
        return false;
    }
    auto suffix = filename.substr(BERT_NAME.size());
    return std::all_of(suffix.begin(), suffix.end(),
                       [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

TableSet discover_tables(const std::filesystem::path& dir) {
    std::error_code ec;
    bool is_dir = std::filesystem::is_directory(dir, ec);
    if (ec || !is_dir) {
        throw std::runtime_error("Not a valid directory - " + platform::path_to_utf8(dir));
    }

    TableSet tables;

    std::filesystem::directory_iterator dir_iter(dir, ec);
    if (ec) {
        throw std::runtime_error("failed to read directory - " + ec.message());
    }

    // При ошибке increment итератор становится end, ec проверяется после цикла
    for (auto it = dir_iter; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        const auto& path = it->path();
        if (!regular_file_exists(path)) {
            continue;
        }
        std::string name = platform::path_to_utf8(path.filename());
        if (is_bert_table_name(name)) {
            tables.bert_files.push_back(path);
        } else if (name == HEST_NAME) {
            tables.hest_file = path;
        }
    }

    if (ec) {
        throw std::runtime_error("failed to read directory - " + ec.message());
    }

    // Детерминированный порядок по номеру: BERT, BERT1, BERT2, ..., BERT10
    std::sort(tables.bert_files.begin(), tables.bert_files.end(),
              [](const std::filesystem::path& a, const std::filesystem::path& b) {
                  std::string name_a = platform::path_to_utf8(a.filename());
                  std::string name_b = platform::path_to_utf8(b.filename());
                  if (name_a.size() != name_b.size()) {
                      return name_a.size() < name_b.size();
                  }
                  return name_a < name_b;
              });

    auto data_path = dir / std::string(DATA_DIR_NAME) / std::string(BERT_NAME);
    if (regular_file_exists(data_path)) {
        tables.bert_data_file = data_path;
    }

    return tables;
}

// ----------------------------------------------------------------------------
// Чтение
// ----------------------------------------------------------------------------

std::string TableFileError::format() const {
    return message;
}

std::variant<std::vector<std::uint8_t>, TableFileError> read_table_file(
    const std::filesystem::path& path) {
    std::string path_str = platform::path_to_utf8(path);

    if (!regular_file_exists(path)) {
        return TableFileError{TableFileErrorKind::FileNotFound, "file not found - " + path_str};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return TableFileError{TableFileErrorKind::IoError, "failed to open file - " + path_str};
    }

    // Файлы sysfs сообщают размер 0, поэтому читаем до EOF
    std::vector<std::uint8_t> data;
    char chunk[4096];
    while (file.read(chunk, sizeof(chunk)) || file.gcount() > 0) {
        data.insert(data.end(), chunk, chunk + file.gcount());
    }
    if (file.bad()) {
        return TableFileError{TableFileErrorKind::IoError, "failed to read file - " + path_str};
    }

    return data;
}

}  // namespace bertread::io
