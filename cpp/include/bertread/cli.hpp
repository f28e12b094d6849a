// ==============================================================================
// bertread/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// Использование:
//   bertread [OPTIONS] <DIRECTORY>
//
// ==============================================================================

#ifndef BERTREAD_CLI_HPP
#define BERTREAD_CLI_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace bertread::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;     // -v (repeatable)
    bool quiet = false;  // -q
};

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

/// Декодировать таблицы из каталога
struct DecodeCommand {
    std::filesystem::path directory;               // positional
    bool json = false;                             // -j, --json
    std::optional<std::filesystem::path> schemas;  // -s, --schemas
    std::optional<std::filesystem::path> output;   // -o, --output
    bool skip_errors = false;                      // --skip-errors
};

struct HelpCommand {};

struct VersionCommand {};

using Command = std::variant<DecodeCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help
std::string render_help();

/// Текст --version ("bertread <VERSION>\n")
std::string render_version();

/// Версия программы
constexpr const char* VERSION = "0.1.0";

/// Описание программы
constexpr const char* ABOUT = "Decode ACPI boot error tables (BERT, HEST, Boot Error Region)";

}  // namespace bertread::cli

#endif  // BERTREAD_CLI_HPP
