// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный парсер argv: help/errors в формате clap, ошибки использования
// возвращаются через CliDiagnostic (exit code 2), без исключений.
//
// ==============================================================================

#include "bertread/cli.hpp"

#include "bertread/platform.hpp"

#include <cstring>

namespace bertread::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

/// Сообщение об ошибке парсинга: error + Usage + hint
std::string render_usage_error(const std::string& error_msg) {
    return "error: " + error_msg +
           "\n\n"
           "Usage: bertread [OPTIONS] <DIRECTORY>\n\n"
           "For more information, try '--help'.\n";
}

ParseResult usage_error(ParseResult result, const std::string& error_msg) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = render_usage_error(error_msg);
    return result;
}

std::string missing_value(const char* option, const char* value_name) {
    return std::string("a value is required for '") + option + " <" + value_name +
           ">' but none was supplied";
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("bertread ") + VERSION + "\n";
}

std::string render_help() {
    return std::string(ABOUT) +
           "\n"
           "\n"
           "Usage: bertread [OPTIONS] <DIRECTORY>\n"
           "\n"
           "Arguments:\n"
           "  <DIRECTORY>  Directory with ACPI tables (e.g. /sys/firmware/acpi/tables)\n"
           "\n"
           "Options:\n"
           "  -j, --json              Output as JSON\n"
           "  -s, --schemas <FILE>    Load extra section type schemas (YAML)\n"
           "  -o, --output <OUTPUT>   Save output to a file\n"
           "      --skip-errors       Skip errors and continue processing\n"
           "  -q                      Suppress informational output\n"
           "  -v...                   Print verbose output\n"
           "  -h, --help              Print help\n"
           "  -V, --version           Print version\n"
           "\n"
           "Examples:\n"
           "\n"
           "    Decode the tables of the running system:\n"
           "        sudo ./bertread /sys/firmware/acpi/tables\n"
           "\n"
           "    Decode a copied table directory with custom section schemas as JSON:\n"
           "        ./bertread tables/ -s schemas.yml --json -o bert.json\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help();
        return result;
    }

    DecodeCommand decode;
    bool have_directory = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (str_eq(arg, "-v")) {
            result.global.verbose++;
        } else if (starts_with(arg, "-vv") &&
                   std::strspn(arg + 1, "v") == std::strlen(arg + 1)) {
            // -vv, -vvv
            result.global.verbose += static_cast<int>(std::strlen(arg + 1));
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            decode.json = true;
        } else if (str_eq(arg, "--skip-errors")) {
            decode.skip_errors = true;
        } else if (str_eq(arg, "-s") || str_eq(arg, "--schemas")) {
            if (i + 1 >= argc) {
                return usage_error(result, missing_value("--schemas", "FILE"));
            }
            ++i;
            decode.schemas = platform::path_from_utf8(argv[i]);
        } else if (starts_with(arg, "--schemas=")) {
            decode.schemas = platform::path_from_utf8(arg + std::strlen("--schemas="));
        } else if (str_eq(arg, "-o") || str_eq(arg, "--output")) {
            if (i + 1 >= argc) {
                return usage_error(result, missing_value("--output", "OUTPUT"));
            }
            ++i;
            decode.output = platform::path_from_utf8(argv[i]);
        } else if (starts_with(arg, "--output=")) {
            decode.output = platform::path_from_utf8(arg + std::strlen("--output="));
        } else if (arg[0] == '-' && arg[1] != '\0') {
            return usage_error(result, std::string("unexpected argument '") + arg + "' found");
        } else if (!have_directory) {
            decode.directory = platform::path_from_utf8(arg);
            have_directory = true;
        } else {
            return usage_error(result, std::string("unexpected argument '") + arg + "' found");
        }
    }

    if (!have_directory) {
        return usage_error(result,
                           "the following required arguments were not provided:\n"
                           "  <DIRECTORY>");
    }

    result.ok = true;
    result.command = decode;
    return result;
}

}  // namespace bertread::cli
