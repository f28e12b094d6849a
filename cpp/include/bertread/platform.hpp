// ==============================================================================
// bertread/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Явные преобразования std::filesystem::path <-> UTF-8
// - Определение TTY для stdout/stderr (цветной вывод)
//
// Платформенная специфика (#ifdef _WIN32) изолирована в platform.cpp.
//
// ==============================================================================

#ifndef BERTREAD_PLATFORM_HPP
#define BERTREAD_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace bertread::platform {

/// UTF-8 строка -> native path
std::filesystem::path path_from_utf8(std::string_view u8str);

/// native path -> UTF-8 строка
std::string path_to_utf8(const std::filesystem::path& p);

/// stdout подключён к терминалу
bool is_tty_stdout();

/// stderr подключён к терминалу
bool is_tty_stderr();

}  // namespace bertread::platform

#endif  // BERTREAD_PLATFORM_HPP
