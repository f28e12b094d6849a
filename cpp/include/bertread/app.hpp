// ==============================================================================
// bertread/app.hpp - Выполнение команды decode
// ==============================================================================
//
// Назначение:
// - DecodeSession: декодирование набора таблиц одного запуска
// - run_decode: реестр + --schemas, поиск таблиц, вывод, exit code
//
// Ошибка в одном файле не останавливает обработку остальных.
//
// ==============================================================================

#ifndef BERTREAD_APP_HPP
#define BERTREAD_APP_HPP

#include "bertread/cli.hpp"
#include "bertread/output.hpp"
#include "bertread/section_registry.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <rapidjson/document.h>
#include <string>
#include <string_view>
#include <vector>

namespace bertread::app {

// ----------------------------------------------------------------------------
// DecodeSession
// ----------------------------------------------------------------------------

/// Контекст одного запуска decode.
///
/// Диагностика пишется в log, таблицы в out (stdout или --output).
/// При --json результаты копятся в документе и выводятся в finish().
class DecodeSession {
public:
    DecodeSession(const cli::DecodeCommand& cmd, output::Writer& log, output::Writer& out,
                  const section::SectionTypeRegistry& registry);

    void decode_bert_file(const std::filesystem::path& path);
    void decode_hest_file(const std::filesystem::path& path);

    /// data/BERT: частично декодированный блок выводится и учитывается как ошибка
    void decode_boot_error_data(const std::filesystem::path& path);

    /// Завершить вывод JSON документа
    void finish();

    std::size_t failures() const { return failures_; }

    /// Документ {bert, hest, boot_error_data, errors}
    const rapidjson::Document& document() const { return doc_; }

private:
    std::optional<std::vector<std::uint8_t>> load(const std::filesystem::path& path);

    void report(const std::filesystem::path& path, const io::DecodeError& err);

    void record_failure(const std::filesystem::path& path, std::string_view kind,
                        const std::string& message, std::optional<std::size_t> offset);

    const cli::DecodeCommand& cmd_;
    output::Writer& log_;
    output::Writer& out_;
    const section::SectionTypeRegistry& registry_;
    rapidjson::Document doc_;
    std::size_t failures_ = 0;
};

// ----------------------------------------------------------------------------
// run_decode
// ----------------------------------------------------------------------------

/// Выполнить команду decode
/// @return 0 при успехе или при ошибках с --skip-errors, иначе 1
/// @throws std::runtime_error если каталог не существует
int run_decode(const cli::DecodeCommand& cmd, output::Writer& writer);

}  // namespace bertread::app

#endif  // BERTREAD_APP_HPP
