// ==============================================================================
// session.cpp - Выполнение команды decode
// ==============================================================================

#include "bertread/app.hpp"

#include "bertread/acpi_table.hpp"
#include "bertread/discovery.hpp"
#include "bertread/gesb.hpp"
#include "bertread/platform.hpp"
#include "bertread/render.hpp"

#include <memory>
#include <utility>
#include <variant>

namespace bertread::app {

// ----------------------------------------------------------------------------
// DecodeSession
// ----------------------------------------------------------------------------

DecodeSession::DecodeSession(const cli::DecodeCommand& cmd, output::Writer& log,
                             output::Writer& out, const section::SectionTypeRegistry& registry)
    : cmd_(cmd), log_(log), out_(out), registry_(registry) {
    doc_.SetObject();
    auto& alloc = doc_.GetAllocator();
    doc_.AddMember("bert", rapidjson::Value(rapidjson::kArrayType), alloc);
    doc_.AddMember("hest", rapidjson::Value(rapidjson::kNullType), alloc);
    doc_.AddMember("boot_error_data", rapidjson::Value(rapidjson::kNullType), alloc);
    doc_.AddMember("errors", rapidjson::Value(rapidjson::kArrayType), alloc);
}

void DecodeSession::decode_bert_file(const std::filesystem::path& path) {
    auto data = load(path);
    if (!data) {
        return;
    }
    auto result = acpi::decode_bert(io::ByteCursor(*data));
    if (auto* err = std::get_if<io::DecodeError>(&result)) {
        report(path, *err);
        return;
    }
    const auto& record = std::get<acpi::BertRecord>(result);
    std::string filename = platform::path_to_utf8(path);
    log_.debug("decoded " + filename + " (" + std::to_string(record.header.length) +
               " bytes declared)");

    if (cmd_.json) {
        auto& alloc = doc_.GetAllocator();
        auto value = render::bert_to_json(record, alloc);
        value.AddMember("filename", rapidjson::Value(filename.c_str(), alloc), alloc);
        doc_["bert"].PushBack(value, alloc);
    } else {
        out_.write(output::Stream::Stdout, render::render_bert(record, filename));
    }
}

void DecodeSession::decode_hest_file(const std::filesystem::path& path) {
    auto data = load(path);
    if (!data) {
        return;
    }
    auto result = acpi::decode_hest(io::ByteCursor(*data));
    if (auto* err = std::get_if<io::DecodeError>(&result)) {
        report(path, *err);
        return;
    }
    const auto& record = std::get<acpi::HestRecord>(result);
    std::string filename = platform::path_to_utf8(path);
    log_.debug("decoded " + filename + " (" + std::to_string(record.error_source_count) +
               " error sources)");

    if (cmd_.json) {
        auto& alloc = doc_.GetAllocator();
        auto value = render::hest_to_json(record, alloc);
        value.AddMember("filename", rapidjson::Value(filename.c_str(), alloc), alloc);
        doc_["hest"] = value;
    } else {
        out_.write(output::Stream::Stdout, render::render_hest(record, filename));
    }
}

void DecodeSession::decode_boot_error_data(const std::filesystem::path& path) {
    auto data = load(path);
    if (!data) {
        return;
    }
    auto result = gesb::decode_gesb(io::ByteCursor(*data), registry_);
    if (auto* err = std::get_if<io::DecodeError>(&result)) {
        report(path, *err);
        return;
    }
    const auto& block = std::get<gesb::GenericErrorStatusBlock>(result);
    std::string filename = platform::path_to_utf8(path);
    log_.debug("decoded " + filename + ": " + std::to_string(block.entries.size()) +
               " error data entries, " + std::to_string(block.consumed) + " bytes");

    if (cmd_.json) {
        auto& alloc = doc_.GetAllocator();
        auto value = render::gesb_to_json(block, alloc);
        value.AddMember("filename", rapidjson::Value(filename.c_str(), alloc), alloc);
        doc_["boot_error_data"] = value;
    } else {
        out_.write(output::Stream::Stdout, render::render_gesb(block, filename));
    }

    // Частично декодированный блок: записи выведены, ошибка учитывается
    if (block.error) {
        report(path, *block.error);
    }
}

void DecodeSession::finish() {
    if (cmd_.json) {
        out_.write_json_pretty(doc_);
    }
    out_.flush();
}

std::optional<std::vector<std::uint8_t>> DecodeSession::load(const std::filesystem::path& path) {
    log_.trace("reading " + platform::path_to_utf8(path));
    auto result = io::read_table_file(path);
    if (auto* err = std::get_if<io::TableFileError>(&result)) {
        record_failure(path,
                       err->kind == io::TableFileErrorKind::FileNotFound ? "FileNotFound"
                                                                         : "IoError",
                       err->format(), std::nullopt);
        return std::nullopt;
    }
    return std::move(std::get<std::vector<std::uint8_t>>(result));
}

void DecodeSession::report(const std::filesystem::path& path, const io::DecodeError& err) {
    record_failure(path, io::decode_error_kind_to_string(err.kind), err.format(), err.offset);
}

void DecodeSession::record_failure(const std::filesystem::path& path, std::string_view kind,
                                   const std::string& message,
                                   std::optional<std::size_t> offset) {
    ++failures_;
    std::string filename = platform::path_to_utf8(path);
    std::string text = "failed to decode " + filename + " - " + message;
    if (cmd_.skip_errors) {
        log_.warn(text);
    } else {
        log_.error(text);
    }

    if (cmd_.json) {
        auto& alloc = doc_.GetAllocator();
        rapidjson::Value value(rapidjson::kObjectType);
        value.AddMember("filename", rapidjson::Value(filename.c_str(), alloc), alloc);
        value.AddMember(
            "kind",
            rapidjson::Value(kind.data(), static_cast<rapidjson::SizeType>(kind.size()), alloc),
            alloc);
        value.AddMember("message", rapidjson::Value(message.c_str(), alloc), alloc);
        if (offset) {
            value.AddMember("offset", static_cast<std::uint64_t>(*offset), alloc);
        }
        doc_["errors"].PushBack(value, alloc);
    }
}

// ----------------------------------------------------------------------------
// run_decode
// ----------------------------------------------------------------------------

int run_decode(const cli::DecodeCommand& cmd, output::Writer& writer) {
    std::string dir_str = platform::path_to_utf8(cmd.directory);

    // Реестр: встроенные типы + схемы из --schemas
    section::SectionTypeRegistry registry = section::SectionTypeRegistry::builtin();
    if (cmd.schemas.has_value()) {
        auto loaded = section::load_schema_file(*cmd.schemas, registry);
        if (!loaded.ok) {
            writer.error(loaded.error);
            return 1;
        }
        writer.info("Loaded " + std::to_string(loaded.loaded) + " section type schemas from " +
                    platform::path_to_utf8(*cmd.schemas));
    }

    io::TableSet tables = io::discover_tables(cmd.directory);
    if (tables.bert_files.empty()) {
        writer.error("No BERT file in " + dir_str);
        return 1;
    }
    writer.info("Decoding ACPI tables from: " + dir_str + " (" +
                std::to_string(tables.bert_files.size()) + " BERT tables)");

    // --output: записи в файл, диагностика остаётся в stderr
    std::unique_ptr<output::Writer> file_writer;
    output::Writer* out = &writer;
    if (cmd.output.has_value()) {
        output::OutputConfig out_cfg = writer.config();
        out_cfg.output_path = cmd.output;
        file_writer = std::make_unique<output::Writer>(out_cfg);
        if (!file_writer->has_output_file()) {
            writer.error("Unable to create output file - " + platform::path_to_utf8(*cmd.output));
            return 1;
        }
        out = file_writer.get();
    }

    DecodeSession session(cmd, writer, *out, registry);
    for (const auto& path : tables.bert_files) {
        session.decode_bert_file(path);
    }

    if (tables.hest_file) {
        session.decode_hest_file(*tables.hest_file);
    } else {
        writer.warn("No HEST file in " + dir_str);
    }

    if (tables.bert_data_file) {
        session.decode_boot_error_data(*tables.bert_data_file);
    } else {
        writer.warn("No boot error region file (data/BERT) in " + dir_str);
    }

    session.finish();

    if (session.failures() > 0) {
        std::string summary = std::to_string(session.failures()) + " table(s) failed to decode";
        if (cmd.skip_errors) {
            writer.warn(summary);
            return 0;
        }
        writer.error(summary);
        return 1;
    }

    writer.info("Done");
    return 0;
}

}  // namespace bertread::app
