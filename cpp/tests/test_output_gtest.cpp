// ==============================================================================
// test_output_gtest.cpp - Тесты модуля вывода (GoogleTest)
// ==============================================================================
//
// Тесты: TST-OUTPUT-001..TST-OUTPUT-005
//
// ==============================================================================

#include "bertread/output.hpp"
#include "bertread/platform.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace bertread::output::test {

namespace {

/// Уникальный путь во временном каталоге для текущего теста
std::filesystem::path temp_output_path(const std::string& suffix) {
    auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = std::string("bertread_output_") + test_info->name() + "_" +
                       std::to_string(
#ifdef _WIN32
                           GetCurrentProcessId()
#else
                           getpid()
#endif
                               ) +
                       suffix;
    return std::filesystem::temp_directory_path() / name;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

}  // anonymous namespace

// ==============================================================================
// TST-OUTPUT-001: цвета
// ==============================================================================

TEST(OutputTest, TST_OUTPUT_001_AnsiCodes) {
    EXPECT_FALSE(ansi_color_code(Color::Red).empty());
    EXPECT_FALSE(ansi_color_code(Color::Green).empty());
    EXPECT_TRUE(ansi_color_code(Color::Default).empty());
}

// ==============================================================================
// TST-OUTPUT-002: quiet / verbose
// ==============================================================================

TEST(OutputTest, TST_OUTPUT_002_QuietAndVerbose_DoNotThrow) {
    OutputConfig quiet;
    quiet.quiet = true;
    Writer q(quiet);
    EXPECT_NO_THROW({
        q.info("suppressed");
        q.warn("suppressed");
        q.error("never suppressed");
    });

    OutputConfig verbose;
    verbose.verbose = 2;
    Writer v(verbose);
    EXPECT_NO_THROW({
        v.debug("debug");
        v.trace("trace");
    });
}

// ==============================================================================
// TST-OUTPUT-003: --output перенаправляет stdout в файл
// ==============================================================================

TEST(OutputTest, TST_OUTPUT_003_OutputFile_ReceivesStdout) {
    auto path = temp_output_path(".txt");

    {
        OutputConfig config;
        config.output_path = path;
        Writer writer(config);
        ASSERT_TRUE(writer.has_output_file());

        writer.write(Stream::Stdout, "===========\n");
        writer.write_line(Stream::Stdout, "BERT Table:");
        // Диагностика в файл не попадает
        writer.info("not in file");
    }

    EXPECT_EQ(read_file(path), "===========\nBERT Table:\n");

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST(OutputTest, TST_OUTPUT_004_OutputFile_JsonPretty) {
    auto path = temp_output_path(".json");

    {
        OutputConfig config;
        config.output_path = path;
        Writer writer(config);
        ASSERT_TRUE(writer.has_output_file());

        rapidjson::Document doc;
        doc.SetObject();
        doc.AddMember("signature", "BERT", doc.GetAllocator());
        doc.AddMember("length", 48, doc.GetAllocator());
        writer.write_json_pretty(doc);
    }

    rapidjson::Document parsed;
    parsed.Parse(read_file(path).c_str());
    ASSERT_FALSE(parsed.HasParseError());
    EXPECT_STREQ(parsed["signature"].GetString(), "BERT");
    EXPECT_EQ(parsed["length"].GetInt(), 48);

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST(OutputTest, TST_OUTPUT_005_OutputFile_UnwritablePath) {
    OutputConfig config;
    config.output_path = temp_output_path("_missing_dir") / "out.txt";
    Writer writer(config);
    EXPECT_FALSE(writer.has_output_file());
}

}  // namespace bertread::output::test
