// ==============================================================================
// test_app_gtest.cpp - Тесты команды decode (GoogleTest)
// ==============================================================================
//
// Тесты: TST-APP-001..TST-APP-009
//
// Каталог таблиц собирается во временной директории, таблицы выводятся
// в файл через --output.
//
// ==============================================================================

#include "bertread/app.hpp"
#include "bertread/platform.hpp"

#include <cstring>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// Platform-specific includes для PID (уникальные temp директории при параллельных тестах)
#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace bertread::app::test {

namespace {

void put_u32(std::vector<std::uint8_t>& buf, std::size_t offset, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        buf[offset + i] = static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF);
    }
}

void put_str(std::vector<std::uint8_t>& buf, std::size_t offset, const char* s) {
    std::memcpy(buf.data() + offset, s, std::strlen(s));
}

/// Заголовок ACPI: сигнатура, длина, OEM поля
std::vector<std::uint8_t> make_table(const char* signature, std::size_t size) {
    std::vector<std::uint8_t> buf(size, 0);
    put_str(buf, 0, signature);
    put_u32(buf, 4, static_cast<std::uint32_t>(size));
    buf[8] = 1;
    put_str(buf, 10, "TEST00");
    put_str(buf, 16, "TESTTBL1");
    put_str(buf, 28, "TEST");
    return buf;
}

std::vector<std::uint8_t> make_bert() {
    auto buf = make_table("BERT", 48);
    put_u32(buf, 36, 8);
    return buf;
}

/// Firmware Error Record Reference (20 байт payload)
std::vector<std::uint8_t> make_entry(std::int32_t declared_length,
                                     const std::vector<std::uint8_t>& payload) {
    static const std::uint8_t FERR_WIRE[16] = {0x96, 0x2A, 0x21, 0x81, 0xED, 0x09, 0x96, 0x49,
                                               0x94, 0x71, 0x8D, 0x72, 0x9C, 0x8E, 0x69, 0xED};
    std::vector<std::uint8_t> entry(72, 0);
    std::memcpy(entry.data(), FERR_WIRE, 16);
    put_u32(entry, 16, 1);
    put_u32(entry, 24, static_cast<std::uint32_t>(declared_length));
    std::memcpy(entry.data() + 44, "CPU0", 4);
    entry.insert(entry.end(), payload.begin(), payload.end());
    return entry;
}

/// Блок GESB: одна полная запись, при truncated ещё одна обрезанная
std::vector<std::uint8_t> make_boot_error_data(bool truncated) {
    std::vector<std::vector<std::uint8_t>> entries;
    entries.push_back(make_entry(20, std::vector<std::uint8_t>(20, 0x02)));
    if (truncated) {
        entries.push_back(make_entry(500, {1, 2, 3, 4}));
    }

    std::vector<std::uint8_t> block(20, 0);
    block[0] = 0x11;
    std::size_t total = 0;
    for (const auto& e : entries) {
        total += e.size();
        block.insert(block.end(), e.begin(), e.end());
    }
    put_u32(block, 12, static_cast<std::uint32_t>(total));
    put_u32(block, 16, 1);
    return block;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

}  // anonymous namespace

// ==============================================================================
// Test Fixture: каталог таблиц во временной директории
// ==============================================================================

class AppTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;
    std::filesystem::path tables_dir_;
    std::filesystem::path output_path_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("bertread_app_") + test_info->test_case_name() +
                                  "_" + test_info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      GetCurrentProcessId()
#else
                                      getpid()
#endif
                                  );

        test_dir_ = std::filesystem::temp_directory_path() / unique_name;

        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        tables_dir_ = test_dir_ / "tables";
        std::filesystem::create_directories(tables_dir_);
        output_path_ = test_dir_ / "report.out";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    void create_file(const std::filesystem::path& path, const std::vector<std::uint8_t>& bytes) {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(bytes.data()),
                   static_cast<std::streamsize>(bytes.size()));
    }

    /// BERT с правильной сигнатурой и BERT1 с чужой
    void create_good_and_bad_bert() {
        create_file(tables_dir_ / "BERT", make_bert());
        create_file(tables_dir_ / "BERT1", make_table("XERT", 48));
    }

    cli::DecodeCommand make_command() const {
        cli::DecodeCommand cmd;
        cmd.directory = tables_dir_;
        cmd.output = output_path_;
        return cmd;
    }

    int run(const cli::DecodeCommand& cmd) {
        output::OutputConfig cfg;
        cfg.quiet = true;
        output::Writer writer(cfg);
        return run_decode(cmd, writer);
    }

    std::string filename_of(const std::string& name) const {
        return platform::path_to_utf8(tables_dir_ / name);
    }
};

// ==============================================================================
// Ошибка в одном файле не останавливает остальные
// ==============================================================================

TEST_F(AppTest, TST_APP_001_BadBertFile_GoodOneStillRendered_ExitOne) {
    create_good_and_bad_bert();

    EXPECT_EQ(run(make_command()), 1);

    std::string text = read_file(output_path_);
    EXPECT_NE(text.find("Filename: " + filename_of("BERT") + "\n"), std::string::npos);
    EXPECT_EQ(text.find("Filename: " + filename_of("BERT1") + "\n"), std::string::npos);
}

TEST_F(AppTest, TST_APP_002_SkipErrors_ExitZero) {
    create_good_and_bad_bert();

    auto cmd = make_command();
    cmd.skip_errors = true;
    EXPECT_EQ(run(cmd), 0);

    std::string text = read_file(output_path_);
    EXPECT_NE(text.find("Filename: " + filename_of("BERT") + "\n"), std::string::npos);
}

TEST_F(AppTest, TST_APP_003_Session_CountsFailures) {
    create_good_and_bad_bert();

    cli::DecodeCommand cmd = make_command();
    cmd.json = true;
    output::OutputConfig cfg;
    cfg.quiet = true;
    output::Writer writer(cfg);

    DecodeSession session(cmd, writer, writer, section::SectionTypeRegistry::builtin());
    session.decode_bert_file(tables_dir_ / "BERT1");
    session.decode_bert_file(tables_dir_ / "BERT");

    EXPECT_EQ(session.failures(), 1u);
    const auto& doc = session.document();
    ASSERT_EQ(doc["bert"].Size(), 1u);
    EXPECT_EQ(doc["bert"][0]["filename"].GetString(), filename_of("BERT"));
    ASSERT_EQ(doc["errors"].Size(), 1u);
    EXPECT_STREQ(doc["errors"][0]["kind"].GetString(), "HeaderMismatch");
    EXPECT_EQ(doc["errors"][0]["filename"].GetString(), filename_of("BERT1"));

    // Отсутствующий файл тоже учитывается
    session.decode_hest_file(tables_dir_ / "HEST");
    EXPECT_EQ(session.failures(), 2u);
    EXPECT_STREQ(doc["errors"][1]["kind"].GetString(), "FileNotFound");
    EXPECT_TRUE(doc["hest"].IsNull());
}

// ==============================================================================
// Необязательные таблицы
// ==============================================================================

TEST_F(AppTest, TST_APP_004_MissingHestAndBootErrorData_OnlyWarn) {
    create_file(tables_dir_ / "BERT", make_bert());

    EXPECT_EQ(run(make_command()), 0);
    EXPECT_NE(read_file(output_path_).find("BERT Table:"), std::string::npos);
}

TEST_F(AppTest, TST_APP_005_AllTables_Rendered) {
    create_file(tables_dir_ / "BERT", make_bert());
    create_file(tables_dir_ / "HEST", make_table("HEST", 40));
    create_file(tables_dir_ / "data" / "BERT", make_boot_error_data(false));

    EXPECT_EQ(run(make_command()), 0);

    std::string text = read_file(output_path_);
    EXPECT_NE(text.find("BERT Table:"), std::string::npos);
    EXPECT_NE(text.find("HEST Table:"), std::string::npos);
    EXPECT_NE(text.find("Generic Error Status Block:"), std::string::npos);
    EXPECT_NE(text.find("1. error data entry"), std::string::npos);
    EXPECT_EQ(text.find("Decoding stopped"), std::string::npos);
}

// ==============================================================================
// Частично декодированный блок
// ==============================================================================

TEST_F(AppTest, TST_APP_006_TruncatedEntry_RenderedAndCounted) {
    create_file(tables_dir_ / "BERT", make_bert());
    create_file(tables_dir_ / "data" / "BERT", make_boot_error_data(true));

    EXPECT_EQ(run(make_command()), 1);

    std::string text = read_file(output_path_);
    EXPECT_NE(text.find("1. error data entry"), std::string::npos);
    EXPECT_EQ(text.find("2. error data entry"), std::string::npos);
    EXPECT_NE(text.find("Decoding stopped: TruncatedEntry"), std::string::npos);
}

// ==============================================================================
// JSON
// ==============================================================================

TEST_F(AppTest, TST_APP_007_Json_DocumentWithErrors) {
    create_good_and_bad_bert();
    create_file(tables_dir_ / "data" / "BERT", make_boot_error_data(true));

    auto cmd = make_command();
    cmd.json = true;
    EXPECT_EQ(run(cmd), 1);

    rapidjson::Document doc;
    doc.Parse(read_file(output_path_).c_str());
    ASSERT_FALSE(doc.HasParseError());
    ASSERT_TRUE(doc.IsObject());

    ASSERT_EQ(doc["bert"].Size(), 1u);
    EXPECT_STREQ(doc["bert"][0]["header_signature"].GetString(), "BERT");
    EXPECT_TRUE(doc["hest"].IsNull());

    const auto& data = doc["boot_error_data"];
    ASSERT_TRUE(data.IsObject());
    EXPECT_EQ(data["entries"].Size(), 1u);
    EXPECT_TRUE(data.HasMember("error"));

    ASSERT_EQ(doc["errors"].Size(), 2u);
    EXPECT_STREQ(doc["errors"][0]["kind"].GetString(), "HeaderMismatch");
    EXPECT_STREQ(doc["errors"][1]["kind"].GetString(), "TruncatedEntry");
    EXPECT_TRUE(doc["errors"][1].HasMember("offset"));
}

// ==============================================================================
// Ошибки запуска
// ==============================================================================

TEST_F(AppTest, TST_APP_008_NoBertFile_ExitOne) {
    create_file(tables_dir_ / "HEST", make_table("HEST", 40));

    EXPECT_EQ(run(make_command()), 1);

    auto cmd = make_command();
    cmd.directory = test_dir_ / "missing";
    EXPECT_THROW(run(cmd), std::runtime_error);
}

TEST_F(AppTest, TST_APP_009_MissingSchemaFile_ExitOne) {
    create_file(tables_dir_ / "BERT", make_bert());

    auto cmd = make_command();
    cmd.schemas = test_dir_ / "does_not_exist.yml";
    EXPECT_EQ(run(cmd), 1);
    EXPECT_FALSE(std::filesystem::exists(output_path_));
}

}  // namespace bertread::app::test
