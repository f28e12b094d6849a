// ==============================================================================
// test_discovery_gtest.cpp - Тесты поиска и чтения файлов таблиц (GoogleTest)
// ==============================================================================
//
// Тесты: TST-DISC-001..TST-DISC-009
//
// ==============================================================================

#include "bertread/discovery.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

// Platform-specific includes для PID (уникальные temp директории при параллельных тестах)
#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace bertread::io::test {

// ==============================================================================
// Test Fixture: временный каталог с таблицами
// ==============================================================================

class DiscoveryTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("bertread_discovery_") +
                                  test_info->test_case_name() + "_" + test_info->name() + "_" +
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
        std::filesystem::create_directories(test_dir_);
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

    void create_file(const std::filesystem::path& path) { create_file(path, {0x42}); }
};

// ==============================================================================
// Поиск
// ==============================================================================

TEST(DiscoveryNameTest, TST_DISC_001_IsBertTableName) {
    EXPECT_TRUE(is_bert_table_name("BERT"));
    EXPECT_TRUE(is_bert_table_name("BERT1"));
    EXPECT_TRUE(is_bert_table_name("BERT12"));
    EXPECT_FALSE(is_bert_table_name("BERT.bak"));
    EXPECT_FALSE(is_bert_table_name("bert"));
    EXPECT_FALSE(is_bert_table_name("HEST"));
    EXPECT_FALSE(is_bert_table_name("BER"));
}

TEST_F(DiscoveryTest, TST_DISC_002_FindsAllTables_Sorted) {
    create_file(test_dir_ / "BERT2");
    create_file(test_dir_ / "BERT");
    create_file(test_dir_ / "BERT1");
    create_file(test_dir_ / "HEST");
    create_file(test_dir_ / "DSDT");
    create_file(test_dir_ / "data" / "BERT");

    TableSet tables = discover_tables(test_dir_);

    ASSERT_EQ(tables.bert_files.size(), 3u);
    EXPECT_EQ(tables.bert_files[0].filename(), "BERT");
    EXPECT_EQ(tables.bert_files[1].filename(), "BERT1");
    EXPECT_EQ(tables.bert_files[2].filename(), "BERT2");
    ASSERT_TRUE(tables.hest_file.has_value());
    EXPECT_EQ(tables.hest_file->filename(), "HEST");
    ASSERT_TRUE(tables.bert_data_file.has_value());
    EXPECT_EQ(*tables.bert_data_file, test_dir_ / "data" / "BERT");
}

TEST_F(DiscoveryTest, TST_DISC_009_NumericSuffixOrder) {
    create_file(test_dir_ / "BERT10");
    create_file(test_dir_ / "BERT2");
    create_file(test_dir_ / "BERT");
    create_file(test_dir_ / "BERT1");

    TableSet tables = discover_tables(test_dir_);

    ASSERT_EQ(tables.bert_files.size(), 4u);
    EXPECT_EQ(tables.bert_files[0].filename(), "BERT");
    EXPECT_EQ(tables.bert_files[1].filename(), "BERT1");
    EXPECT_EQ(tables.bert_files[2].filename(), "BERT2");
    EXPECT_EQ(tables.bert_files[3].filename(), "BERT10");
}

TEST_F(DiscoveryTest, TST_DISC_003_EmptyDirectory) {
    TableSet tables = discover_tables(test_dir_);

    EXPECT_TRUE(tables.bert_files.empty());
    EXPECT_FALSE(tables.hest_file.has_value());
    EXPECT_FALSE(tables.bert_data_file.has_value());
}

TEST_F(DiscoveryTest, TST_DISC_004_SubdirectoryNamedBertIgnored) {
    std::filesystem::create_directories(test_dir_ / "BERT3");
    create_file(test_dir_ / "BERT");

    TableSet tables = discover_tables(test_dir_);
    ASSERT_EQ(tables.bert_files.size(), 1u);
    EXPECT_EQ(tables.bert_files[0].filename(), "BERT");
}

TEST_F(DiscoveryTest, TST_DISC_005_NotADirectory_Throws) {
    create_file(test_dir_ / "BERT");

    EXPECT_THROW(discover_tables(test_dir_ / "missing"), std::runtime_error);
    EXPECT_THROW(discover_tables(test_dir_ / "BERT"), std::runtime_error);
}

// ==============================================================================
// Чтение
// ==============================================================================

TEST_F(DiscoveryTest, TST_DISC_006_ReadTableFile_Contents) {
    std::vector<std::uint8_t> bytes(5000);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<std::uint8_t>(i & 0xFF);
    }
    create_file(test_dir_ / "BERT", bytes);

    auto result = read_table_file(test_dir_ / "BERT");
    ASSERT_TRUE(std::holds_alternative<std::vector<std::uint8_t>>(result));
    EXPECT_EQ(std::get<std::vector<std::uint8_t>>(result), bytes);
}

TEST_F(DiscoveryTest, TST_DISC_007_ReadTableFile_Empty) {
    create_file(test_dir_ / "HEST", {});

    auto result = read_table_file(test_dir_ / "HEST");
    ASSERT_TRUE(std::holds_alternative<std::vector<std::uint8_t>>(result));
    EXPECT_TRUE(std::get<std::vector<std::uint8_t>>(result).empty());
}

TEST_F(DiscoveryTest, TST_DISC_008_ReadTableFile_Missing) {
    auto result = read_table_file(test_dir_ / "BERT");
    ASSERT_TRUE(std::holds_alternative<TableFileError>(result));
    EXPECT_EQ(std::get<TableFileError>(result).kind, TableFileErrorKind::FileNotFound);
    EXPECT_NE(std::get<TableFileError>(result).format().find("BERT"), std::string::npos);
}

}  // namespace bertread::io::test
