#include <filesystem>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "src/exporter.hpp"
#include "src/format/record_parser.hpp"
#include "src/schema/config_creator.hpp"
#include "test_helpers.hpp"

namespace {

class ExporterTest : public ::testing::Test {
protected:
    ExporterTest() : db_(nullptr), con_(db_) {
    }

    void SetUp() override {
        dir_ = MakeTestDirectory();
        RunQuery("CREATE TABLE people (id INTEGER, name VARCHAR, note VARCHAR)");
        RunQuery("INSERT INTO people VALUES (1, 'Ann', NULL), (2, 'Smith, Bob', 'it''s')");
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    void RunQuery(const std::string &query) {
        const auto result = con_.Query(query);
        ASSERT_FALSE(result->HasError()) << result->GetError();
    }

    ExportConfig MakeConfig(const bool compress = false) const {
        const ExportConfigMetaData meta = {
            dir_, DelimiterSet::MySQL(), "\\N", {}, "", compress
        };
        return ExportConfig{meta, {TableConfig{"main", "people"}}};
    }

    duckdb::DuckDB db_;
    duckdb::Connection con_;
    std::filesystem::path dir_;
};

TEST_F(ExporterTest, BuildsSelectQuery) {
    ExportConfig config = MakeConfig();
    EXPECT_EQ("SELECT * FROM \"main\".\"people\" ", BuildSelectQuery(config, config.tables[0]));

    config.columns = {"id", "na\"me"};
    config.where_clause = "id > 1";
    EXPECT_EQ("SELECT \"id\", \"na\"\"me\" FROM \"main\".\"people\" WHERE id > 1",
              BuildSelectQuery(config, config.tables[0]));
}

TEST_F(ExporterTest, ExportsTableAsDelimitedText) {
    const ExportConfig config = MakeConfig();

    const ExportResult result = ExportTable(con_, config, config.tables[0]);

    EXPECT_FALSE(result.HasError()) << result.error_message();
    EXPECT_EQ(dir_ / "main.people.txt", result.output_path());
    EXPECT_EQ(2u, result.GetNumRows());

    const std::string text = ReadFile(result.output_path());
    EXPECT_EQ("1,Ann,\\\\N\n2,'Smith, Bob',it\\'s\n", text);
    EXPECT_EQ(text.size(), result.GetBytesWritten());
    EXPECT_EQ(text.size(), result.GetBytesOnDisk());
}

TEST_F(ExporterTest, ExportedRowsParseBack) {
    const ExportConfig config = MakeConfig();
    const ExportResult result = ExportTable(con_, config, config.tables[0]);
    ASSERT_FALSE(result.HasError()) << result.error_message();

    const std::string text = ReadFile(result.output_path());
    const RecordParser parser(config.delimiters);
    const auto second_row = parser.Parse(text.substr(text.find('\n') + 1));

    EXPECT_EQ(std::vector<std::string>({"2", "Smith, Bob", "it's"}), second_row);
}

TEST_F(ExporterTest, ColumnsAndWhereClause) {
    ExportConfig config = MakeConfig();
    config.columns = {"name"};
    config.where_clause = "id = 2";

    const ExportResult result = ExportTable(con_, config, config.tables[0]);

    EXPECT_FALSE(result.HasError()) << result.error_message();
    EXPECT_EQ(1u, result.GetNumRows());
    EXPECT_EQ("'Smith, Bob'\n", ReadFile(result.output_path()));
}

TEST_F(ExporterTest, MissingTableIsReportedNotThrown) {
    const ExportConfig config = MakeConfig();

    const ExportResult result = ExportTable(con_, config, TableConfig{"main", "nope"});

    EXPECT_TRUE(result.HasError());
    EXPECT_FALSE(result.error_message().empty());
    EXPECT_EQ(0u, result.GetNumRows());
}

TEST_F(ExporterTest, ExecutionErrorIsReported) {
    ExportConfig config = MakeConfig();
    config.where_clause = "CAST(name AS INTEGER) > 0";

    const ExportResult result = ExportTable(con_, config, config.tables[0]);

    EXPECT_TRUE(result.HasError());
    EXPECT_FALSE(result.error_message().empty());
}

TEST_F(ExporterTest, PathSeparatorsInTableNamesStayInOutputDir) {
    RunQuery("CREATE TABLE \"a/b\" (x INTEGER)");
    RunQuery("INSERT INTO \"a/b\" VALUES (1)");
    RunQuery("CREATE TABLE \"x/../../evil\" (x INTEGER)");

    const ExportConfig config = MakeConfig();

    const ExportResult slash = ExportTable(con_, config, TableConfig{"main", "a/b"});
    EXPECT_FALSE(slash.HasError()) << slash.error_message();
    EXPECT_EQ(dir_ / "main.a_b.txt", slash.output_path());
    EXPECT_EQ("1\n", ReadFile(slash.output_path()));

    const ExportResult traversal = ExportTable(con_, config, TableConfig{"main", "x/../../evil"});
    EXPECT_FALSE(traversal.HasError()) << traversal.error_message();
    EXPECT_EQ(dir_, traversal.output_path().parent_path());
    EXPECT_TRUE(std::filesystem::exists(traversal.output_path()));
}

TEST_F(ExporterTest, CompressedExport) {
    const ExportConfig config = MakeConfig(true);

    const ExportResult result = ExportTable(con_, config, config.tables[0]);

    EXPECT_FALSE(result.HasError()) << result.error_message();
    EXPECT_EQ(dir_ / "main.people.txt.lz4", result.output_path());
    EXPECT_EQ(2u, result.GetNumRows());
    EXPECT_EQ(std::string("1,Ann,\\\\N\n2,'Smith, Bob',it\\'s\n").size(), result.GetBytesWritten());
    EXPECT_EQ(ReadFile(result.output_path()).size(), result.GetBytesOnDisk());
}

TEST_F(ExporterTest, DiscoversTablesAndViews) {
    RunQuery("CREATE TABLE animals (name VARCHAR)");
    RunQuery("CREATE VIEW adults AS SELECT * FROM people WHERE id > 1");
    RunQuery("CREATE SCHEMA other");
    RunQuery("CREATE TABLE other.things (x INTEGER)");

    const ExportConfig all = GetExportConfigFromDatabase(con_, MakeConfig());
    ASSERT_EQ(4u, all.tables.size());
    EXPECT_EQ("main.adults", all.tables[0].FileStem());
    EXPECT_EQ("main.animals", all.tables[1].FileStem());
    EXPECT_EQ("main.people", all.tables[2].FileStem());
    EXPECT_EQ("other.things", all.tables[3].FileStem());

    const ExportConfig other = GetExportConfigFromDatabase(con_, MakeConfig(), "OTHER");
    ASSERT_EQ(1u, other.tables.size());
    EXPECT_EQ("\"other\".\"things\"", other.tables[0].QualifiedName());
}

TEST_F(ExporterTest, RunExportWritesEveryTable) {
    RunQuery("CREATE TABLE empty_table (x INTEGER)");

    ExportConfig config = MakeConfig();
    config.output_dir = dir_ / "nested" / "out";
    config.tables.push_back(TableConfig{"main", "empty_table"});

    const auto results = RunExport(con_, config);

    ASSERT_EQ(2u, results.size());
    EXPECT_EQ(2u, results[0].GetNumRows());
    EXPECT_EQ(0u, results[1].GetNumRows());
    EXPECT_FALSE(results[1].HasError());
    EXPECT_TRUE(std::filesystem::exists(config.output_dir / "main.people.txt"));
    EXPECT_EQ("", ReadFile(config.output_dir / "main.empty_table.txt"));
}

TEST(TableConfigTest, FromArgument) {
    const auto plain = TableConfig::FromArgument("people", "");
    EXPECT_EQ("main", plain.schema);
    EXPECT_EQ("people", plain.table);

    const auto with_default = TableConfig::FromArgument("people", "sales");
    EXPECT_EQ("sales", with_default.schema);

    const auto qualified = TableConfig::FromArgument("hr.people", "sales");
    EXPECT_EQ("hr", qualified.schema);
    EXPECT_EQ("people", qualified.table);
    EXPECT_EQ("hr.people", qualified.FileStem());

    const TableConfig odd{"s\\x", std::string("a/b\0c", 5)};
    EXPECT_EQ("s_x.a_b_c", odd.FileStem());
}

} // namespace
