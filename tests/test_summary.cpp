#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "src/format/record_parser.hpp"
#include "src/models/export_result.hpp"
#include "src/sinks/output_sink.hpp"

namespace {

TEST(SummaryTest, WritesHeaderAndOneRowPerTable) {
    ExportResult ok("main.t", "out/main.t.txt");
    ok.SetCounts(3, 30, 30);
    ok.SetExportTime(1.5);

    ExportResult failed("main.u", "out/main.u.txt");
    failed.SetError("bad, very bad");

    StringSink sink;
    WriteSummary({ok, failed}, sink);

    EXPECT_EQ("table,file,n_rows,bytes_written,bytes_on_disk,export_time_ms,has_error,error_message\n"
              "main.t,out/main.t.txt,3,30,30,1.500,0,\n"
              "main.u,out/main.u.txt,0,0,0,0.000,1,\"bad, very bad\"\n",
              sink.str());
}

TEST(SummaryTest, ErrorMessagesAccumulate) {
    ExportResult result("main.t", "out/main.t.txt");
    EXPECT_FALSE(result.HasError());

    result.SetError("first");
    result.SetError("second");

    EXPECT_TRUE(result.HasError());
    EXPECT_EQ("first; second", result.error_message());
}

TEST(SummaryTest, SummaryRowsParseBack) {
    ExportResult failed("main.\"quoted\"", "out/x.txt");
    failed.SetError("line one\nline \\two");

    StringSink sink;
    WriteSummary({failed}, sink);

    const std::string &text = sink.str();
    const auto second_line = text.substr(text.find('\n') + 1);

    const RecordParser parser(SummaryDelimiters());
    const auto fields = parser.Parse(second_line);
    ASSERT_EQ(8u, fields.size());
    EXPECT_EQ("main.\"quoted\"", fields[0]);
    EXPECT_EQ("line one\nline \\two", fields[7]);
}

} // namespace
