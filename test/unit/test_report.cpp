#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "common/diagnostic.h"
#include "harness/report.h"

using namespace alucheck;

namespace {

std::string ReadAll(const std::string& path) {
  std::ifstream ifs(path);
  std::ostringstream ss;
  ss << ifs.rdbuf();
  return ss.str();
}

VerdictRecord MakeVerdict(uint64_t a, uint64_t b, uint64_t expected,
                          uint64_t observed) {
  VerdictRecord v;
  v.transaction.a = a;
  v.transaction.b = b;
  v.transaction.width = 8;
  v.expected = {expected, expected == 0, false};
  v.observed = ObservationFromPrediction({observed, observed == 0, false}, 8);
  v.pass = expected == observed;
  return v;
}

}  // namespace

TEST(Report, FormatPassAndFail) {
  EXPECT_EQ(FormatVerdict(MakeVerdict(5, 3, 8, 8), false),
            "PASS: a=5 b=3 opcode=0 result=8");
  EXPECT_EQ(FormatVerdict(MakeVerdict(5, 3, 8, 7), false),
            "FAIL: a=5 b=3 opcode=0 DUT=7 Expected=8");
}

TEST(Report, FormatUnknownObservation) {
  auto v = MakeVerdict(1, 1, 2, 2);
  v.pass = false;
  v.observed.result.word.bval = 0x1;
  v.observed.result.word.aval = 0x2;
  EXPECT_EQ(FormatVerdict(v, false),
            "FAIL: a=1 b=1 opcode=0 DUT=b0000001x Expected=2");
}

TEST(Report, FormatOverflowMismatchWhenCompared) {
  auto v = MakeVerdict(0x7F, 1, 0x80, 0x80);
  v.expected.overflow = true;
  v.pass = false;
  EXPECT_EQ(FormatVerdict(v, true),
            "FAIL: a=127 b=1 opcode=0 DUT=128 Expected=128 DUT_overflow=0 "
            "Expected_overflow=1");
}

TEST(Report, FormatSummaryLine) {
  RunSummary s{10, 9, 1, 0};
  EXPECT_EQ(FormatSummary(s), "SUMMARY: total=10 pass=9 fail=1 dropped=0");
}

TEST(Report, MirrorsLinesToFileAndConsole) {
  auto path =
      (std::filesystem::temp_directory_path() / "alucheck_report_test.log")
          .string();
  std::ostringstream console;
  std::ostringstream diag_out;
  DiagEngine diag(diag_out);
  {
    ReportWriter writer(console, diag);
    ASSERT_TRUE(writer.Open(path));
    writer.WriteLine("PASS: a=1 b=2 opcode=0 result=3");
    writer.WriteLine("FAIL: a=5 b=3 opcode=0 DUT=7 Expected=8");
    EXPECT_TRUE(writer.HasFile());
    EXPECT_EQ(writer.LinesWritten(), 2u);
  }
  std::string expected =
      "PASS: a=1 b=2 opcode=0 result=3\n"
      "FAIL: a=5 b=3 opcode=0 DUT=7 Expected=8\n";
  EXPECT_EQ(console.str(), expected);
  EXPECT_EQ(ReadAll(path), expected);
  EXPECT_FALSE(diag.HasErrors());
  std::remove(path.c_str());
}

TEST(Report, UnopenableFileFallsBackToConsole) {
  std::ostringstream console;
  std::ostringstream diag_out;
  DiagEngine diag(diag_out);
  ReportWriter writer(console, diag);
  EXPECT_FALSE(writer.Open("/nonexistent-dir/alucheck/report.log"));
  EXPECT_TRUE(diag.HasErrors());
  EXPECT_NE(diag_out.str().find("cannot open report file"), std::string::npos);

  writer.WriteLine("PASS: a=0 b=0 opcode=2 result=0");
  EXPECT_FALSE(writer.HasFile());
  EXPECT_EQ(console.str(), "PASS: a=0 b=0 opcode=2 result=0\n");
}
