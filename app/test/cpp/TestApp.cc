#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <cstdio>
#include <tcl.h>
#include "Error.hh"
#include "Report.hh"
#include "Debug.hh"
#include "TsumMain.hh"

namespace tsum {

static const char *example_report =
  "Startpoint: top/cpu/U1 (rising edge-triggered flip-flop clocked by CLK1)\n"
  "Endpoint: top/mem/U2 (rising edge-triggered flip-flop clocked by CLK1)\n"
  "Path Group: reg2reg\n"
  "Path Type: max\n"
  "  Point                                    Incr       Path\n"
  "  clock network delay (propagated)         0.500      0.500\n"
  "  top/cpu/U1/CP (DFF)                      0.000      0.500 r\n"
  "  top/cpu/U1/Q (DFF)                       0.100 &    0.600 r\n"
  "  top/mem/U2/D (DFF)                       0.000 &    0.650 f\n"
  "  data arrival time                                   0.650\n"
  "  clock network delay (propagated)         0.450      1.450\n"
  "  slack (VIOLATED)                                   -0.120\n";

// Captures error console output.
class ReportCapture : public Report
{
public:
  std::string errors;

protected:
  size_t printErrorConsole(const char *buffer,
                           size_t length) override
  {
    errors.append(buffer, length);
    return length;
  }
};

// Mutable argv for the command line functions.
class CmdLine
{
public:
  CmdLine(std::vector<std::string> args) :
    args_(args)
  {
    for (std::string &arg : args_)
      argv_.push_back(&arg[0]);
    argv_.push_back(nullptr);
    argc_ = static_cast<int>(args_.size());
  }
  int &argc() { return argc_; }
  char **argv() { return argv_.data(); }

private:
  std::vector<std::string> args_;
  std::vector<char*> argv_;
  int argc_;
};

static std::string
readFile(const char *filename)
{
  std::string text;
  FILE *stream = fopen(filename, "r");
  if (stream) {
    char buffer[1024];
    size_t length;
    while ((length = fread(buffer, 1, sizeof(buffer), stream)) > 0)
      text.append(buffer, length);
    fclose(stream);
  }
  return text;
}

static bool
fileExists(const char *filename)
{
  FILE *stream = fopen(filename, "r");
  if (stream) {
    fclose(stream);
    return true;
  }
  return false;
}

////////////////////////////////////////////////////////////////

TEST(CmdLineTest, FindFlag)
{
  CmdLine cmd({"tsum", "-totals", "report.rpt"});
  EXPECT_TRUE(findCmdLineFlag(cmd.argc(), cmd.argv(), "-totals"));
  EXPECT_EQ(cmd.argc(), 2);
  EXPECT_STREQ(cmd.argv()[1], "report.rpt");
  EXPECT_FALSE(findCmdLineFlag(cmd.argc(), cmd.argv(), "-totals"));
}

TEST(CmdLineTest, FindKey)
{
  CmdLine cmd({"tsum", "-output", "out.txt", "report.rpt"});
  const char *value = findCmdLineKey(cmd.argc(), cmd.argv(), "-output");
  ASSERT_NE(value, nullptr);
  EXPECT_STREQ(value, "out.txt");
  EXPECT_EQ(cmd.argc(), 2);
  EXPECT_STREQ(cmd.argv()[1], "report.rpt");
}

TEST(CmdLineTest, FindKeyWithoutValue)
{
  CmdLine cmd({"tsum", "report.rpt", "-output"});
  EXPECT_EQ(findCmdLineKey(cmd.argc(), cmd.argv(), "-output"), nullptr);
  EXPECT_EQ(cmd.argc(), 3);
}

TEST(CmdLineTest, RepeatedKeysInOrder)
{
  CmdLine cmd({"tsum", "-block_map", "a=1", "r.rpt", "-block_map", "b=2"});
  const char *first = findCmdLineKey(cmd.argc(), cmd.argv(), "-block_map");
  const char *second = findCmdLineKey(cmd.argc(), cmd.argv(), "-block_map");
  ASSERT_NE(first, nullptr);
  ASSERT_NE(second, nullptr);
  EXPECT_STREQ(first, "a=1");
  EXPECT_STREQ(second, "b=2");
  EXPECT_EQ(cmd.argc(), 2);
}

TEST(CmdLineTest, ParseDebugArg)
{
  Report report;
  Debug debug(&report);
  parseDebugArg("scan", &report, &debug);
  EXPECT_EQ(debug.level("scan"), 1);
  parseDebugArg("block_map=3", &report, &debug);
  EXPECT_EQ(debug.level("block_map"), 3);
  EXPECT_THROW(parseDebugArg("scan=x", &report, &debug), ExceptionMsg);
  EXPECT_THROW(parseDebugArg("=2", &report, &debug), ExceptionMsg);
}

////////////////////////////////////////////////////////////////

class TsumMainTest : public ::testing::Test {
protected:
  void SetUp() override {
    interp_ = Tcl_CreateInterp();
    report_filename_ = "/tmp/tsum_test_app.rpt";
    output_filename_ = "/tmp/tsum_test_app.summary";
    FILE *stream = fopen(report_filename_, "w");
    ASSERT_NE(stream, nullptr);
    fputs(example_report, stream);
    fclose(stream);
    std::remove(output_filename_);
  }
  void TearDown() override {
    std::remove(report_filename_);
    std::remove(output_filename_);
    if (interp_)
      Tcl_DeleteInterp(interp_);
  }

  int run(std::vector<std::string> args) {
    CmdLine cmd(args);
    Debug debug(&report_);
    return tsumMain(cmd.argc(), cmd.argv(), &report_, &debug, interp_);
  }

  Tcl_Interp *interp_;
  ReportCapture report_;
  const char *report_filename_;
  const char *output_filename_;
};

TEST_F(TsumMainTest, SummaryToFile)
{
  EXPECT_EQ(run({"tsum", "-output", output_filename_, report_filename_}), 0);
  std::string text = readFile(output_filename_);
  EXPECT_EQ(text.compare(0, 2, "\n "), 0);
  EXPECT_NE(text.find(" top                           top                                              1              -0.120              -0.120\n"),
            std::string::npos);
  EXPECT_NE(text.find("1\ttop/cpu/U1/CP -0.120 (1) (CLK1:0.500)\n"
                      "\ttop/mem/U2/D -0.120 (1) (CLK1:0.450) (-0.050)\n"),
            std::string::npos);
  EXPECT_EQ(report_.errors, "");
}

TEST_F(TsumMainTest, SummaryToStdout)
{
  report_.redirectStringBegin();
  int status = run({"tsum", report_filename_});
  std::string text = report_.redirectStringEnd();
  EXPECT_EQ(status, 0);
  EXPECT_NE(text.find(" reg2reg                                            1"),
            std::string::npos);
}

TEST_F(TsumMainTest, BlockMapArgs)
{
  EXPECT_EQ(run({"tsum", "-block_map", "top=chip",
                 "-block_map", "top/mem=memory",
                 "-output", output_filename_, report_filename_}), 0);
  std::string text = readFile(output_filename_);
  EXPECT_NE(text.find(" chip                          memory                                           1"),
            std::string::npos);
}

TEST_F(TsumMainTest, Totals)
{
  EXPECT_EQ(run({"tsum", "-totals", "-output", output_filename_,
                 report_filename_}), 0);
  std::string text = readFile(output_filename_);
  EXPECT_EQ(text.compare(0, 24, "Summary\n=======\nTotal pa"), 0);
  EXPECT_NE(text.find("Path types:\n  - max: 1\n"), std::string::npos);
  EXPECT_NE(text.find("reg2reg                         1     -0.120       -0.120           1      -0.120\n"),
            std::string::npos);
}

TEST_F(TsumMainTest, HugeSlack)
{
  std::string text =
    "Startpoint: u1 (rising edge-triggered flip-flop clocked by clk)\n"
    "Endpoint: u2 (rising edge-triggered flip-flop clocked by clk)\n"
    "Path Group: clk\n"
    "  slack (VIOLATED)  -" + std::string(400, '9') + "\n";
  FILE *stream = fopen(report_filename_, "w");
  ASSERT_NE(stream, nullptr);
  fputs(text.c_str(), stream);
  fclose(stream);
  EXPECT_EQ(run({"tsum", "-output", output_filename_, report_filename_}), 0);
  EXPECT_EQ(run({"tsum", "-totals", "-output", output_filename_,
                 report_filename_}), 0);
  EXPECT_NE(readFile(output_filename_).find("Violations: 1\n"),
            std::string::npos);
  EXPECT_EQ(report_.errors, "");
}

TEST_F(TsumMainTest, MissingReport)
{
  EXPECT_EQ(run({"tsum", "-output", output_filename_,
                 "/nonexistent/tsum.rpt"}), 1);
  EXPECT_EQ(report_.errors, "Error: cannot read file /nonexistent/tsum.rpt.\n");
  EXPECT_FALSE(fileExists(output_filename_));
}

TEST_F(TsumMainTest, BadBlockMapArg)
{
  EXPECT_EQ(run({"tsum", "-block_map", "top", "-output", output_filename_,
                 report_filename_}), 1);
  EXPECT_EQ(report_.errors,
            "Error: -block_map expects prefix=name, got 'top'.\n");
  EXPECT_FALSE(fileExists(output_filename_));
}

TEST_F(TsumMainTest, BadPinRegexp)
{
  EXPECT_EQ(run({"tsum", "-output_pins", "a(b", report_filename_}), 1);
  EXPECT_EQ(report_.errors.compare(0, 7, "Error: "), 0);
}

TEST_F(TsumMainTest, OutputNotWritable)
{
  EXPECT_EQ(run({"tsum", "-output", "/nonexistent/dir/out.txt",
                 report_filename_}), 1);
  EXPECT_EQ(report_.errors,
            "Error: cannot write file /nonexistent/dir/out.txt.\n");
}

TEST_F(TsumMainTest, Usage)
{
  report_.redirectStringBegin();
  int status = run({"tsum"});
  std::string text = report_.redirectStringEnd();
  EXPECT_EQ(status, 1);
  EXPECT_EQ(text.compare(0, 11, "Usage: tsum"), 0);
  EXPECT_EQ(run({"tsum", "a.rpt", "b.rpt"}), 1);
  EXPECT_EQ(run({"tsum", "-unknown"}), 1);
}

TEST_F(TsumMainTest, Help)
{
  report_.redirectStringBegin();
  int status = run({"tsum", "-help"});
  std::string text = report_.redirectStringEnd();
  EXPECT_EQ(status, 0);
  EXPECT_NE(text.find("-block_map_file file"), std::string::npos);
}

} // namespace
