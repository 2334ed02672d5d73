#include <gtest/gtest.h>
#include <string>
#include <cmath>
#include <cstdio>
#include <tcl.h>
#include <zlib.h>
#include "Error.hh"
#include "Report.hh"
#include "Debug.hh"
#include "LineSource.hh"
#include "PathRecord.hh"
#include "PinClassifier.hh"
#include "PathScanner.hh"

namespace tsum {

// Two stage path from U1 (CLK1) to U2 (CLK2) with -0.010 slack.
static const char *example_path =
  "Startpoint: U1 (rising edge-triggered flip-flop clocked by CLK1)\n"
  "Endpoint: U2 (rising edge-triggered flip-flop clocked by CLK2)\n"
  "Path Group: reg2reg\n"
  "Path Type: max\n"
  "\n"
  "  Point                                    Incr       Path\n"
  "  -----------------------------------------------------------\n"
  "  clock CLK1 (rise edge)                   0.000      0.000\n"
  "  clock network delay (propagated)         0.500      0.500\n"
  "  U1/CP (DFF)                              0.000      0.500 r\n"
  "  U1/Q (DFF)                               0.100 &    0.600 r\n"
  "  n1 (net)                        1  0.002\n"
  "  U3/ZN (INV)                              0.050 &    0.650 f\n"
  "  U2/D (DFF)                               0.000 &    0.650 f\n"
  "  data arrival time                                   0.650\n"
  "\n"
  "  clock CLK2 (rise edge)                   1.000      1.000\n"
  "  clock network delay (propagated)         0.520      1.520\n"
  "  library setup time                      -0.030      1.490\n"
  "  data required time                                  1.490\n"
  "  -----------------------------------------------------------\n"
  "  data required time                                  0.640\n"
  "  data arrival time                                  -0.650\n"
  "  -----------------------------------------------------------\n"
  "  slack (VIOLATED)                                   -0.010\n";

class PathScannerTest : public ::testing::Test {
protected:
  void SetUp() override {
    interp_ = Tcl_CreateInterp();
    pins_ = new PinClassifier(interp_);
  }
  void TearDown() override {
    delete pins_;
    if (interp_)
      Tcl_DeleteInterp(interp_);
  }

  PathRecordSeq scanPaths(const std::string &text,
                          const PinClassifier *pins) {
    StringLineSource lines(text);
    PathRecordIterator path_iter(&lines, pins, nullptr);
    PathRecordSeq paths;
    while (path_iter.hasNext())
      paths.push_back(path_iter.next());
    return paths;
  }
  PathRecordSeq scanPaths(const std::string &text) {
    return scanPaths(text, pins_);
  }

  Tcl_Interp *interp_;
  PinClassifier *pins_;
};

TEST_F(PathScannerTest, ExamplePath)
{
  PathRecordSeq paths = scanPaths(example_path);
  ASSERT_EQ(paths.size(), 1u);
  const PathRecord &path = paths[0];
  EXPECT_EQ(path.startInst(), "U1");
  EXPECT_EQ(path.startClk(), "CLK1");
  EXPECT_EQ(path.endInst(), "U2");
  EXPECT_EQ(path.endClk(), "CLK2");
  EXPECT_EQ(path.pathGroup(), "reg2reg");
  EXPECT_EQ(path.startPin(), "U1/CP");
  EXPECT_EQ(path.endPin(), "U2/D");
  ASSERT_TRUE(path.hasStartClkDelay());
  EXPECT_DOUBLE_EQ(path.startClkDelay(), 0.5);
  ASSERT_TRUE(path.hasEndClkDelay());
  EXPECT_DOUBLE_EQ(path.endClkDelay(), 0.52);
  ASSERT_TRUE(path.hasSlack());
  EXPECT_DOUBLE_EQ(path.slack(), -0.01);
  EXPECT_TRUE(path.isViolation());
  ASSERT_TRUE(path.hasStageCount());
  EXPECT_EQ(path.stageCount(), 2);
  double skew;
  bool skew_exists;
  path.skew(skew, skew_exists);
  EXPECT_TRUE(skew_exists);
  EXPECT_NEAR(skew, 0.02, 1e-9);
}

TEST_F(PathScannerTest, PathGroupDefault)
{
  std::string text =
    "Startpoint: a/r1 (rising edge-triggered flip-flop clocked by clk)\n"
    "Endpoint: b/r2 (rising edge-triggered flip-flop clocked by clk)\n"
    "  slack (MET)   0.250\n";
  PathRecordSeq paths = scanPaths(text);
  ASSERT_EQ(paths.size(), 1u);
  EXPECT_EQ(paths[0].pathGroup(), "*");
  EXPECT_FALSE(paths[0].isViolation());
  EXPECT_FALSE(paths[0].hasStartClkDelay());
  EXPECT_FALSE(paths[0].hasStageCount());
  // No point table so no end pin.
  EXPECT_FALSE(paths[0].hasEndPin());
}

TEST_F(PathScannerTest, BlockWithoutSlackDropped)
{
  std::string text =
    "Startpoint: u1 (rising edge-triggered flip-flop clocked by clk)\n"
    "Endpoint: u2 (rising edge-triggered flip-flop clocked by clk)\n"
    "Startpoint: u3 (rising edge-triggered flip-flop clocked by clk)\n"
    "Endpoint: u4 (rising edge-triggered flip-flop clocked by clk)\n"
    "  slack (VIOLATED)  -0.100\n";
  StringLineSource lines(text);
  PathRecordIterator path_iter(&lines, pins_, nullptr);
  ASSERT_TRUE(path_iter.hasNext());
  PathRecord path = path_iter.next();
  EXPECT_EQ(path.startInst(), "u3");
  EXPECT_FALSE(path_iter.hasNext());
  EXPECT_EQ(path_iter.scanner().pathCount(), 1u);
  EXPECT_EQ(path_iter.scanner().droppedCount(), 1u);
}

TEST_F(PathScannerTest, SlackWithoutNumberDropped)
{
  std::string text =
    "Startpoint: u1 (rising edge-triggered flip-flop clocked by clk)\n"
    "  slack (VIOLATED)  -0.100\n"
    "  slack (VIOLATED)\n";
  EXPECT_TRUE(scanPaths(text).empty());
}

TEST_F(PathScannerTest, NegativeZeroSlackIsViolation)
{
  std::string text =
    "Startpoint: u1 (rising edge-triggered flip-flop clocked by clk)\n"
    "  slack (VIOLATED)  -0.000\n";
  PathRecordSeq paths = scanPaths(text);
  ASSERT_EQ(paths.size(), 1u);
  EXPECT_DOUBLE_EQ(paths[0].slack(), negative_zero_slack);
  EXPECT_TRUE(paths[0].isViolation());
}

TEST_F(PathScannerTest, PositiveZeroSlackIsNotViolation)
{
  std::string text =
    "Startpoint: u1 (rising edge-triggered flip-flop clocked by clk)\n"
    "  slack (MET)  0.000\n";
  PathRecordSeq paths = scanPaths(text);
  ASSERT_EQ(paths.size(), 1u);
  EXPECT_FALSE(paths[0].isViolation());
}

TEST_F(PathScannerTest, LinesBeforeStartpointIgnored)
{
  std::string text =
    "Report : timing\n"
    "Path Group: early\n"
    "  slack (VIOLATED)  -1.000\n"
    "Startpoint: u1 (rising edge-triggered flip-flop clocked by clk)\n"
    "  slack (VIOLATED)  -0.200\n";
  PathRecordSeq paths = scanPaths(text);
  ASSERT_EQ(paths.size(), 1u);
  EXPECT_EQ(paths[0].pathGroup(), "*");
  EXPECT_DOUBLE_EQ(paths[0].slack(), -0.2);
}

TEST_F(PathScannerTest, StageMarkerRequired)
{
  std::string text =
    "Startpoint: u1 (rising edge-triggered flip-flop clocked by clk)\n"
    "Endpoint: u2 (rising edge-triggered flip-flop clocked by clk)\n"
    "  Point   Incr   Path\n"
    "  u1/Q (DFF)     0.100      0.600 r\n"
    "  u5/Z (BUF)     0.100      0.700 r\n"
    "  data arrival time         0.700\n"
    "  slack (VIOLATED)  -0.100\n";
  PathRecordSeq paths = scanPaths(text);
  ASSERT_EQ(paths.size(), 1u);
  EXPECT_FALSE(paths[0].hasStageCount());
  EXPECT_EQ(paths[0].endPin(), "u2/D");
}

TEST_F(PathScannerTest, NetRowsIgnored)
{
  std::string text =
    "Startpoint: u1 (rising edge-triggered flip-flop clocked by clk)\n"
    "Endpoint: u2 (rising edge-triggered flip-flop clocked by clk)\n"
    "  Point   Incr   Path\n"
    "  u1/Q (DFF)     0.100 &    0.600 r\n"
    "  top/net/Z (net)  &  2\n"
    "  data arrival time         0.700\n"
    "  slack (VIOLATED)  -0.100\n";
  PathRecordSeq paths = scanPaths(text);
  ASSERT_EQ(paths.size(), 1u);
  EXPECT_EQ(paths[0].stageCount(), 1);
}

TEST_F(PathScannerTest, LastDataPinWins)
{
  std::string text =
    "Startpoint: u1 (rising edge-triggered flip-flop clocked by clk)\n"
    "Endpoint: u9 (rising edge-triggered flip-flop clocked by clk)\n"
    "  Point   Incr   Path\n"
    "  u4/D (DFF)     0.000 &    0.600 r\n"
    "  u9/DIN3 (RAM)  0.000 &    0.650 r\n"
    "  data arrival time         0.650\n"
    "  slack (VIOLATED)  -0.100\n";
  PathRecordSeq paths = scanPaths(text);
  ASSERT_EQ(paths.size(), 1u);
  EXPECT_EQ(paths[0].endPin(), "u9/DIN3");
}

TEST_F(PathScannerTest, EndPinFallbackNeedsEndpoint)
{
  std::string text =
    "Startpoint: u1 (rising edge-triggered flip-flop clocked by clk)\n"
    "  Point   Incr   Path\n"
    "  data arrival time         0.650\n"
    "  slack (VIOLATED)  -0.100\n";
  PathRecordSeq paths = scanPaths(text);
  ASSERT_EQ(paths.size(), 1u);
  EXPECT_FALSE(paths[0].hasEndPin());
}

TEST_F(PathScannerTest, FirstLaunchDelayOnly)
{
  std::string text =
    "Startpoint: u1 (rising edge-triggered flip-flop clocked by clk)\n"
    "Endpoint: u2 (rising edge-triggered flip-flop clocked by clk)\n"
    "  Point   Incr   Path\n"
    "  clock network delay (propagated)   0.300   0.300\n"
    "  clock network delay (propagated)   0.900   0.900\n"
    "  data arrival time         0.650\n"
    "  clock network delay (propagated)   0.400   1.400\n"
    "  clock network delay (propagated)   0.800   1.800\n"
    "  slack (VIOLATED)  -0.100\n";
  PathRecordSeq paths = scanPaths(text);
  ASSERT_EQ(paths.size(), 1u);
  EXPECT_DOUBLE_EQ(paths[0].startClkDelay(), 0.3);
  EXPECT_DOUBLE_EQ(paths[0].endClkDelay(), 0.4);
}

TEST_F(PathScannerTest, CaptureDelayNeedsDataArrival)
{
  std::string text =
    "Startpoint: u1 (rising edge-triggered flip-flop clocked by clk)\n"
    "  clock network delay (propagated)   0.300   0.300\n"
    "  slack (VIOLATED)  -0.100\n";
  PathRecordSeq paths = scanPaths(text);
  ASSERT_EQ(paths.size(), 1u);
  EXPECT_FALSE(paths[0].hasStartClkDelay());
  EXPECT_FALSE(paths[0].hasEndClkDelay());
  double skew;
  bool skew_exists;
  paths[0].skew(skew, skew_exists);
  EXPECT_FALSE(skew_exists);
}

TEST_F(PathScannerTest, SlackInsidePointTable)
{
  // Truncated table without a data arrival line.
  std::string text =
    "Startpoint: u1 (rising edge-triggered flip-flop clocked by clk)\n"
    "Endpoint: u2 (rising edge-triggered flip-flop clocked by clk)\n"
    "  Point                                    Incr       Path\n"
    "  u1/Q (DFF)                               0.100 &    0.600 r\n"
    "  slack (VIOLATED)                                   -0.020\n";
  PathRecordSeq paths = scanPaths(text);
  ASSERT_EQ(paths.size(), 1u);
  ASSERT_TRUE(paths[0].hasSlack());
  EXPECT_DOUBLE_EQ(paths[0].slack(), -0.02);
  EXPECT_TRUE(paths[0].isViolation());
  EXPECT_EQ(paths[0].stageCount(), 1);
  EXPECT_FALSE(paths[0].hasEndPin());
}

TEST_F(PathScannerTest, HugeSlack)
{
  std::string text =
    "Startpoint: u1 (rising edge-triggered flip-flop clocked by clk)\n"
    "  Point   Incr   Path\n"
    "  clock network delay (propagated)   1" + std::string(400, '0') + "\n"
    "  slack (VIOLATED)  -" + std::string(400, '9') + "\n";
  PathRecordSeq paths = scanPaths(text);
  ASSERT_EQ(paths.size(), 1u);
  ASSERT_TRUE(paths[0].hasStartClkDelay());
  EXPECT_TRUE(std::isinf(paths[0].startClkDelay()));
  EXPECT_TRUE(paths[0].isViolation());
  EXPECT_TRUE(std::isinf(paths[0].slack()));
}

TEST_F(PathScannerTest, CustomPinPatterns)
{
  PinClassifier pins(".*/OUT", ".*/IN", "", interp_);
  std::string text =
    "Startpoint: u1 (rising edge-triggered flip-flop clocked by clk)\n"
    "Endpoint: u2 (rising edge-triggered flip-flop clocked by clk)\n"
    "  Point   Incr   Path\n"
    "  u1/OUT (X)     0.100      0.600 r\n"
    "  u3/OUT (X)     0.100      0.700 r\n"
    "  u3/Z (X)       0.100 &    0.700 r\n"
    "  u2/IN (X)      0.000      0.700 r\n"
    "  data arrival time         0.700\n"
    "  slack (VIOLATED)  -0.100\n";
  PathRecordSeq paths = scanPaths(text, &pins);
  ASSERT_EQ(paths.size(), 1u);
  EXPECT_EQ(paths[0].stageCount(), 2);
  EXPECT_EQ(paths[0].endPin(), "u2/IN");
}

TEST_F(PathScannerTest, ScannerPhases)
{
  PathScanner scanner(pins_, nullptr);
  PathRecord completed;
  EXPECT_EQ(scanner.phase(), ScanPhase::idle);
  EXPECT_FALSE(scanner.scanLine("Startpoint: u1 (clocked by clk)", completed));
  EXPECT_EQ(scanner.phase(), ScanPhase::header);
  scanner.scanLine("  Point   Incr   Path", completed);
  EXPECT_EQ(scanner.phase(), ScanPhase::point_table);
  scanner.scanLine("  data arrival time   0.1", completed);
  EXPECT_EQ(scanner.phase(), ScanPhase::data_arrival);
  scanner.scanLine("  slack (VIOLATED)   -0.5", completed);
  EXPECT_TRUE(scanner.scanLine("Startpoint: u3 (clocked by clk)", completed));
  EXPECT_EQ(completed.startInst(), "u1");
  EXPECT_DOUBLE_EQ(completed.slack(), -0.5);
  EXPECT_FALSE(scanner.finish(completed));
  EXPECT_EQ(scanner.phase(), ScanPhase::idle);
  EXPECT_EQ(scanner.droppedCount(), 1u);
}

TEST_F(PathScannerTest, DebugTrace)
{
  Report report;
  Debug debug(&report);
  debug.setLevel("scan", 3);
  StringLineSource lines(example_path);
  PathRecordIterator path_iter(&lines, pins_, &debug);
  EXPECT_TRUE(path_iter.hasNext());
  EXPECT_EQ(path_iter.next().stageCount(), 2);
  EXPECT_FALSE(path_iter.hasNext());
}

TEST_F(PathScannerTest, ReadGzipFile)
{
  const char *filename = "/tmp/tsum_test_scan.rpt.gz";
  gzFile stream = gzopen(filename, "wb");
  ASSERT_NE(stream, nullptr);
  gzputs(stream, example_path);
  gzputs(stream, example_path);
  gzclose(stream);
  PathRecordSeq paths = readPathRecords(filename, pins_, nullptr);
  std::remove(filename);
  ASSERT_EQ(paths.size(), 2u);
  EXPECT_EQ(paths[1].endPin(), "U2/D");
  EXPECT_DOUBLE_EQ(paths[1].slack(), -0.01);
}

TEST_F(PathScannerTest, ReadPlainFile)
{
  const char *filename = "/tmp/tsum_test_scan.rpt";
  FILE *stream = fopen(filename, "w");
  ASSERT_NE(stream, nullptr);
  fputs(example_path, stream);
  fclose(stream);
  PathRecordSeq paths = readPathRecords(filename, pins_, nullptr);
  std::remove(filename);
  ASSERT_EQ(paths.size(), 1u);
  EXPECT_EQ(paths[0].pathGroup(), "reg2reg");
}

TEST_F(PathScannerTest, ReadMissingFile)
{
  EXPECT_THROW(readPathRecords("/nonexistent/tsum.rpt", pins_, nullptr),
               FileNotReadable);
}

////////////////////////////////////////////////////////////////

TEST(NumberTest, FindFirstNumber)
{
  double number;
  EXPECT_TRUE(findFirstNumber("  clock network delay (propagated)  0.512  1.512",
                              number));
  EXPECT_DOUBLE_EQ(number, 0.512);
  EXPECT_TRUE(findFirstNumber("x -3 y", number));
  EXPECT_DOUBLE_EQ(number, -3.0);
  EXPECT_FALSE(findFirstNumber("no numbers here", number));
}

TEST(NumberTest, FindLastNumberToken)
{
  std::string token;
  EXPECT_TRUE(findLastNumberToken("slack (VIOLATED)  1.000  -0.123", token));
  EXPECT_EQ(token, "-0.123");
  EXPECT_FALSE(findLastNumberToken("slack (VIOLATED)", token));
}

TEST(NumberTest, ParseSlack)
{
  double slack;
  bool exists;
  parseSlack("  slack (VIOLATED)   -0.042", slack, exists);
  EXPECT_TRUE(exists);
  EXPECT_DOUBLE_EQ(slack, -0.042);
  parseSlack("  slack (MET)   +0.5", slack, exists);
  EXPECT_TRUE(exists);
  EXPECT_DOUBLE_EQ(slack, 0.5);
  parseSlack("  slack (VIOLATED)   -0.000", slack, exists);
  EXPECT_TRUE(exists);
  EXPECT_DOUBLE_EQ(slack, negative_zero_slack);
  EXPECT_LT(slack, 0.0);
  parseSlack("  slack", slack, exists);
  EXPECT_FALSE(exists);
}

TEST(NumberTest, OutOfRange)
{
  std::string huge(400, '9');
  double number;
  EXPECT_TRUE(findFirstNumber(("delay " + huge).c_str(), number));
  EXPECT_TRUE(std::isinf(number));
  EXPECT_GT(number, 0.0);
  double slack;
  bool exists;
  parseSlack(("  slack (VIOLATED)   -" + huge).c_str(), slack, exists);
  EXPECT_TRUE(exists);
  EXPECT_TRUE(std::isinf(slack));
  EXPECT_LT(slack, 0.0);
}

////////////////////////////////////////////////////////////////

TEST(PathRecordTest, Defaults)
{
  PathRecord path("u1", "clk");
  EXPECT_EQ(path.startInst(), "u1");
  EXPECT_EQ(path.startClk(), "clk");
  EXPECT_EQ(path.pathGroup(), PathRecord::path_group_default);
  EXPECT_FALSE(path.hasSlack());
  EXPECT_FALSE(path.isViolation());
  EXPECT_FALSE(path.hasEndPin());
}

TEST(PathRecordTest, RemoveSlack)
{
  PathRecord path;
  path.setSlack(-1.0);
  EXPECT_TRUE(path.isViolation());
  path.removeSlack();
  EXPECT_FALSE(path.hasSlack());
  EXPECT_FALSE(path.isViolation());
}

TEST(PathRecordTest, SkewNeedsBothDelays)
{
  PathRecord path;
  double skew;
  bool exists;
  path.setEndClkDelay(0.7);
  path.skew(skew, exists);
  EXPECT_FALSE(exists);
  path.setStartClkDelay(0.2);
  path.skew(skew, exists);
  EXPECT_TRUE(exists);
  EXPECT_DOUBLE_EQ(skew, 0.5);
}

////////////////////////////////////////////////////////////////

TEST(LineSourceTest, StringLines)
{
  StringLineSource lines("one\r\ntwo\n\nthree");
  std::string line;
  ASSERT_TRUE(lines.readLine(line));
  EXPECT_EQ(line, "one");
  ASSERT_TRUE(lines.readLine(line));
  EXPECT_EQ(line, "two");
  ASSERT_TRUE(lines.readLine(line));
  EXPECT_EQ(line, "");
  ASSERT_TRUE(lines.readLine(line));
  EXPECT_EQ(line, "three");
  EXPECT_EQ(lines.lineNumber(), 4);
  EXPECT_FALSE(lines.readLine(line));
}

TEST(LineSourceTest, StripLineEnd)
{
  std::string line = "text\r\n";
  stripLineEnd(line);
  EXPECT_EQ(line, "text");
  line = "text";
  stripLineEnd(line);
  EXPECT_EQ(line, "text");
}

TEST(LineSourceTest, FileLongLine)
{
  const char *filename = "/tmp/tsum_test_long_line.txt";
  std::string long_line(10000, 'x');
  FILE *stream = fopen(filename, "w");
  ASSERT_NE(stream, nullptr);
  fprintf(stream, "%s\r\nshort\n", long_line.c_str());
  fclose(stream);
  {
    FileLineSource lines(filename);
    EXPECT_STREQ(lines.filename(), filename);
    std::string line;
    ASSERT_TRUE(lines.readLine(line));
    EXPECT_EQ(line, long_line);
    ASSERT_TRUE(lines.readLine(line));
    EXPECT_EQ(line, "short");
    EXPECT_EQ(lines.lineNumber(), 2);
    EXPECT_FALSE(lines.readLine(line));
  }
  std::remove(filename);
}

TEST(LineSourceTest, FileNotReadable)
{
  EXPECT_THROW(FileLineSource("/nonexistent/tsum_lines.txt"), FileNotReadable);
}

} // namespace
