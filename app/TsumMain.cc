// TimingSummary, Static Timing Report Summary
// Copyright (c) 2025, Parallax Software, Inc.
// 
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
// 
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
// GNU General Public License for more details.
// 
// You should have received a copy of the GNU General Public License
// along with this program. If not, see <https://www.gnu.org/licenses/>.
// 
// The origin of this software must not be misrepresented; you must not
// claim that you wrote the original software.
// 
// Altered source versions must be plainly marked as such, and must not be
// misrepresented as being the original software.
// 
// This notice may not be removed or altered from any source distribution.

#include "TsumMain.hh"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include "TsumConfig.hh" // TSUM_VERSION
#include "StringUtil.hh"
#include "Error.hh"
#include "Report.hh"
#include "Debug.hh"
#include "LineSource.hh"
#include "PinClassifier.hh"
#include "PathScanner.hh"
#include "BlockMap.hh"
#include "ViolationSummary.hh"
#include "ReportSummary.hh"
#include "PathGroupTotals.hh"

namespace tsum {

typedef std::vector<const char*> ArgSeq;

static void
findCmdLineKeys(int &argc,
                char *argv[],
                const char *key,
                // Return value.
                ArgSeq &values);
static string
violationSummaryText(const char *filename,
                     const BlockMap *block_map,
                     const PinClassifier *pins,
                     Report *report,
                     Debug *debug);
static string
pathGroupTotalsText(const char *filename,
                    Report *report);
static void
writeSummary(const string &text,
             const char *output_filename,
             Report *report);

int
tsumMain(int argc,
         char *argv[],
         Report *report,
         Debug *debug,
         Tcl_Interp *interp)
{
  const char *prog = argv[0];
  if (findCmdLineFlag(argc, argv, "-help")) {
    showUsage(prog, report);
    return EXIT_SUCCESS;
  }
  if (findCmdLineFlag(argc, argv, "-version")) {
    report->reportLineString(TSUM_VERSION);
    return EXIT_SUCCESS;
  }

  try {
    bool totals = findCmdLineFlag(argc, argv, "-totals");
    const char *output_filename = findCmdLineKey(argc, argv, "-output");
    const char *output_pins = findCmdLineKey(argc, argv, "-output_pins");
    const char *data_pins = findCmdLineKey(argc, argv, "-data_pins");
    const char *stage_marker = findCmdLineKey(argc, argv, "-stage_marker");
    ArgSeq block_map_args, block_map_files, debug_args;
    findCmdLineKeys(argc, argv, "-block_map", block_map_args);
    findCmdLineKeys(argc, argv, "-block_map_file", block_map_files);
    findCmdLineKeys(argc, argv, "-debug", debug_args);

    if (argc != 2 || argv[1][0] == '-') {
      showUsage(prog, report);
      return EXIT_FAILURE;
    }
    const char *filename = argv[1];

    for (const char *debug_arg : debug_args)
      parseDebugArg(debug_arg, report, debug);

    string text;
    if (totals)
      text = pathGroupTotalsText(filename, report);
    else {
      BlockMap block_map(report, debug);
      for (const char *arg : block_map_args)
        block_map.addRuleArg(arg);
      for (const char *block_map_file : block_map_files)
        block_map.readRuleFile(block_map_file);
      block_map.sortRules();

      PinClassifier pins(output_pins ? output_pins : PinClassifier::output_pins_default,
                         data_pins ? data_pins : PinClassifier::data_pins_default,
                         stage_marker ? stage_marker : PinClassifier::stage_marker_default,
                         interp);
      text = violationSummaryText(filename, &block_map, &pins, report, debug);
    }
    writeSummary(text, output_filename, report);
  }
  catch (Exception &error) {
    string msg = stdstrPrint("Error: %s\n", error.what());
    report->printError(msg.c_str(), msg.size());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}

static string
violationSummaryText(const char *filename,
                     const BlockMap *block_map,
                     const PinClassifier *pins,
                     Report *report,
                     Debug *debug)
{
  PathRecordSeq paths = readPathRecords(filename, pins, debug);
  ViolationSummary summary(paths, block_map);
  debugPrint(debug, "summary", 1, "%zu violations of %zu paths",
             summary.violations().size(),
             paths.size());
  debugPrint(debug, "summary", 1, "%zu path groups %zu startpoints",
             summary.pathGroups().size(),
             summary.startpoints().size());
  return reportSummaryString(&summary, report);
}

static string
pathGroupTotalsText(const char *filename,
                    Report *report)
{
  FileLineSource lines(filename);
  PathGroupTotals totals;
  totals.readLines(&lines);
  report->redirectStringBegin();
  reportPathGroupTotals(totals, report);
  return report->redirectStringEnd();
}

// The whole summary is built before anything is written so an error
// leaves no partial output.
static void
writeSummary(const string &text,
             const char *output_filename,
             Report *report)
{
  if (output_filename) {
    report->redirectFileBegin(output_filename);
    report->printString(text.c_str(), text.size());
    report->redirectFileEnd();
  }
  else
    report->printString(text.c_str(), text.size());
}

void
showUsage(const char *prog,
          Report *report)
{
  report->reportLine("Usage: %s [-help] [-version] [-totals] [-output file]", prog);
  report->reportLine("       [-block_map prefix=name]... [-block_map_file file]...");
  report->reportLine("       [-output_pins regexp] [-data_pins regexp] [-stage_marker text]");
  report->reportLine("       [-debug what[=level]]... report_file");
  report->reportLine("  -help                    show help and exit");
  report->reportLine("  -version                 show version and exit");
  report->reportLine("  -totals                  report per path group totals of all paths");
  report->reportLine("  -output file             write the summary to file instead of stdout");
  report->reportLine("  -block_map prefix=name   map instances under prefix to block name");
  report->reportLine("  -block_map_file file     read 'prefix -> name' block map rules");
  report->reportLine("  -output_pins regexp      stage output pins (default %s)",
                     PinClassifier::output_pins_default);
  report->reportLine("  -data_pins regexp        endpoint data pins (default %s)",
                     PinClassifier::data_pins_default);
  report->reportLine("  -stage_marker text       sensitized stage marker (default %s)",
                     PinClassifier::stage_marker_default);
  report->reportLine("  -debug what[=level]      debug trace for scan, block_map or summary");
  report->reportLine("  report_file              plain or gzip'd timing report");
}

bool
findCmdLineFlag(int &argc,
                char *argv[],
                const char *flag)
{
  for (int i = 1; i < argc; i++) {
    char *arg = argv[i];
    if (stringEq(arg, flag)) {
      // remove flag from argv.
      for (int j = i + 1; j < argc; j++, i++)
        argv[i] = argv[j];
      argc--;
      return true;
    }
  }
  return false;
}

char *
findCmdLineKey(int &argc,
               char *argv[],
               const char *key)
{
  for (int i = 1; i < argc; i++) {
    char *arg = argv[i];
    if (stringEq(arg, key) && i + 1 < argc) {
      char *value = argv[i + 1];
      // remove key and value from argv.
      for (int j = i + 2; j < argc; j++, i++)
        argv[i] = argv[j];
      argc -= 2;
      return value;
    }
  }
  return nullptr;
}

// Repeated keys in command line order.
static void
findCmdLineKeys(int &argc,
                char *argv[],
                const char *key,
                ArgSeq &values)
{
  const char *value;
  while ((value = findCmdLineKey(argc, argv, key)))
    values.push_back(value);
}

void
parseDebugArg(const char *arg,
              Report *report,
              Debug *debug)
{
  string what = arg;
  int level = 1;
  size_t equal = what.find('=');
  if (equal != string::npos) {
    string level_arg = what.substr(equal + 1);
    what = what.substr(0, equal);
    if (level_arg.empty() || !isDigits(level_arg.c_str()))
      report->error(300, "-debug level must be a positive integer, got '%s'.",
                    arg);
    level = atoi(level_arg.c_str());
  }
  if (what.empty())
    report->error(301, "-debug expects what[=level], got '%s'.", arg);
  debug->setLevel(what.c_str(), level);
}

} // namespace
