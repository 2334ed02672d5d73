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

#include "ReportSummary.hh"

#include "Report.hh"
#include "ViolationBins.hh"
#include "ViolationSummary.hh"

namespace tsum {

static const char *histogram_separator =
  " ------------------------------  --------------------";
static const char *path_group_separator =
  " ------------------------------  --------------------  --------------------  --------------------";
static const char *clock_separator =
  " --------------------  --------------------  --------------------  --------------------  --------------------";
static const char *block_separator =
  " ------------------------------  ------------------------------  --------------------  --------------------  --------------------";

ReportSummary::ReportSummary(const ViolationSummary *summary,
                             Report *report) :
  summary_(summary),
  report_(report)
{
}

void
ReportSummary::reportSummary()
{
  report_->reportBlankLine();
  reportSlackHistogram();
  reportSkewHistogram();
  reportPathGroups();
  reportClocks();
  reportBlocks();
  reportStageCounts();
  reportStartpoints();
}

void
ReportSummary::reportSlackHistogram()
{
  const ViolationStats &total = summary_->total();
  const SlackBinSeq &bins = slackBins();
  const BinCounts &counts = summary_->slackCounts();
  report_->reportLineString(" violation range                      # of violations");
  report_->reportLineString(histogram_separator);
  for (size_t i = 0; i < bins.size(); i++)
    report_->reportLine("%-30s  %21d", bins[i].label().c_str(), counts[i]);
  report_->reportLineString(histogram_separator);
  report_->reportLine(" total%47d", total.count());
  report_->reportLineString(histogram_separator);
  report_->reportLine(" WNS:%48.3f", total.worstSlack());
  report_->reportLine(" TNS:%48.3f", total.totalSlack());
  report_->reportBlankLine();
}

void
ReportSummary::reportSkewHistogram()
{
  const SkewBinSeq &bins = skewBins();
  const BinCounts &counts = summary_->skewCounts();
  report_->reportLineString(" original skew range                  # of violations");
  report_->reportLineString(histogram_separator);
  for (size_t i = 0; i < bins.size(); i++)
    report_->reportLine("%-30s  %21d", bins[i].label().c_str(), counts[i]);
  report_->reportLineString(histogram_separator);
  // Paths without skew are in the total but not the bins.
  report_->reportLine(" total%47d", summary_->total().count());
  report_->reportBlankLine();
}

void
ReportSummary::reportPathGroups()
{
  const ViolationStats &total = summary_->total();
  report_->reportLineString(" path group                           # of violations           worst slack           total slack");
  report_->reportLineString(path_group_separator);
  for (const auto &[path_group, stats] : summary_->pathGroups())
    report_->reportLine(" %-30s  %20d  %20.3f  %20.3f",
                        path_group.c_str(),
                        stats.count(),
                        stats.worstSlack(),
                        stats.totalSlack());
  report_->reportLineString(path_group_separator);
  report_->reportLine(" *%-30s  %20d  %20.3f  %20.3f",
                      "",
                      total.count(),
                      total.worstSlack(),
                      total.totalSlack());
  report_->reportBlankLine();
}

void
ReportSummary::reportClocks()
{
  const ViolationStats &total = summary_->total();
  report_->reportLineString(" startpoint clock      endpoint clock             # of violations           worst slack           total slack");
  report_->reportLineString(clock_separator);
  for (const auto &[clks, stats] : summary_->clocks())
    report_->reportLine(" %-20s%-20s%20d%20.3f%20.3f",
                        clks.first.c_str(),
                        clks.second.c_str(),
                        stats.count(),
                        stats.worstSlack(),
                        stats.totalSlack());
  report_->reportLineString(clock_separator);
  report_->reportLine(" %-21s%-20s%20d%20.3f%20.3f",
                      "*", "*",
                      total.count(),
                      total.worstSlack(),
                      total.totalSlack());
  report_->reportBlankLine();
}

void
ReportSummary::reportBlocks()
{
  const ViolationStats &total = summary_->total();
  report_->reportLineString(" startpoint block                endpoint block                       # of violations           worst slack           total slack");
  report_->reportLineString(block_separator);
  for (const auto &[blocks, stats] : summary_->blocks())
    report_->reportLine(" %-30s%-30s%20d%20.3f%20.3f",
                        blocks.first.c_str(),
                        blocks.second.c_str(),
                        stats.count(),
                        stats.worstSlack(),
                        stats.totalSlack());
  report_->reportLineString(block_separator);
  report_->reportLine(" %-31s%-31s%20d%20.3f%20.3f",
                      "*", "*",
                      total.count(),
                      total.worstSlack(),
                      total.totalSlack());
  report_->reportBlankLine();
}

void
ReportSummary::reportStageCounts()
{
  report_->reportLineString(" stage count                          # of violations");
  report_->reportLineString(histogram_separator);
  for (const auto &[stage_count, stats] : summary_->stages())
    report_->reportLine("%31d%22d", stage_count, stats.count());
  report_->reportLineString(histogram_separator);
  report_->reportLine(" total%47d", summary_->total().count());
  report_->reportBlankLine();
}

void
ReportSummary::reportStartpoints()
{
  report_->reportLineString("<# of violations>\t<startpoint> <slack> (<stage_count>) (<clock>:<clock_network_delay>)");
  report_->reportLineString("\t\t\t<endpoint>   <slack> (<stage_count>) (<clock>:<clock_network_delay>) (<skew>)");
  report_->reportBlankLine();
  for (const StartpointViolations &startpoint : summary_->startpoints())
    reportStartpoint(startpoint);
}

// Zero for missing values and negative zero.
static double
zeroIfMissing(double value,
              bool exists)
{
  return (exists && value != 0.0) ? value : 0.0;
}

void
ReportSummary::reportStartpoint(const StartpointViolations &startpoint)
{
  report_->reportLine("%zu\t%s %.3f (%d) (%s:%.3f)",
                      startpoint.violationCount(),
                      startpoint.startPin().c_str(),
                      startpoint.worstSlack(),
                      startpoint.maxStageCount(),
                      startpoint.startClk().c_str(),
                      startpoint.startClkDelay());
  for (const PathRecord *path : startpoint.paths()) {
    string end_pin = path->hasEndPin()
      ? path->endPin()
      : path->endInst() + "/D";
    double skew;
    bool skew_exists;
    path->skew(skew, skew_exists);
    report_->reportLine("\t%s %.3f (%d) (%s:%.3f) (%.3f)",
                        end_pin.c_str(),
                        path->slack(),
                        path->hasStageCount() ? path->stageCount() : 0,
                        path->endClk().c_str(),
                        zeroIfMissing(path->endClkDelay(), path->hasEndClkDelay()),
                        zeroIfMissing(skew, skew_exists));
  }
}

////////////////////////////////////////////////////////////////

std::string
reportSummaryString(const ViolationSummary *summary,
                    Report *report)
{
  ReportSummary report_summary(summary, report);
  report->redirectStringBegin();
  report_summary.reportSummary();
  return report->redirectStringEnd();
}

} // namespace
