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

#include "PathGroupTotals.hh"

#include <algorithm>
#include <cstdlib>

#include "Report.hh"
#include "StringUtil.hh"
#include "LineSource.hh"

namespace tsum {

PathTotals::PathTotals() :
  path_count_(0)
{
}

void
PathTotals::addPath()
{
  path_count_++;
}

void
PathTotals::addSlack(double slack)
{
  slacks_.push_back(slack);
}

void
PathTotals::addPathType(const string &path_type)
{
  path_types_[path_type]++;
}

int
PathTotals::pathCount() const
{
  if (path_count_)
    return path_count_;
  return static_cast<int>(slacks_.size());
}

double
PathTotals::worstSlack() const
{
  return *std::min_element(slacks_.begin(), slacks_.end());
}

double
PathTotals::bestSlack() const
{
  return *std::max_element(slacks_.begin(), slacks_.end());
}

double
PathTotals::totalNegativeSlack() const
{
  double total = 0.0;
  for (double slack : slacks_) {
    if (slack < 0.0)
      total += slack;
  }
  return total;
}

int
PathTotals::violationCount() const
{
  int count = 0;
  for (double slack : slacks_) {
    if (slack < 0.0)
      count++;
  }
  return count;
}

////////////////////////////////////////////////////////////////

const char *PathGroupTotals::path_group_unspecified = "UNSPECIFIED";

PathGroupTotals::PathGroupTotals() :
  current_group_(path_group_unspecified),
  path_group_regexp_("^Path Group:\\s*(.+)"),
  path_type_regexp_("^Path Type:\\s*(.+)"),
  slack_regexp_("\\bslack\\b[^-+\\d]*([-+]?\\d+(?:\\.\\d+)?)")
{
}

void
PathGroupTotals::readLines(LineSource *lines)
{
  string line;
  while (lines->readLine(line))
    scanLine(line.c_str());
}

PathTotals &
PathGroupTotals::currentGroup()
{
  return groups_[current_group_];
}

void
PathGroupTotals::scanLine(const char *line)
{
  std::cmatch matches;
  if (std::regex_search(line, matches, path_group_regexp_)) {
    current_group_ = trim(matches[1].str());
    if (current_group_.empty())
      current_group_ = path_group_unspecified;
    currentGroup();
  }
  else if (std::regex_search(line, matches, path_type_regexp_)) {
    string path_type = trim(matches[1].str());
    overall_.addPathType(path_type);
    currentGroup().addPathType(path_type);
  }
  else if (stringBeginEq(line, "Startpoint:")) {
    overall_.addPath();
    currentGroup().addPath();
  }
  else if (std::regex_search(line, matches, slack_regexp_)) {
    double slack = strtod(matches[1].str().c_str(), nullptr);
    overall_.addSlack(slack);
    currentGroup().addSlack(slack);
  }
}

////////////////////////////////////////////////////////////////

static string
worstSlackString(const PathTotals &totals)
{
  if (totals.hasSlack())
    return stdstrPrint("%.3f", totals.worstSlack());
  return "n/a";
}

static string
bestSlackString(const PathTotals &totals)
{
  if (totals.hasSlack())
    return stdstrPrint("%.3f", totals.bestSlack());
  return "n/a";
}

void
reportPathGroupTotals(const PathGroupTotals &totals,
                      Report *report)
{
  const PathTotals &overall = totals.overall();
  report->reportLineString("Summary");
  report->reportLineString("=======");
  report->reportLine("Total paths: %d", overall.pathCount());
  report->reportLine("Worst slack (WNS): %s",
                     worstSlackString(overall).c_str());
  report->reportLine("Total negative slack (TNS): %.3f",
                     overall.totalNegativeSlack());
  report->reportLine("Violations: %d", overall.violationCount());
  report->reportLine("Best slack: %s", bestSlackString(overall).c_str());
  if (!overall.pathTypes().empty()) {
    report->reportLineString("Path types:");
    for (const auto &[path_type, count] : overall.pathTypes())
      report->reportLine("  - %s: %d", path_type.c_str(), count);
  }

  report->reportBlankLine();
  report->reportLineString("Per Path Group");
  report->reportLineString("--------------");
  report->reportLine("%-24s %8s %10s %12s %11s %11s",
                     "Group", "Paths", "WNS", "TNS", "Violations", "Best");
  report->reportLineString(string(80, '-'));
  for (const auto &[group, group_totals] : totals.groups()) {
    string tns = stdstrPrint("%.3f", group_totals.totalNegativeSlack());
    report->reportLine("%-24.24s %8d %10s %12s %11d %11s",
                       group.c_str(),
                       group_totals.pathCount(),
                       worstSlackString(group_totals).c_str(),
                       tns.c_str(),
                       group_totals.violationCount(),
                       bestSlackString(group_totals).c_str());
  }
}

} // namespace
