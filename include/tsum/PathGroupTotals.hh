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

#pragma once

#include <map>
#include <regex>
#include <string>
#include <vector>

namespace tsum {

using std::string;

class LineSource;
class Report;

typedef std::map<string, int> PathTypeCountMap;

// Path count and slack totals of a group of report paths.
class PathTotals
{
public:
  PathTotals();
  void addPath();
  void addSlack(double slack);
  void addPathType(const string &path_type);
  // Startpoints seen, or the number of slacks without startpoints.
  int pathCount() const;
  bool hasSlack() const { return !slacks_.empty(); }
  // Minimum slack. Requires hasSlack().
  double worstSlack() const;
  // Maximum slack. Requires hasSlack().
  double bestSlack() const;
  // Sum of the negative slacks.
  double totalNegativeSlack() const;
  int violationCount() const;
  const PathTypeCountMap &pathTypes() const { return path_types_; }

private:
  int path_count_;
  std::vector<double> slacks_;
  PathTypeCountMap path_types_;
};

typedef std::map<string, PathTotals> PathGroupTotalsMap;

// Coarse per path group totals of a timing report.
class PathGroupTotals
{
public:
  PathGroupTotals();
  void readLines(LineSource *lines);
  void scanLine(const char *line);
  const PathTotals &overall() const { return overall_; }
  const PathGroupTotalsMap &groups() const { return groups_; }

  static const char *path_group_unspecified;

private:
  PathTotals &currentGroup();

  PathTotals overall_;
  PathGroupTotalsMap groups_;
  string current_group_;

  const std::regex path_group_regexp_;
  const std::regex path_type_regexp_;
  const std::regex slack_regexp_;
};

void
reportPathGroupTotals(const PathGroupTotals &totals,
                      Report *report);

} // namespace
