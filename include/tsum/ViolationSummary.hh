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
#include <string>
#include <utility>
#include <vector>

#include "PathRecord.hh"
#include "ViolationBins.hh"

namespace tsum {

class BlockMap;
class PathRecordIterator;

// Violation count, worst slack and total negative slack
// of a set of violating paths.
class ViolationStats
{
public:
  ViolationStats();
  void addSlack(double slack);
  int count() const { return count_; }
  // Minimum slack, 0.0 without violations.
  double worstSlack() const;
  double totalSlack() const { return total_slack_; }

private:
  int count_;
  double worst_slack_;
  double total_slack_;
};

typedef std::pair<string, string> NamePair;
typedef std::map<string, ViolationStats> NameViolationMap;
typedef std::map<NamePair, ViolationStats> NamePairViolationMap;
typedef std::map<int, ViolationStats> StageViolationMap;

// Violations that share a startpoint pin.
class StartpointViolations
{
public:
  explicit StartpointViolations(const string &start_pin);
  void addPath(const PathRecord *path);
  // Worst slack first.
  void sortPaths();
  const string &startPin() const { return start_pin_; }
  // Launch clock of the first path added.
  const string &startClk() const { return start_clk_; }
  size_t violationCount() const { return paths_.size(); }
  double worstSlack() const;
  // Paths without a stage count count as zero.
  int maxStageCount() const;
  // First launch clock network delay in the order paths were added,
  // 0.0 if there is none.
  double startClkDelay() const { return start_clk_delay_; }
  const ConstPathRecordSeq &paths() const { return paths_; }

private:
  string start_pin_;
  string start_clk_;
  double start_clk_delay_;
  bool start_clk_delay_exists_;
  ConstPathRecordSeq paths_;
};

typedef std::vector<StartpointViolations> StartpointViolationsSeq;

// Paths with negative slack.
PathRecordSeq
findViolations(PathRecordIterator &path_iter);

// Reductions over a set of violating paths.
BinCounts
slackHistogram(const PathRecordSeq &violations);
// Paths without a skew are not counted.
BinCounts
skewHistogram(const PathRecordSeq &violations);
ViolationStats
totalViolations(const PathRecordSeq &violations);
NameViolationMap
pathGroupViolations(const PathRecordSeq &violations);
// Startpoint clock, endpoint clock.
NamePairViolationMap
clockViolations(const PathRecordSeq &violations);
// Startpoint block, endpoint block.
NamePairViolationMap
blockViolations(const PathRecordSeq &violations,
                const BlockMap *block_map);
// Paths without a stage count are not counted.
StageViolationMap
stageViolations(const PathRecordSeq &violations);
// Most violations first, then worst slack first.
StartpointViolationsSeq
startpointViolations(const PathRecordSeq &violations);

// Summary tables of the violating paths in a report.
class ViolationSummary
{
public:
  // Paths without negative slack are ignored.
  ViolationSummary(const PathRecordSeq &paths,
                   const BlockMap *block_map);
  ViolationSummary(const ViolationSummary &) = delete;
  ViolationSummary &operator=(const ViolationSummary &) = delete;
  const PathRecordSeq &violations() const { return violations_; }
  const BinCounts &slackCounts() const { return slack_counts_; }
  const BinCounts &skewCounts() const { return skew_counts_; }
  const ViolationStats &total() const { return total_; }
  const NameViolationMap &pathGroups() const { return path_groups_; }
  const NamePairViolationMap &clocks() const { return clocks_; }
  const NamePairViolationMap &blocks() const { return blocks_; }
  const StageViolationMap &stages() const { return stages_; }
  const StartpointViolationsSeq &startpoints() const { return startpoints_; }

private:
  PathRecordSeq violations_;
  BinCounts slack_counts_;
  BinCounts skew_counts_;
  ViolationStats total_;
  NameViolationMap path_groups_;
  NamePairViolationMap clocks_;
  NamePairViolationMap blocks_;
  StageViolationMap stages_;
  // References paths in violations_.
  StartpointViolationsSeq startpoints_;
};

} // namespace
