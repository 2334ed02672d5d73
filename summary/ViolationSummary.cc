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

#include "ViolationSummary.hh"

#include <algorithm>

#include "BlockMap.hh"
#include "PathScanner.hh"

namespace tsum {

ViolationStats::ViolationStats() :
  count_(0),
  worst_slack_(0.0),
  total_slack_(0.0)
{
}

void
ViolationStats::addSlack(double slack)
{
  if (count_ == 0 || slack < worst_slack_)
    worst_slack_ = slack;
  total_slack_ += slack;
  count_++;
}

double
ViolationStats::worstSlack() const
{
  return count_ ? worst_slack_ : 0.0;
}

////////////////////////////////////////////////////////////////

StartpointViolations::StartpointViolations(const string &start_pin) :
  start_pin_(start_pin),
  start_clk_delay_(0.0),
  start_clk_delay_exists_(false)
{
}

void
StartpointViolations::addPath(const PathRecord *path)
{
  // Launch clock and delay come from the report order, not slack order.
  if (paths_.empty())
    start_clk_ = path->startClk();
  if (!start_clk_delay_exists_ && path->hasStartClkDelay()) {
    start_clk_delay_ = path->startClkDelay();
    start_clk_delay_exists_ = true;
  }
  paths_.push_back(path);
}

void
StartpointViolations::sortPaths()
{
  std::stable_sort(paths_.begin(), paths_.end(),
                   [] (const PathRecord *path1,
                       const PathRecord *path2) {
                     return path1->slack() < path2->slack();
                   });
}

double
StartpointViolations::worstSlack() const
{
  double worst_slack = 0.0;
  bool first = true;
  for (const PathRecord *path : paths_) {
    if (first || path->slack() < worst_slack)
      worst_slack = path->slack();
    first = false;
  }
  return worst_slack;
}

int
StartpointViolations::maxStageCount() const
{
  int max_stages = 0;
  for (const PathRecord *path : paths_) {
    if (path->hasStageCount())
      max_stages = std::max(max_stages, path->stageCount());
  }
  return max_stages;
}

////////////////////////////////////////////////////////////////

PathRecordSeq
findViolations(PathRecordIterator &path_iter)
{
  PathRecordSeq violations;
  while (path_iter.hasNext()) {
    PathRecord path = path_iter.next();
    if (path.isViolation())
      violations.push_back(path);
  }
  return violations;
}

BinCounts
slackHistogram(const PathRecordSeq &violations)
{
  BinCounts counts(slackBins().size(), 0);
  for (const PathRecord &path : violations) {
    int bin = findSlackBin(path.slack());
    if (bin >= 0)
      counts[bin]++;
  }
  return counts;
}

BinCounts
skewHistogram(const PathRecordSeq &violations)
{
  BinCounts counts(skewBins().size(), 0);
  for (const PathRecord &path : violations) {
    double skew;
    bool exists;
    path.skew(skew, exists);
    if (exists) {
      int bin = findSkewBin(skew);
      if (bin >= 0)
        counts[bin]++;
    }
  }
  return counts;
}

ViolationStats
totalViolations(const PathRecordSeq &violations)
{
  ViolationStats total;
  for (const PathRecord &path : violations)
    total.addSlack(path.slack());
  return total;
}

NameViolationMap
pathGroupViolations(const PathRecordSeq &violations)
{
  NameViolationMap path_groups;
  for (const PathRecord &path : violations)
    path_groups[path.pathGroup()].addSlack(path.slack());
  return path_groups;
}

NamePairViolationMap
clockViolations(const PathRecordSeq &violations)
{
  NamePairViolationMap clocks;
  for (const PathRecord &path : violations) {
    NamePair key(path.startClk(), path.endClk());
    clocks[key].addSlack(path.slack());
  }
  return clocks;
}

NamePairViolationMap
blockViolations(const PathRecordSeq &violations,
                const BlockMap *block_map)
{
  NamePairViolationMap blocks;
  for (const PathRecord &path : violations) {
    NamePair key(block_map->blockName(path.startInst()),
                 block_map->blockName(path.endInst()));
    blocks[key].addSlack(path.slack());
  }
  return blocks;
}

StageViolationMap
stageViolations(const PathRecordSeq &violations)
{
  StageViolationMap stages;
  for (const PathRecord &path : violations) {
    if (path.hasStageCount())
      stages[path.stageCount()].addSlack(path.slack());
  }
  return stages;
}

StartpointViolationsSeq
startpointViolations(const PathRecordSeq &violations)
{
  // Startpoints in the order they are first seen.
  StartpointViolationsSeq startpoints;
  std::map<string, size_t> startpoint_index;
  for (const PathRecord &path : violations) {
    string start_pin = path.startPin().empty()
      ? path.startInst() + "/CP"
      : path.startPin();
    auto index_iter = startpoint_index.find(start_pin);
    if (index_iter == startpoint_index.end()) {
      startpoint_index[start_pin] = startpoints.size();
      startpoints.push_back(StartpointViolations(start_pin));
      startpoints.back().addPath(&path);
    }
    else
      startpoints[index_iter->second].addPath(&path);
  }
  for (StartpointViolations &startpoint : startpoints)
    startpoint.sortPaths();
  std::stable_sort(startpoints.begin(), startpoints.end(),
                   [] (const StartpointViolations &startpoint1,
                       const StartpointViolations &startpoint2) {
                     size_t count1 = startpoint1.violationCount();
                     size_t count2 = startpoint2.violationCount();
                     return count1 > count2
                       || (count1 == count2
                           && startpoint1.worstSlack() < startpoint2.worstSlack());
                   });
  return startpoints;
}

////////////////////////////////////////////////////////////////

static PathRecordSeq
filterViolations(const PathRecordSeq &paths)
{
  PathRecordSeq violations;
  for (const PathRecord &path : paths) {
    if (path.isViolation())
      violations.push_back(path);
  }
  return violations;
}

ViolationSummary::ViolationSummary(const PathRecordSeq &paths,
                                   const BlockMap *block_map) :
  violations_(filterViolations(paths)),
  slack_counts_(slackHistogram(violations_)),
  skew_counts_(skewHistogram(violations_)),
  total_(totalViolations(violations_)),
  path_groups_(pathGroupViolations(violations_)),
  clocks_(clockViolations(violations_)),
  blocks_(blockViolations(violations_, block_map)),
  stages_(stageViolations(violations_)),
  startpoints_(startpointViolations(violations_))
{
}

} // namespace
