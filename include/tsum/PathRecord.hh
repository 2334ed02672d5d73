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

#include <string>
#include <vector>

namespace tsum {

using std::string;

// One timing path reconstructed from a report path block.
// Delays, slack and stage count are optional; each has an exists
// predicate that must be checked before the value is used.
class PathRecord
{
public:
  PathRecord();
  PathRecord(const string &start_inst,
             const string &start_clk);

  const string &startInst() const { return start_inst_; }
  const string &startClk() const { return start_clk_; }
  const string &endInst() const { return end_inst_; }
  const string &endClk() const { return end_clk_; }
  void setEndpoint(const string &end_inst,
                   const string &end_clk);
  const string &pathGroup() const { return path_group_; }
  void setPathGroup(const string &path_group);

  // instance/CP
  const string &startPin() const { return start_pin_; }
  void setStartPin(const string &pin);
  // instance/Dx
  const string &endPin() const { return end_pin_; }
  bool hasEndPin() const { return !end_pin_.empty(); }
  void setEndPin(const string &pin);

  // Launch clock network delay.
  double startClkDelay() const { return start_clk_delay_; }
  bool hasStartClkDelay() const { return start_clk_delay_exists_; }
  void setStartClkDelay(double delay);
  // Capture clock network delay.
  double endClkDelay() const { return end_clk_delay_; }
  bool hasEndClkDelay() const { return end_clk_delay_exists_; }
  void setEndClkDelay(double delay);

  double slack() const { return slack_; }
  bool hasSlack() const { return slack_exists_; }
  void setSlack(double slack);
  void removeSlack();
  // Negative slack.
  bool isViolation() const { return slack_exists_ && slack_ < 0.0; }

  int stageCount() const { return stage_count_; }
  bool hasStageCount() const { return stage_count_exists_; }
  void setStageCount(int count);

  // Capture minus launch clock network delay.
  // Only exists when both delays exist.
  void skew(// Return values.
            double &skew,
            bool &exists) const;

  // Path group of paths without a "Path Group:" line.
  static const char *path_group_default;

private:
  string start_inst_;
  string start_clk_;
  string end_inst_;
  string end_clk_;
  string path_group_;
  string start_pin_;
  string end_pin_;
  double start_clk_delay_;
  double end_clk_delay_;
  double slack_;
  int stage_count_;
  bool start_clk_delay_exists_;
  bool end_clk_delay_exists_;
  bool slack_exists_;
  bool stage_count_exists_;
};

typedef std::vector<PathRecord> PathRecordSeq;
typedef std::vector<const PathRecord*> ConstPathRecordSeq;

} // namespace
