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

#include "PathRecord.hh"

namespace tsum {

const char *PathRecord::path_group_default = "*";

PathRecord::PathRecord() :
  path_group_(path_group_default),
  start_clk_delay_(0.0),
  end_clk_delay_(0.0),
  slack_(0.0),
  stage_count_(0),
  start_clk_delay_exists_(false),
  end_clk_delay_exists_(false),
  slack_exists_(false),
  stage_count_exists_(false)
{
}

PathRecord::PathRecord(const string &start_inst,
                       const string &start_clk) :
  PathRecord()
{
  start_inst_ = start_inst;
  start_clk_ = start_clk;
}

void
PathRecord::setEndpoint(const string &end_inst,
                        const string &end_clk)
{
  end_inst_ = end_inst;
  end_clk_ = end_clk;
}

void
PathRecord::setPathGroup(const string &path_group)
{
  path_group_ = path_group;
}

void
PathRecord::setStartPin(const string &pin)
{
  start_pin_ = pin;
}

void
PathRecord::setEndPin(const string &pin)
{
  end_pin_ = pin;
}

void
PathRecord::setStartClkDelay(double delay)
{
  start_clk_delay_ = delay;
  start_clk_delay_exists_ = true;
}

void
PathRecord::setEndClkDelay(double delay)
{
  end_clk_delay_ = delay;
  end_clk_delay_exists_ = true;
}

void
PathRecord::setSlack(double slack)
{
  slack_ = slack;
  slack_exists_ = true;
}

void
PathRecord::removeSlack()
{
  slack_ = 0.0;
  slack_exists_ = false;
}

void
PathRecord::setStageCount(int count)
{
  stage_count_ = count;
  stage_count_exists_ = true;
}

void
PathRecord::skew(// Return values.
                 double &skew,
                 bool &exists) const
{
  exists = start_clk_delay_exists_ && end_clk_delay_exists_;
  skew = exists ? end_clk_delay_ - start_clk_delay_ : 0.0;
}

} // namespace
