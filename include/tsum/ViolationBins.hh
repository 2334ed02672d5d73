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

// Slack histogram bin (lower, upper] where upper is the edge closer
// to zero. The last bin has no lower edge and holds slack <= upper.
class SlackBin
{
public:
  SlackBin(double upper,
           double lower,
           bool has_lower,
           const string &label);
  bool contains(double slack) const;
  double upper() const { return upper_; }
  double lower() const { return lower_; }
  bool hasLower() const { return has_lower_; }
  const string &label() const { return label_; }

private:
  double upper_;
  double lower_;
  bool has_lower_;
  string label_;
};

// Skew histogram bin [lower, upper).
// The first bin has no lower edge, the last bin has no upper edge.
class SkewBin
{
public:
  SkewBin(double lower,
          bool has_lower,
          double upper,
          bool has_upper,
          const char *label);
  bool contains(double skew) const;
  const string &label() const { return label_; }

private:
  double lower_;
  bool has_lower_;
  double upper_;
  bool has_upper_;
  string label_;
};

typedef std::vector<SlackBin> SlackBinSeq;
typedef std::vector<SkewBin> SkewBinSeq;
typedef std::vector<int> BinCounts;

// 0.000 to -5.000 with finer bins near zero.
const SlackBinSeq &
slackBins();
// Index of the slack bin holding a negative slack, or -1.
int
findSlackBin(double slack);

// < -5.0 to >= +5.0.
const SkewBinSeq &
skewBins();
// Index of the skew bin holding skew, or -1.
int
findSkewBin(double skew);

} // namespace
