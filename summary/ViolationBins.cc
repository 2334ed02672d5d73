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

#include "ViolationBins.hh"

#include "StringUtil.hh"

namespace tsum {

SlackBin::SlackBin(double upper,
                   double lower,
                   bool has_lower,
                   const string &label) :
  upper_(upper),
  lower_(lower),
  has_lower_(has_lower),
  label_(label)
{
}

bool
SlackBin::contains(double slack) const
{
  if (has_lower_)
    return slack <= upper_ && slack > lower_;
  else
    return slack <= upper_;
}

static SlackBinSeq
makeSlackBins()
{
  static const double edges[] = {
    -0.000, -0.002, -0.004, -0.006, -0.008, -0.010,
    -0.015, -0.020, -0.030, -0.040, -0.050, -0.060,
    -0.070, -0.080, -0.090, -0.100, -0.110, -0.120,
    -0.130, -0.140, -0.150, -0.160, -0.170, -0.180,
    -0.190, -0.200, -0.300, -0.400, -0.500, -1.000,
    -2.000, -5.000
  };
  const size_t edge_count = sizeof(edges) / sizeof(edges[0]);
  SlackBinSeq bins;
  for (size_t i = 0; i + 1 < edge_count; i++) {
    double upper = edges[i];
    double lower = edges[i + 1];
    bins.push_back(SlackBin(upper, lower, true,
                            stdstrPrint(" %.3fns < %.3fns", upper, lower)));
  }
  bins.push_back(SlackBin(edges[edge_count - 1], 0.0, false, " -5.000ns <"));
  return bins;
}

const SlackBinSeq &
slackBins()
{
  static const SlackBinSeq bins = makeSlackBins();
  return bins;
}

int
findSlackBin(double slack)
{
  if (slack >= 0.0)
    return -1;
  const SlackBinSeq &bins = slackBins();
  for (size_t i = 0; i < bins.size(); i++) {
    if (bins[i].contains(slack))
      return static_cast<int>(i);
  }
  return -1;
}

////////////////////////////////////////////////////////////////

SkewBin::SkewBin(double lower,
                 bool has_lower,
                 double upper,
                 bool has_upper,
                 const char *label) :
  lower_(lower),
  has_lower_(has_lower),
  upper_(upper),
  has_upper_(has_upper),
  label_(label)
{
}

bool
SkewBin::contains(double skew) const
{
  return (!has_lower_ || skew >= lower_)
    && (!has_upper_ || skew < upper_);
}

static SkewBinSeq
makeSkewBins()
{
  SkewBinSeq bins;
  bins.push_back(SkewBin(0.0, false, -5.0, true, "        < -5.0ns"));
  bins.push_back(SkewBin(-5.0, true, -2.0, true, " -5.0ns < -2.0ns"));
  bins.push_back(SkewBin(-2.0, true, -1.0, true, " -2.0ns < -1.0ns"));
  bins.push_back(SkewBin(-1.0, true, -0.5, true, " -1.0ns < -0.5ns"));
  bins.push_back(SkewBin(-0.5, true, -0.2, true, " -0.5ns < -0.2ns"));
  bins.push_back(SkewBin(-0.2, true, -0.1, true, " -0.2ns < -0.1ns"));
  bins.push_back(SkewBin(-0.1, true, 0.0, true, " -0.1ns <  0.0ns"));
  bins.push_back(SkewBin(0.0, true, 0.1, true, "  0.0ns < +0.1ns"));
  bins.push_back(SkewBin(0.1, true, 0.2, true, " +0.1ns < +0.2ns"));
  bins.push_back(SkewBin(0.2, true, 0.5, true, " +0.2ns < +0.5ns"));
  bins.push_back(SkewBin(0.5, true, 1.0, true, " +0.5ns < +1.0ns"));
  bins.push_back(SkewBin(1.0, true, 2.0, true, " +1.0ns < +2.0ns"));
  bins.push_back(SkewBin(2.0, true, 5.0, true, " +2.0ns < +5.0ns"));
  bins.push_back(SkewBin(5.0, true, 0.0, false, " +5.0ns <"));
  return bins;
}

const SkewBinSeq &
skewBins()
{
  static const SkewBinSeq bins = makeSkewBins();
  return bins;
}

int
findSkewBin(double skew)
{
  const SkewBinSeq &bins = skewBins();
  for (size_t i = 0; i < bins.size(); i++) {
    if (bins[i].contains(skew))
      return static_cast<int>(i);
  }
  return -1;
}

} // namespace
