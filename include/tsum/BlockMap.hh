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
#include <utility>
#include <vector>

namespace tsum {

using std::string;

class Report;
class Debug;

// Instance path prefix and the block name it maps to.
typedef std::pair<string, string> BlockMapRule;
typedef std::vector<BlockMapRule> BlockMapRuleSeq;

// Block name of an instance path.
// The first rule (in order) with a prefix of inst wins, so rules
// should be sorted longest prefix first. Without a matching rule the
// block is the first hierarchy level of inst.
string
blockName(const string &inst,
          const BlockMapRuleSeq &rules);

// Prefixes are hierarchy prefixes that end with '/'.
string
normalizeBlockPrefix(const string &prefix);

// Instance path to block name rules.
class BlockMap
{
public:
  BlockMap(Report *report,
           Debug *debug);
  void addRule(const string &prefix,
               const string &name);
  // prefix=name
  void addRuleArg(const char *arg);
  // One rule per line, "prefix -> name" or "prefix name".
  // Blank lines and lines beginning with '#' are ignored.
  void readRuleFile(const char *filename);
  // Longest prefix first, keeping the order of equal length prefixes.
  void sortRules();
  string blockName(const string &inst) const;
  const BlockMapRuleSeq &rules() const { return rules_; }

private:
  BlockMapRuleSeq rules_;
  Report *report_;
  Debug *debug_;
};

} // namespace
