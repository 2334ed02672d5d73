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

#include "BlockMap.hh"

#include <algorithm>

#include "Report.hh"
#include "Debug.hh"
#include "StringUtil.hh"
#include "LineSource.hh"

namespace tsum {

string
blockName(const string &inst,
          const BlockMapRuleSeq &rules)
{
  for (const BlockMapRule &rule : rules) {
    const string &prefix = rule.first;
    if (inst.compare(0, prefix.size(), prefix) == 0)
      return rule.second;
  }
  return inst.substr(0, inst.find('/'));
}

string
normalizeBlockPrefix(const string &prefix)
{
  string normalized = trim(prefix);
  if (!normalized.empty() && normalized.back() != '/')
    normalized += '/';
  return normalized;
}

////////////////////////////////////////////////////////////////

BlockMap::BlockMap(Report *report,
                   Debug *debug) :
  report_(report),
  debug_(debug)
{
}

void
BlockMap::addRule(const string &prefix,
                  const string &name)
{
  rules_.push_back(BlockMapRule(normalizeBlockPrefix(prefix), name));
  debugPrint(debug_, "block_map", 2, "%s -> %s",
             rules_.back().first.c_str(), name.c_str());
}

void
BlockMap::addRuleArg(const char *arg)
{
  const char *eq = strchr(arg, '=');
  if (eq == nullptr)
    report_->error(200, "-block_map expects prefix=name, got '%s'.", arg);
  addRule(string(arg, eq - arg), trim(eq + 1));
}

void
BlockMap::readRuleFile(const char *filename)
{
  FileLineSource lines(filename);
  string raw;
  size_t rule_count = rules_.size();
  while (lines.readLine(raw)) {
    string line = trim(raw);
    if (line.empty() || line[0] == '#')
      continue;
    size_t arrow = line.find("->");
    if (arrow != string::npos)
      addRule(trim(line.substr(0, arrow)), trim(line.substr(arrow + 2)));
    else {
      StringVector tokens;
      split(line, " \t\f\v", tokens);
      if (tokens.size() < 2)
        report_->fileError(201, filename, lines.lineNumber(),
                           "bad block map line '%s'.", raw.c_str());
      addRule(tokens[0], tokens[1]);
    }
  }
  debugPrint(debug_, "block_map", 1, "%s %zu rules",
             filename, rules_.size() - rule_count);
}

void
BlockMap::sortRules()
{
  std::stable_sort(rules_.begin(), rules_.end(),
                   [] (const BlockMapRule &rule1,
                       const BlockMapRule &rule2) {
                     return rule1.first.size() > rule2.first.size();
                   });
}

string
BlockMap::blockName(const string &inst) const
{
  return tsum::blockName(inst, rules_);
}

} // namespace
