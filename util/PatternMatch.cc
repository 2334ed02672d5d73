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

#include "PatternMatch.hh"

#include <tcl.h>

#include "StringUtil.hh"

namespace tsum {

PatternMatch::PatternMatch(const char *pattern,
                           bool nocase,
                           Tcl_Interp *interp) :
  pattern_(pattern),
  nocase_(nocase),
  interp_(interp),
  pattern_obj_(nullptr),
  regexp_(nullptr)
{
  compileRegexp();
}

PatternMatch::~PatternMatch()
{
  // The compiled regexp is owned by the pattern object's internal rep.
  if (pattern_obj_)
    Tcl_DecrRefCount(pattern_obj_);
}

void
PatternMatch::compileRegexp()
{
  int flags = TCL_REG_ADVANCED;
  if (nocase_)
    flags |= TCL_REG_NOCASE;
  string anchored_pattern;
  anchored_pattern += '^';
  anchored_pattern += pattern_;
  anchored_pattern += '$';
  pattern_obj_ = Tcl_NewStringObj(anchored_pattern.c_str(),
                                  anchored_pattern.size());
  Tcl_IncrRefCount(pattern_obj_);
  regexp_ = Tcl_GetRegExpFromObj(interp_, pattern_obj_, flags);
  if (regexp_ == nullptr) {
    string tcl_error = interp_ ? Tcl_GetStringResult(interp_) : "";
    Tcl_DecrRefCount(pattern_obj_);
    pattern_obj_ = nullptr;
    throw RegexpCompileError(pattern_.c_str(), tcl_error.c_str());
  }
}

bool
PatternMatch::match(const char *str) const
{
  return Tcl_RegExpExec(interp_, regexp_, str, str) == 1;
}

////////////////////////////////////////////////////////////////

RegexpCompileError::RegexpCompileError(const char *pattern,
                                       const char *tcl_error) :
  Exception()
{
  error_ = stdstrPrint("TCL failed to compile regular expression '%s'", pattern);
  if (tcl_error && *tcl_error)
    stringAppend(error_, ": %s", tcl_error);
  error_ += '.';
}

const char *
RegexpCompileError::what() const noexcept
{
  return error_.c_str();
}

} // namespace
