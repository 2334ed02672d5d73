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

#include "Error.hh"

// Don't require all of tcl.h.
typedef struct Tcl_RegExp_ *Tcl_RegExp;
typedef struct Tcl_Interp Tcl_Interp;
typedef struct Tcl_Obj Tcl_Obj;

namespace tsum {

using ::Tcl_RegExp;
using ::Tcl_Interp;

// TCL advanced regular expression match.
// Regular expressions are always anchored.
class PatternMatch
{
public:
  // If nocase is true, ignore case in the pattern.
  // Tcl_Interp is used to report regexp compile errors.
  PatternMatch(const char *pattern,
               bool nocase,
               Tcl_Interp *interp);
  ~PatternMatch();
  PatternMatch(const PatternMatch &) = delete;
  PatternMatch &operator=(const PatternMatch &) = delete;
  bool match(const char *str) const;
  bool match(const std::string &str) const { return match(str.c_str()); }
  const char *pattern() const { return pattern_.c_str(); }
  bool nocase() const { return nocase_; }

private:
  void compileRegexp();

  std::string pattern_;
  bool nocase_;
  Tcl_Interp *interp_;
  Tcl_Obj *pattern_obj_;
  Tcl_RegExp regexp_;
};

// Error thrown by PatternMatch constructor.
class RegexpCompileError : public Exception
{
public:
  RegexpCompileError(const char *pattern,
                     const char *tcl_error);
  virtual const char *what() const noexcept;

private:
  std::string error_;
};

} // namespace
