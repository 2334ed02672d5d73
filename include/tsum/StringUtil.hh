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

#include <cstdarg>
#include <cstring>
#include <string>
#include <vector>

#include "Machine.hh" // __attribute__

namespace tsum {

using std::string;

inline bool
stringEq(const char *str1,
         const char *str2)
{
  return strcmp(str1, str2) == 0;
}

// Compare the first length characters.
inline bool
stringEq(const char *str1,
         const char *str2,
         size_t length)
{
  return strncmp(str1, str2, length) == 0;
}

// Case sensitive compare the beginning of str1 to str2.
inline bool
stringBeginEq(const char *str1,
              const char *str2)
{
  return strncmp(str1, str2, strlen(str2)) == 0;
}

inline bool
stringLess(const char *str1,
           const char *str2)
{
  return strcmp(str1, str2) < 0;
}

bool
isDigits(const char *str);

// Skip leading white space.
const char *
skipSpace(const char *str);

// Print to a std::string.
string
stdstrPrint(const char *fmt,
            ...) __attribute__((format (printf, 1, 2)));
string
stdstrPrintArgs(const char *fmt,
                va_list args);
void
stringPrint(string &str,
            const char *fmt,
            ...) __attribute__((format (printf, 2, 3)));
// Formated append to std::string.
void
stringAppend(string &str,
             const char *fmt,
             ...) __attribute__((format (printf, 2, 3)));

////////////////////////////////////////////////////////////////

// Trim right spaces, tabs and line ends.
void
trimRight(string &str);
// Trim left and right white space.
string
trim(const string &str);

using StringVector = std::vector<string>;

void
split(const string &text,
      const string &delims,
      // Return values.
      StringVector &tokens);

} // namespace
