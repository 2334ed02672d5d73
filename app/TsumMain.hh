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

typedef struct Tcl_Interp Tcl_Interp;

namespace tsum {

class Report;
class Debug;

// Run the summary for the command line in argc/argv.
// Return the process exit status.
int
tsumMain(int argc,
         char *argv[],
         Report *report,
         Debug *debug,
         Tcl_Interp *interp);

void
showUsage(const char *prog,
          Report *report);

// Find and remove flag from argv.
bool
findCmdLineFlag(int &argc,
                char *argv[],
                const char *flag);
// Find key and remove it and its value from argv.
// Return the value or nullptr.
char *
findCmdLineKey(int &argc,
               char *argv[],
               const char *key);
// what[=level]
// Throws ExceptionMsg if level is not a positive integer.
void
parseDebugArg(const char *arg,
              Report *report,
              Debug *debug);

} // namespace
