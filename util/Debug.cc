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

#include "Debug.hh"

#include "Report.hh"

namespace tsum {

Debug::Debug(Report *report) :
  report_(report),
  debug_on_(false)
{
}

bool
Debug::check(const char *what,
             int level) const
{
  if (debug_on_) {
    auto level_iter = debug_map_.find(what);
    if (level_iter != debug_map_.end())
      return level_iter->second >= level;
  }
  return false;
}

int
Debug::level(const char *what) const
{
  auto level_iter = debug_map_.find(what);
  if (level_iter != debug_map_.end())
    return level_iter->second;
  return 0;
}

void
Debug::setLevel(const char *what,
                int level)
{
  if (level == 0)
    debug_map_.erase(what);
  else
    debug_map_[what] = level;
  debug_on_ = !debug_map_.empty();
}

// Debug lines go to the error console so they never mix with
// redirected report output.
void
Debug::reportLine(const char *what,
                  const char *fmt,
                  ...) const
{
  va_list args;
  va_start(args, fmt);
  std::unique_lock<std::mutex> lock(report_->buffer_lock_);
  report_->printToBuffer("%s", what);
  report_->printToBufferAppend(": ");
  report_->printToBufferAppend(fmt, args);
  report_->printToBufferAppend("\n");
  report_->printError(report_->buffer_, report_->buffer_length_);
  va_end(args);
}

} // namespace
