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

#include "LineSource.hh"

#include "Error.hh"

namespace tsum {

FileLineSource::FileLineSource(const char *filename) :
  filename_(filename),
  stream_(nullptr),
  line_(0)
{
  // Use zlib to uncompress gzip'd files automagically.
  stream_ = gzopen(filename, "rb");
  if (stream_ == nullptr)
    throw FileNotReadable(filename);
}

FileLineSource::~FileLineSource()
{
  if (stream_)
    gzclose(stream_);
}

bool
FileLineSource::readLine(string &line)
{
  line.clear();
  char buffer[4096];
  bool read_some = false;
  // Long lines take several gzgets.
  while (gzgets(stream_, buffer, sizeof(buffer))) {
    read_some = true;
    line += buffer;
    if (line.back() == '\n')
      break;
  }
  if (!read_some) {
    int errnum;
    gzerror(stream_, &errnum);
    if (errnum != Z_OK)
      throw FileNotReadable(filename_.c_str());
    return false;
  }
  line_++;
  stripLineEnd(line);
  return true;
}

////////////////////////////////////////////////////////////////

StringLineSource::StringLineSource(const string &text) :
  text_(text),
  next_(0),
  line_(0)
{
}

bool
StringLineSource::readLine(string &line)
{
  if (next_ >= text_.size())
    return false;
  size_t end = text_.find('\n', next_);
  if (end == string::npos) {
    line = text_.substr(next_);
    next_ = text_.size();
  }
  else {
    line = text_.substr(next_, end - next_);
    next_ = end + 1;
  }
  line_++;
  stripLineEnd(line);
  return true;
}

////////////////////////////////////////////////////////////////

void
stripLineEnd(string &line)
{
  if (!line.empty() && line.back() == '\n')
    line.pop_back();
  if (!line.empty() && line.back() == '\r')
    line.pop_back();
}

} // namespace
