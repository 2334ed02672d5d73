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
#include <zlib.h>

namespace tsum {

using std::string;

// Source of report text lines.
class LineSource
{
public:
  virtual ~LineSource() {}
  // Read the next line without the line terminator.
  // Return false at the end of input.
  virtual bool readLine(string &line) = 0;
  // Line number of the last line read, starting at 1.
  virtual int lineNumber() const = 0;
};

// Lines from a plain or gzip'd file.
// zlib reads uncompressed files transparently.
class FileLineSource : public LineSource
{
public:
  // Throws FileNotReadable if filename cannot be opened.
  explicit FileLineSource(const char *filename);
  virtual ~FileLineSource();
  FileLineSource(const FileLineSource &) = delete;
  FileLineSource &operator=(const FileLineSource &) = delete;
  // Throws FileNotReadable on read or decompression errors.
  bool readLine(string &line) override;
  int lineNumber() const override { return line_; }
  const char *filename() const { return filename_.c_str(); }

private:
  string filename_;
  gzFile stream_;
  int line_;
};

// Lines from a string.
class StringLineSource : public LineSource
{
public:
  explicit StringLineSource(const string &text);
  bool readLine(string &line) override;
  int lineNumber() const override { return line_; }

private:
  string text_;
  size_t next_;
  int line_;
};

// Remove trailing "\n" or "\r\n".
void
stripLineEnd(string &line);

} // namespace
