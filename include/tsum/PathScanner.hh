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

#include <regex>
#include <string>

#include "PathRecord.hh"

namespace tsum {

class Debug;
class LineSource;
class PinClassifier;

// Where the scanner is in a path block.
enum class ScanPhase {
  // Not in a path block yet.
  idle,
  // Startpoint/Endpoint/Path Group header lines.
  header,
  // Between the "Point" header and "data arrival time".
  point_table,
  // After "data arrival time" (required time section).
  data_arrival
};

// Line at a time scanner that reconstructs one PathRecord per
// report path block.
//
// A path block starts with a "Startpoint:" line and ends at the next
// "Startpoint:" line or the end of input. Blocks without a slack line
// are dropped.
class PathScanner
{
public:
  PathScanner(const PinClassifier *pins,
              Debug *debug);
  // Scan one report line.
  // Return true with the previous path in completed when the line
  // starts a new path block and the previous path has a slack.
  bool scanLine(const char *line,
                // Return value.
                PathRecord &completed);
  // End of input.
  // Return true with the last path in completed if it has a slack.
  bool finish(// Return value.
              PathRecord &completed);
  ScanPhase phase() const { return phase_; }
  size_t pathCount() const { return path_count_; }
  size_t droppedCount() const { return dropped_count_; }

protected:
  bool finishPath(PathRecord &completed);
  void beginPath(const string &start_inst,
                 const string &start_clk);
  // Return true if the line was consumed.
  bool scanPointTableLine(const char *line,
                          const char *text);
  void scanSlackLine(const char *line);
  bool isClkNetworkDelay(const char *text) const;

  const PinClassifier *pins_;
  Debug *debug_;

  // Per path block context.
  ScanPhase phase_;
  PathRecord path_;
  int stage_count_;
  string last_data_pin_;

  size_t path_count_;
  size_t dropped_count_;

  const std::regex startpoint_regexp_;
  const std::regex endpoint_regexp_;
  const std::regex path_group_regexp_;
  const std::regex point_header_regexp_;
  const std::regex data_arrival_regexp_;
  const std::regex clk_network_delay_regexp_;
  const std::regex slack_regexp_;
  const std::regex point_pin_regexp_;
};

// Java style iterator over the completed paths in a line source.
// Paths are scanned as they are requested.
//  PathRecordIterator path_iter(lines, pins, debug);
//  while (path_iter.hasNext()) {
//    PathRecord path = path_iter.next();
//  }
class PathRecordIterator
{
public:
  PathRecordIterator(LineSource *lines,
                     const PinClassifier *pins,
                     Debug *debug);
  bool hasNext();
  PathRecord next();
  const PathScanner &scanner() const { return scanner_; }

private:
  void findNext();

  LineSource *lines_;
  PathScanner scanner_;
  string line_;
  PathRecord next_;
  bool has_next_;
  bool at_end_;
};

// All paths in a plain or gzip'd report file.
// Throws FileNotReadable.
PathRecordSeq
readPathRecords(const char *filename,
                const PinClassifier *pins,
                Debug *debug);

// First number on the line.
bool
findFirstNumber(const char *line,
                // Return value.
                double &number);
// Last number token on the line.
bool
findLastNumberToken(const char *line,
                    // Return value.
                    string &token);
// Slack from a "slack ..." line.
// A printed negative zero ("-0.000") is returned as negative_zero_slack
// so the path is still a violation.
void
parseSlack(const char *line,
           // Return values.
           double &slack,
           bool &exists);

extern const double negative_zero_slack;

} // namespace
