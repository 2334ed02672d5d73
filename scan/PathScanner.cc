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

#include "PathScanner.hh"

#include <cstdlib>
#include <cstring>

#include "Debug.hh"
#include "StringUtil.hh"
#include "LineSource.hh"
#include "PinClassifier.hh"

namespace tsum {

const double negative_zero_slack = -1e-12;

static const std::regex &
numberRegexp()
{
  static const std::regex number_regexp("[-+]?\\d+(?:\\.\\d+)?");
  return number_regexp;
}

bool
findFirstNumber(const char *line,
                double &number)
{
  std::cmatch matches;
  if (std::regex_search(line, matches, numberRegexp())) {
    // strtod saturates out of range numbers to HUGE_VAL.
    number = strtod(matches[0].str().c_str(), nullptr);
    return true;
  }
  return false;
}

bool
findLastNumberToken(const char *line,
                    string &token)
{
  bool found = false;
  const char *end = line + strlen(line);
  std::cregex_iterator match_iter(line, end, numberRegexp());
  std::cregex_iterator match_end;
  for (; match_iter != match_end; match_iter++) {
    token = (*match_iter)[0].str();
    found = true;
  }
  return found;
}

void
parseSlack(const char *line,
           double &slack,
           bool &exists)
{
  string token;
  exists = findLastNumberToken(line, token);
  if (exists) {
    slack = strtod(token.c_str(), nullptr);
    // -0.000 compares equal to zero so keep the sign with a tiny slack.
    if (slack == 0.0 && token[0] == '-')
      slack = negative_zero_slack;
  }
  else
    slack = 0.0;
}

////////////////////////////////////////////////////////////////

PathScanner::PathScanner(const PinClassifier *pins,
                         Debug *debug) :
  pins_(pins),
  debug_(debug),
  phase_(ScanPhase::idle),
  stage_count_(0),
  path_count_(0),
  dropped_count_(0),
  startpoint_regexp_("^\\s*Startpoint:\\s*(.+?)\\s*\\((.*clocked by\\s+(\\S+).*)\\)"),
  endpoint_regexp_("^\\s*Endpoint:\\s*(.+?)\\s*\\((.*clocked by\\s+(\\S+).*)\\)"),
  path_group_regexp_("^\\s*Path Group:\\s*(\\S+)"),
  point_header_regexp_("^\\s*Point\\b"),
  data_arrival_regexp_("^\\s*data arrival time\\b"),
  clk_network_delay_regexp_("^\\s*clock network delay \\(propagated\\)"),
  slack_regexp_("^\\s*slack\\b"),
  point_pin_regexp_("^\\s*(\\S+?/[^\\s]+)\\s*\\(")
{
}

// Keywords are checked before the regexps to keep the scan fast on
// the point table rows that make up most of a report.
bool
PathScanner::scanLine(const char *line,
                      PathRecord &completed)
{
  const char *text = skipSpace(line);
  std::cmatch matches;
  if (stringBeginEq(text, "Startpoint:")
      && std::regex_search(line, matches, startpoint_regexp_)) {
    bool has_completed = finishPath(completed);
    beginPath(trim(matches[1].str()), trim(matches[3].str()));
    return has_completed;
  }
  if (phase_ == ScanPhase::idle)
    return false;

  if (stringBeginEq(text, "Endpoint:")
      && std::regex_search(line, matches, endpoint_regexp_)) {
    path_.setEndpoint(trim(matches[1].str()), trim(matches[3].str()));
    return false;
  }
  if (stringBeginEq(text, "Path Group:")
      && std::regex_search(line, matches, path_group_regexp_)) {
    path_.setPathGroup(matches[1].str());
    return false;
  }
  if (stringBeginEq(text, "Point")
      && std::regex_search(line, point_header_regexp_)) {
    phase_ = ScanPhase::point_table;
    return false;
  }

  if (phase_ == ScanPhase::point_table
      && scanPointTableLine(line, text))
    return false;

  // The first clock network delay after data arrival is the capture clock.
  if (phase_ == ScanPhase::data_arrival
      && !path_.hasEndClkDelay()
      && isClkNetworkDelay(text)) {
    double delay;
    if (findFirstNumber(line, delay))
      path_.setEndClkDelay(delay);
    return false;
  }

  if (stringBeginEq(text, "slack")
      && std::regex_search(line, slack_regexp_))
    scanSlackLine(line);
  return false;
}

bool
PathScanner::scanPointTableLine(const char *line,
                                const char *text)
{
  if (stringBeginEq(text, "data arrival time")
      && std::regex_search(line, data_arrival_regexp_)) {
    phase_ = ScanPhase::data_arrival;
    if (!path_.hasEndPin() && !path_.endInst().empty())
      path_.setEndPin(path_.endInst() + "/D");
    return true;
  }

  // Launch clock network delay.
  if (isClkNetworkDelay(text) && !path_.hasStartClkDelay()) {
    double delay;
    if (findFirstNumber(line, delay))
      path_.setStartClkDelay(delay);
    return true;
  }

  std::cmatch matches;
  // Rows that are not pins may still be the slack line.
  if (!std::regex_search(line, matches, point_pin_regexp_)
      || strstr(line, "(net)"))
    return false;

  string pin = matches[1].str();
  if (pins_->isOutputPin(pin.c_str())
      && pins_->isSensitized(line)) {
    stage_count_++;
    debugPrint(debug_, "scan", 3, "stage %d %s", stage_count_, pin.c_str());
  }
  // The last data pin in the table is the endpoint pin.
  if (pins_->isDataPin(pin.c_str()))
    last_data_pin_ = pin;
  return false;
}

void
PathScanner::scanSlackLine(const char *line)
{
  double slack;
  bool exists;
  parseSlack(line, slack, exists);
  if (exists)
    path_.setSlack(slack);
  else
    path_.removeSlack();
}

bool
PathScanner::isClkNetworkDelay(const char *text) const
{
  return stringBeginEq(text, "clock network delay")
    && std::regex_search(text, clk_network_delay_regexp_);
}

void
PathScanner::beginPath(const string &start_inst,
                       const string &start_clk)
{
  path_ = PathRecord(start_inst, start_clk);
  path_.setStartPin(start_inst + "/CP");
  phase_ = ScanPhase::header;
  stage_count_ = 0;
  last_data_pin_.clear();
  debugPrint(debug_, "scan", 2, "startpoint %s clocked by %s",
             start_inst.c_str(), start_clk.c_str());
}

bool
PathScanner::finishPath(PathRecord &completed)
{
  if (phase_ == ScanPhase::idle)
    return false;
  if (path_.hasSlack()) {
    if (stage_count_ > 0)
      path_.setStageCount(stage_count_);
    if (!last_data_pin_.empty())
      path_.setEndPin(last_data_pin_);
    completed = path_;
    path_count_++;
    return true;
  }
  else {
    dropped_count_++;
    debugPrint(debug_, "scan", 1, "path from %s has no slack",
               path_.startInst().c_str());
    return false;
  }
}

bool
PathScanner::finish(PathRecord &completed)
{
  bool has_completed = finishPath(completed);
  phase_ = ScanPhase::idle;
  return has_completed;
}

////////////////////////////////////////////////////////////////

PathRecordIterator::PathRecordIterator(LineSource *lines,
                                       const PinClassifier *pins,
                                       Debug *debug) :
  lines_(lines),
  scanner_(pins, debug),
  has_next_(false),
  at_end_(false)
{
}

bool
PathRecordIterator::hasNext()
{
  if (!has_next_ && !at_end_)
    findNext();
  return has_next_;
}

PathRecord
PathRecordIterator::next()
{
  if (!has_next_)
    findNext();
  has_next_ = false;
  return next_;
}

void
PathRecordIterator::findNext()
{
  while (lines_->readLine(line_)) {
    if (scanner_.scanLine(line_.c_str(), next_)) {
      has_next_ = true;
      return;
    }
  }
  if (!at_end_) {
    at_end_ = true;
    has_next_ = scanner_.finish(next_);
  }
}

PathRecordSeq
readPathRecords(const char *filename,
                const PinClassifier *pins,
                Debug *debug)
{
  FileLineSource lines(filename);
  PathRecordIterator path_iter(&lines, pins, debug);
  PathRecordSeq paths;
  while (path_iter.hasNext())
    paths.push_back(path_iter.next());
  debugPrint(debug, "scan", 1, "%s %zu paths, %zu without slack",
             filename,
             path_iter.scanner().pathCount(),
             path_iter.scanner().droppedCount());
  return paths;
}

} // namespace
