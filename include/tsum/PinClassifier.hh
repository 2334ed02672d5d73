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

#include "PatternMatch.hh"

namespace tsum {

// Classifies point table pins for stage counting and endpoint
// pin detection. Pin patterns are anchored TCL regular expressions
// matched against the full pin path name.
class PinClassifier
{
public:
  // Default stdcell pin naming.
  explicit PinClassifier(Tcl_Interp *interp);
  PinClassifier(const char *output_pins,
                const char *data_pins,
                const char *stage_marker,
                Tcl_Interp *interp);
  PinClassifier(const PinClassifier &) = delete;
  PinClassifier &operator=(const PinClassifier &) = delete;
  // Cell output pin that represents a timing stage.
  bool isOutputPin(const char *pin) const;
  // Register data input pin.
  bool isDataPin(const char *pin) const;
  // Point table line marked as a sensitized stage.
  bool isSensitized(const char *line) const;
  const char *stageMarker() const { return stage_marker_.c_str(); }

  static const char *output_pins_default;
  static const char *data_pins_default;
  static const char *stage_marker_default;

private:
  PatternMatch output_pins_;
  PatternMatch data_pins_;
  std::string stage_marker_;
};

} // namespace
