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

#include "PinClassifier.hh"

#include <cstring>

namespace tsum {

const char *PinClassifier::output_pins_default =
  ".*/(Z|ZN|Y|Q[0-9]*|QB[0-9]*|QN|CO|COUT|S|SO|SUM)";
const char *PinClassifier::data_pins_default =
  ".*/(D[0-9]*|DIN[0-9]*|DATA[0-9]*)";
const char *PinClassifier::stage_marker_default = "&";

PinClassifier::PinClassifier(Tcl_Interp *interp) :
  PinClassifier(output_pins_default, data_pins_default,
                stage_marker_default, interp)
{
}

PinClassifier::PinClassifier(const char *output_pins,
                             const char *data_pins,
                             const char *stage_marker,
                             Tcl_Interp *interp) :
  output_pins_(output_pins, false, interp),
  data_pins_(data_pins, false, interp),
  stage_marker_(stage_marker)
{
}

bool
PinClassifier::isOutputPin(const char *pin) const
{
  return output_pins_.match(pin);
}

bool
PinClassifier::isDataPin(const char *pin) const
{
  return data_pins_.match(pin);
}

bool
PinClassifier::isSensitized(const char *line) const
{
  // An empty marker marks every line.
  return strstr(line, stage_marker_.c_str()) != nullptr;
}

} // namespace
