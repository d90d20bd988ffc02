// Copyright 2026 The Coral Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#ifndef CORAL_FMT_NUMBER_FORMAT_H_
#define CORAL_FMT_NUMBER_FORMAT_H_

#include <string>

namespace coral {

// Returns the shortest decimal spelling of `value` that reads back as the same
// double, in the layout Python's repr() uses: positional notation with at least
// one fractional digit ("1.5", "100.0", "0.0001") when the decimal exponent is
// in [-4, 16), scientific notation with a signed, two-digit-minimum exponent
// otherwise ("1e+16", "1e-05", "4.2e+85").
//
// Infinity renders as "1e309", the shortest literal that reads back as it.
std::string FloatRepr(double value);

// Returns the spelling of an imaginary literal with imaginary part `value`;
// e.g. "2j", "1.5j", "1e+20j".
std::string ImaginaryRepr(double value);

}  // namespace coral

#endif  // CORAL_FMT_NUMBER_FORMAT_H_
