// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#ifndef Fnsig_Enums_H
#define Fnsig_Enums_H

#include <cstddef>
#include <string>

#include "util.hpp"

namespace fnsig {

// This is the mechanism that allows the labels to be associated with a specific enum through a
// template.  The labels must be in enum order, and the enum must start at zero and increase
// monotonically.
template<typename T>
struct EnumStrings
{
  static char const* data[];
};

template<typename T> std::string Enum2Str(T value) {
  return EnumStrings<T>::data[static_cast<std::size_t>(value)];
}

// Convert a case-insensitive label into an enum value.  If the label is not found, the provided
// default value is returned.  Each specialization of EnumStrings ends its label list with a
// nullptr sentinel, which is not a valid label.
template<typename T> T Str2Enum(std::string const & value, T default_value) {
  std::string lowered_value = to_lower(value);
  for (std::size_t i = 0; EnumStrings<T>::data[i] != nullptr; ++i) {
    if (to_lower(EnumStrings<T>::data[i]) == lowered_value) {
      return T(i);
    }
  }
  return default_value;
}

} // namespace fnsig

#endif // Fnsig_Enums_H

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
