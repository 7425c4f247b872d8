#pragma once

#include <map>
#include <stdexcept>
#include <string>

namespace waywidgets::util {

template <typename EnumType>
struct EnumParser {
 public:
  EnumParser();
  ~EnumParser();

  // Exact, case sensitive lookup; throws std::invalid_argument on a miss
  EnumType parseStringToEnum(const std::string& str,
                             const std::map<std::string, EnumType>& enumMap) const;

  std::string enumToString(EnumType value, const std::map<std::string, EnumType>& enumMap) const;
};

}  // namespace waywidgets::util
