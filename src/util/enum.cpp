#include "util/enum.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <string>

#include "util/profile_backend.hpp"

namespace waywidgets::util {

template <typename EnumType>
EnumParser<EnumType>::EnumParser() = default;

template <typename EnumType>
EnumParser<EnumType>::~EnumParser() = default;

template <typename EnumType>
EnumType EnumParser<EnumType>::parseStringToEnum(
    const std::string& str, const std::map<std::string, EnumType>& enumMap) const {
  auto it = enumMap.find(str);
  if (it != enumMap.end()) return it->second;

  throw std::invalid_argument("Invalid string representation for enum: " + str);
}

template <typename EnumType>
std::string EnumParser<EnumType>::enumToString(
    EnumType value, const std::map<std::string, EnumType>& enumMap) const {
  auto it = std::find_if(enumMap.begin(), enumMap.end(),
                         [value](const auto& pair) { return pair.second == value; });
  return it != enumMap.end() ? it->first : "";
}

// Explicit instantiations for specific EnumType types you intend to use
template struct EnumParser<Profile>;

}  // namespace waywidgets::util
