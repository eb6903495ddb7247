#pragma once

#include <string>

namespace Glimpse {
namespace Utils {
namespace Text {

std::string trim(const std::string& str);
bool        starts_with(const std::string& str, const std::string& prefix);

std::string base64_encode(const std::string& bytes);
// Decoding stops at the first character outside the base64 alphabet.
std::string base64_decode(const std::string& text);

}  // namespace Text
}  // namespace Utils
}  // namespace Glimpse
