#include "string_utils.hpp"
#include <boost/beast/core/detail/base64.hpp>

namespace Glimpse {
namespace Utils {
namespace Text {

namespace base64 = boost::beast::detail::base64;

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.rfind(prefix, 0) == 0;
}

std::string base64_encode(const std::string& bytes) {
    std::string out(base64::encoded_size(bytes.size()), '\0');
    out.resize(base64::encode(out.data(), bytes.data(), bytes.size()));
    return out;
}

std::string base64_decode(const std::string& text) {
    std::string out(base64::decoded_size(text.size()), '\0');
    auto        result = base64::decode(out.data(), text.data(), text.size());
    out.resize(result.first);
    return out;
}

}  // namespace Text
}  // namespace Utils
}  // namespace Glimpse
