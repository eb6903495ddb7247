#pragma once
#include <string>

namespace Glimpse {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
};

class Url {
public:
    static UrlParsed parse(const std::string& url);

    // True when the browser can be pointed at the URL: an absolute http(s)
    // URL with a host, or a file/data/about URL.
    static bool is_navigable(const std::string& url);
};

}  // namespace Utils
}  // namespace Glimpse
