#include "url.hpp"
#include <algorithm>
#include <cctype>
#include <string_view>

namespace Glimpse {
namespace Utils {

UrlParsed Url::parse(const std::string& url) {
    UrlParsed parsed;

    if (url.empty()) {
        parsed.path = "/";
        return parsed;
    }

    std::string_view sv = url;

    size_t colon       = sv.find(':');
    size_t first_slash = sv.find('/');
    size_t first_q     = sv.find('?');
    size_t first_h     = sv.find('#');
    bool   has_scheme  = (colon != std::string_view::npos);
    if (has_scheme && first_slash != std::string_view::npos && colon > first_slash)
        has_scheme = false;
    if (has_scheme && first_q != std::string_view::npos && colon > first_q)
        has_scheme = false;
    if (has_scheme && first_h != std::string_view::npos && colon > first_h)
        has_scheme = false;

    if (has_scheme) {
        parsed.scheme = std::string(sv.substr(0, colon));
        for (char& c : parsed.scheme)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        sv.remove_prefix(colon + 1);
    }

    if (sv.size() >= 2 && sv[0] == '/' && sv[1] == '/') {
        sv.remove_prefix(2);
        size_t      end_auth  = sv.find_first_of("/?#");
        std::string authority = std::string(sv.substr(0, end_auth));

        if (end_auth != std::string_view::npos) {
            sv.remove_prefix(end_auth);
        }
        else {
            sv = "";
        }

        if (!authority.empty()) {
            size_t      at = authority.find_last_of('@');
            std::string host_port =
                (at != std::string::npos) ? authority.substr(at + 1) : authority;

            if (!host_port.empty() && host_port[0] == '[') {
                size_t end_bracket = host_port.find(']');
                if (end_bracket != std::string::npos) {
                    parsed.host    = host_port.substr(0, end_bracket + 1);
                    size_t p_colon = host_port.find(':', end_bracket + 1);
                    if (p_colon != std::string::npos) {
                        parsed.port = host_port.substr(p_colon + 1);
                    }
                }
                else {
                    parsed.host = host_port;
                }
            }
            else {
                size_t p_colon = host_port.find_last_of(':');
                if (p_colon != std::string::npos) {
                    parsed.host = host_port.substr(0, p_colon);
                    parsed.port = host_port.substr(p_colon + 1);
                }
                else {
                    parsed.host = host_port;
                }
            }
        }
    }

    size_t q_pos = sv.find('?');
    size_t h_pos = sv.find('#');

    size_t path_end = sv.length();
    if (q_pos != std::string_view::npos)
        path_end = std::min(path_end, q_pos);
    if (h_pos != std::string_view::npos)
        path_end = std::min(path_end, h_pos);

    parsed.path = std::string(sv.substr(0, path_end));

    if (parsed.path.empty())
        parsed.path = "/";
    return parsed;
}

bool Url::is_navigable(const std::string& url) {
    if (url.empty())
        return false;
    for (char c : url) {
        if (std::isspace(static_cast<unsigned char>(c)))
            return false;
    }

    UrlParsed p = parse(url);
    if (p.scheme == "http" || p.scheme == "https") {
        if (p.host.empty())
            return false;
        if (!p.port.empty()
            && !std::all_of(p.port.begin(), p.port.end(), [](unsigned char c) {
                   return std::isdigit(c);
               }))
            return false;
        return true;
    }
    return p.scheme == "file" || p.scheme == "data" || p.scheme == "about";
}

}  // namespace Utils
}  // namespace Glimpse
