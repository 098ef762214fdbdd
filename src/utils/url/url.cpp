#include "url.hpp"
#include <algorithm>
#include <cctype>
#include <string_view>

namespace Egress {
namespace Utils {

UrlParsed Url::parse(const std::string& url) {
    UrlParsed parsed;
    parsed.start_url = url;

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
        std::transform(parsed.scheme.begin(),
                       parsed.scheme.end(),
                       parsed.scheme.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
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

    size_t h_pos = sv.find('#');
    if (h_pos != std::string_view::npos) {
        parsed.fragment = std::string(sv.substr(h_pos + 1));
        sv              = sv.substr(0, h_pos);
    }

    size_t q_pos = sv.find('?');
    if (q_pos != std::string_view::npos) {
        parsed.query = std::string(sv.substr(q_pos + 1));
        sv           = sv.substr(0, q_pos);
    }

    parsed.path = std::string(sv);

    if (parsed.path.empty())
        parsed.path = "/";
    return parsed;
}

std::string Url::effective_port(const UrlParsed& parsed) {
    if (!parsed.port.empty())
        return parsed.port;
    return parsed.scheme == "https" ? "443" : "80";
}

std::string Url::request_target(const UrlParsed& parsed) {
    std::string target = parsed.path.empty() ? "/" : parsed.path;
    if (!parsed.query.empty())
        target += "?" + parsed.query;
    return target;
}

bool Url::is_http_url(const std::string& url) {
    UrlParsed parsed = parse(url);
    return (parsed.scheme == "http" || parsed.scheme == "https") && !parsed.host.empty();
}

std::string Url::encode_query_component(const std::string& value) {
    static constexpr char HEX[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        }
        else if (c == ' ') {
            out += '+';
        }
        else {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0F];
        }
    }
    return out;
}

}  // namespace Utils
}  // namespace Egress
