#pragma once
#include <string>

namespace Egress {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
    std::string start_url;
};

class Url {
public:
    static UrlParsed parse(const std::string& url);

    // Port from the URL, or the scheme default ("443" for https, "80" otherwise).
    static std::string effective_port(const UrlParsed& parsed);

    // Origin-form request target: path plus query.
    static std::string request_target(const UrlParsed& parsed);

    static bool is_http_url(const std::string& url);

    // application/x-www-form-urlencoded: spaces become '+'.
    static std::string encode_query_component(const std::string& value);
};

}  // namespace Utils
}  // namespace Egress
