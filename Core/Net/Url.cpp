#include "Core/Net/Url.hpp"

#include <stdexcept>

namespace Net
{
    Url ParseUrl(const std::string &url)
    {
        Url out;

        const size_t sep = url.find("://");
        if (sep == std::string::npos)
            throw std::invalid_argument("URL without scheme: " + url);

        out.scheme = url.substr(0, sep);
        if (out.scheme != "https" && out.scheme != "wss")
            throw std::invalid_argument("unsupported URL scheme '" + out.scheme + "' (TLS only)");

        const size_t host_begin = sep + 3;
        size_t path_begin = url.find_first_of("/?", host_begin);
        std::string authority = url.substr(host_begin,
                                           path_begin == std::string::npos ? std::string::npos
                                                                           : path_begin - host_begin);

        out.target = (path_begin == std::string::npos) ? std::string("/") : url.substr(path_begin);
        if (out.target.front() == '?') out.target.insert(out.target.begin(), '/');

        const size_t colon = authority.rfind(':');
        if (colon != std::string::npos && authority.find(']') == std::string::npos)
        {
            out.host = authority.substr(0, colon);
            out.port = authority.substr(colon + 1);
        }
        else
        {
            out.host = authority;
            out.port = "443";
        }

        if (out.host.empty())
            throw std::invalid_argument("URL without host: " + url);
        if (out.port.empty())
            out.port = "443";

        return out;
    }
}
