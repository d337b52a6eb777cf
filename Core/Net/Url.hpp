#pragma once

// Url.hpp: разбор https:// и wss:// адресов для HTTP- и WebSocket-клиента.

#include <string>

namespace Net
{
    struct Url
    {
        std::string scheme;  // "https" / "wss"
        std::string host;
        std::string port;    // по умолчанию 443
        std::string target;  // путь + query, минимум "/"
    };

    /**
     * @brief Разобрать абсолютный URL.
     * @throws std::invalid_argument при неподдерживаемой схеме или пустом хосте.
     */
    Url ParseUrl(const std::string &url);
}
