#pragma once

#include <string>

class NotificationSink
{
public:
    virtual ~NotificationSink() = default;

    // Поднять тревогу о новом имени. Механизм недоступен: NotifyError.
    virtual void Notify(const std::string &new_name) = 0;
};
