#pragma once

// ChangeDetector.hpp: единственная точка изменения ChannelState.
// Оба источника (push и poll) приходят сюда; решение «уведомлять или нет»
// принимается под одним мьютексом, порядок: порядок захвата.

#include "Core/Watch/ChannelState.hpp"
#include "Core/Watch/NotificationSink.hpp"

#include <cstddef>
#include <mutex>

class ChangeDetector
{
public:
    explicit ChangeDetector(NotificationSink &sink);

    ChangeDetector(const ChangeDetector&)            = delete;
    ChangeDetector& operator=(const ChangeDetector&) = delete;

    /**
     * @brief Применить наблюдение.
     * @return true, если имя сменилось и было отправлено уведомление.
     *         Первое наблюдение только засевает состояние.
     */
    bool Apply(const ObservedName &event);

    // Засеять состояние начальным именем (REST при старте). Уже засеяно: no-op.
    void Seed(const std::string &name, Clock::time_point at);

    // С этого момента события игнорируются и уведомлений нет.
    void Close();

    ChannelState Snapshot() const;
    std::size_t  Notifications() const;

private:
    mutable std::mutex mtx_;
    ChannelState       state_;
    NotificationSink  &sink_;
    bool               closed_        = false;
    std::size_t        notifications_ = 0;
};
