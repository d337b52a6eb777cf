#include "ChangeDetector.hpp"
#include "Core/Errors.hpp"
#include "Core/Logger.hpp"

ChangeDetector::ChangeDetector(NotificationSink &sink)
        : sink_(sink)
{
}

bool ChangeDetector::Apply(const ObservedName &event)
{
    std::lock_guard<std::mutex> lk(mtx_);
    if (closed_) return false;

    if (!state_.seeded)
    {
        state_.name         = event.name;
        state_.last_updated = event.observed_at;
        state_.seeded       = true;
        LOGI("detector") << "Current channel name: '" << event.name << "' source=" << ToString(event.source);
        return false;
    }

    if (event.name == state_.name)
    {
        LOGT("detector") << "Unchanged source=" << ToString(event.source);
        return false;
    }

    const std::string old = state_.name;
    state_.name         = event.name;
    state_.last_updated = event.observed_at;
    ++notifications_;

    LOGI("detector") << "Name change detected old='" << old << "' new='" << event.name
                     << "' source=" << ToString(event.source);

    // Уведомление под замком: параллельный дубль не проскочит между
    // обновлением состояния и тревогой, а Close() дождётся её конца.
    try
    {
        sink_.Notify(event.name);
    }
    catch (const NotifyError &e)
    {
        LOGE("notifier") << "Notify failed: " << e.what();
    }
    catch (const std::exception &e)
    {
        LOGE("notifier") << "Notify failed unexpectedly: " << e.what();
    }
    return true;
}

void ChangeDetector::Seed(const std::string &name, Clock::time_point at)
{
    std::lock_guard<std::mutex> lk(mtx_);
    if (closed_ || state_.seeded) return;

    state_.name         = name;
    state_.last_updated = at;
    state_.seeded       = true;
    LOGI("detector") << "Current channel name: '" << name << "' source=initial";
}

void ChangeDetector::Close()
{
    std::lock_guard<std::mutex> lk(mtx_);
    closed_ = true;
}

ChannelState ChangeDetector::Snapshot() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return state_;
}

std::size_t ChangeDetector::Notifications() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return notifications_;
}
