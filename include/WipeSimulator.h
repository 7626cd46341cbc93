#pragma once
// WipeSimulator.h — имитация безопасного удаления (ничего не удаляет!)
//
// Нужна только ради контракта событий прогресса для UI:
//   {step, totalSteps, progressPercent, message, completed}
//
// ProgressStream — отменяемый поток уведомлений: производитель публикует
// упорядоченные события, потребители подписываются и отписываются.
// Подписчик вызывается в потоке производителя.

#include <string>
#include <functional>
#include <map>
#include <mutex>
#include <atomic>
#include <chrono>
#include "ScanTypes.h"

class ProgressStream {
public:
    using Handler = std::function<void(const ProgressEvent&)>;
    using SubscriptionId = int;

    SubscriptionId subscribe(Handler handler);
    void unsubscribe(SubscriptionId id);

    // false, если поток отменён (событие не доставляется)
    bool publish(const ProgressEvent& event);

    void cancel() { m_cancelled = true; }
    bool cancelled() const { return m_cancelled; }

private:
    std::mutex m_mutex;
    std::map<SubscriptionId, Handler> m_handlers;
    SubscriptionId m_next_id = 1;
    std::atomic<bool> m_cancelled{false};
};

constexpr int DEFAULT_WIPE_STEPS = 5;

class WipeSimulator {
public:
    explicit WipeSimulator(std::chrono::milliseconds step_delay = std::chrono::milliseconds(0));

    // Публикует total_steps событий (последнее с completed = true), если поток
    // не отменят раньше. Возвращает последнее опубликованное событие
    ProgressEvent run(const std::string& target, ProgressStream& stream,
                      int total_steps = DEFAULT_WIPE_STEPS) const;

private:
    std::chrono::milliseconds m_step_delay;
};
