#include "WipeSimulator.h"
#include "Logger.h"
#include <cmath>
#include <thread>
#include <vector>

ProgressStream::SubscriptionId ProgressStream::subscribe(Handler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    SubscriptionId id = m_next_id++;
    m_handlers.emplace(id, std::move(handler));
    return id;
}

void ProgressStream::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_handlers.erase(id);
}

bool ProgressStream::publish(const ProgressEvent& event) {
    if (m_cancelled) return false;

    // Копия: подписчик может отписаться прямо из обработчика
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [id, h] : m_handlers) handlers.push_back(h);
    }
    for (const auto& h : handlers) h(event);
    return true;
}

WipeSimulator::WipeSimulator(std::chrono::milliseconds step_delay) : m_step_delay(step_delay) {}

ProgressEvent WipeSimulator::run(const std::string& target, ProgressStream& stream, int total_steps) const {
    static const char* PHASES[] = {
        "Analyzing target",
        "Overwriting with zeros (simulated)",
        "Overwriting with random data (simulated)",
        "Verifying overwrite (simulated)",
        "Finalizing",
    };
    constexpr int PHASE_COUNT = sizeof(PHASES) / sizeof(PHASES[0]);

    if (total_steps < 1) total_steps = 1;
    Logger::info("Wipe simulation started for " + target + " (nothing is deleted)");

    ProgressEvent last;
    for (int step = 1; step <= total_steps; ++step) {
        ProgressEvent ev;
        ev.step = step;
        ev.total_steps = total_steps;
        ev.progress_percent = std::round(step * 1000.0 / total_steps) / 10.0;
        ev.completed = step == total_steps;
        int phase = (step - 1) * PHASE_COUNT / total_steps;
        ev.message = ev.completed ? "Simulation complete for " + target : PHASES[phase];

        if (!stream.publish(ev)) {
            Logger::info("Wipe simulation cancelled at step " + std::to_string(step));
            break;
        }
        last = ev;
        if (!ev.completed && m_step_delay.count() > 0) std::this_thread::sleep_for(m_step_delay);
    }
    return last;
}
