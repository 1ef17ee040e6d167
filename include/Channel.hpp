#pragma once

#include <deque>
#include <mutex>
#include <optional>

namespace Schaak {

// One-directional queue between a player worker and the coordinator
template <typename T>
class Channel {
public:
    void send(const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.push_back(value);
    }

    // Non-blocking; std::nullopt when nothing is waiting
    std::optional<T> tryReceive() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_queue.empty()) {
            return std::nullopt;
        }
        T value = m_queue.front();
        m_queue.pop_front();
        return value;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.empty();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.clear();
    }

private:
    mutable std::mutex m_mutex;
    std::deque<T> m_queue;
};

} // namespace Schaak
