#pragma once

#include "Player.hpp"
#include <atomic>
#include <chrono>
#include <thread>

namespace Schaak {

// Ticks a player on its own thread until stopped
class PlayerWorker {
public:
    PlayerWorker(Player& player, std::chrono::milliseconds interval);
    ~PlayerWorker();

    PlayerWorker(const PlayerWorker&) = delete;
    PlayerWorker& operator=(const PlayerWorker&) = delete;

    void start();
    void stop();
    bool isRunning() const { return m_running.load(); }

    static constexpr std::chrono::milliseconds DEFAULT_INTERVAL{16};

private:
    void run();

    Player& m_player;
    std::chrono::milliseconds m_interval;
    std::atomic<bool> m_running;
    std::thread m_thread;
};

} // namespace Schaak
