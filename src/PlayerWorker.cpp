#include "PlayerWorker.hpp"

namespace Schaak {

PlayerWorker::PlayerWorker(Player& player, std::chrono::milliseconds interval)
    : m_player(player)
    , m_interval(interval)
    , m_running(false) {
}

PlayerWorker::~PlayerWorker() {
    stop();
}

void PlayerWorker::start() {
    if (m_running.exchange(true)) {
        return;
    }
    m_thread = std::thread(&PlayerWorker::run, this);
}

void PlayerWorker::stop() {
    m_running = false;
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void PlayerWorker::run() {
    while (m_running.load()) {
        m_player.tick();
        std::this_thread::sleep_for(m_interval);
    }
}

} // namespace Schaak
