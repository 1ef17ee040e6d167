#pragma once

#include "Types.hpp"
#include "GameState.hpp"
#include "Renderer.hpp"
#include "Player.hpp"
#include "PlayerWorker.hpp"
#include "MatchCoordinator.hpp"
#include <SFML/Graphics.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Schaak {

// Clickable menu entry
struct Button {
    sf::FloatRect bounds;
    std::string text;
    bool hovered = false;
    bool selected = false;
};

enum class GameMode {
    PlayerVsPlayer,
    PlayerVsAI
};

enum class Screen {
    MainMenu,
    Playing
};

class Game {
public:
    Game();
    ~Game();

    bool initialize();
    void run();

private:
    void processEvents();
    void update();
    void render();

    void handleClick(int x, int y);
    void handleMouseMove(int x, int y);
    void handlePromotionKey(PieceType type);
    void selectPiece(const Coordinate& coord);
    void deselectPiece();
    void tryMove(const Coordinate& to);

    void startMatch();
    void stopMatch();

    // Menu functions
    void initMenuButtons();
    void handleMenuClick(int x, int y);
    void drawButton(const Button& button, unsigned int textSize);
    void drawMainMenu();
    void drawGameOverMenu();

    HumanPlayer* getHumanToMove() const;

private:
    std::unique_ptr<sf::RenderWindow> m_window;
    std::unique_ptr<Renderer> m_renderer;

    // Players outlive the workers ticking them
    std::unique_ptr<Player> m_whitePlayer;
    std::unique_ptr<Player> m_blackPlayer;
    HumanPlayer* m_whiteHuman;
    HumanPlayer* m_blackHuman;
    std::unique_ptr<MatchCoordinator> m_coordinator;
    std::unique_ptr<PlayerWorker> m_whiteWorker;
    std::unique_ptr<PlayerWorker> m_blackWorker;

    Screen m_screen;
    GameMode m_gameMode;

    std::vector<Move> m_currentLegalMoves;
    std::optional<Coordinate> m_hoveredSquare;
    bool m_moveSubmitted;

    // Menu buttons
    Button m_pvpButton;
    Button m_pvaButton;
    Button m_playButton;
    Button m_quitButton;
    Button m_restartButton;
    Button m_menuButton;

    static constexpr int WINDOW_WIDTH = 840;
    static constexpr int WINDOW_HEIGHT = 440;
};

} // namespace Schaak
