#include "Game.hpp"
#include "AIPlayer.hpp"
#include <algorithm>
#include <iostream>
#include <random>

namespace Schaak {

Game::Game()
    : m_whiteHuman(nullptr)
    , m_blackHuman(nullptr)
    , m_screen(Screen::MainMenu)
    , m_gameMode(GameMode::PlayerVsPlayer)
    , m_moveSubmitted(false) {
}

Game::~Game() {
    stopMatch();
}

bool Game::initialize() {
    m_window = std::make_unique<sf::RenderWindow>(
        sf::VideoMode(sf::Vector2u(WINDOW_WIDTH, WINDOW_HEIGHT)),
        "schaak",
        sf::Style::Close | sf::Style::Titlebar
    );
    if (!m_window->isOpen()) {
        std::cerr << "Error: could not open the window." << std::endl;
        return false;
    }
    m_window->setFramerateLimit(60);

    m_renderer = std::make_unique<Renderer>(*m_window);
    if (!m_renderer->loadResources()) {
        std::cerr << "Warning: Some resources could not be loaded." << std::endl;
    }

    initMenuButtons();

    return true;
}

void Game::initMenuButtons() {
    float buttonWidth = 220;
    float buttonHeight = 44;
    float centerX = WINDOW_WIDTH / 2 - buttonWidth / 2;

    // Game mode buttons
    m_pvpButton.bounds = sf::FloatRect(sf::Vector2f(WINDOW_WIDTH / 2 - buttonWidth - 10, 170),
                                       sf::Vector2f(buttonWidth, buttonHeight));
    m_pvpButton.text = "Player vs Player";
    m_pvpButton.selected = (m_gameMode == GameMode::PlayerVsPlayer);

    m_pvaButton.bounds = sf::FloatRect(sf::Vector2f(WINDOW_WIDTH / 2 + 10, 170),
                                       sf::Vector2f(buttonWidth, buttonHeight));
    m_pvaButton.text = "Player vs AI";
    m_pvaButton.selected = (m_gameMode == GameMode::PlayerVsAI);

    m_playButton.bounds = sf::FloatRect(sf::Vector2f(centerX, 260), sf::Vector2f(buttonWidth, buttonHeight));
    m_playButton.text = "Play";

    m_quitButton.bounds = sf::FloatRect(sf::Vector2f(centerX, 330), sf::Vector2f(buttonWidth, buttonHeight));
    m_quitButton.text = "Quit";

    // Game over overlay
    m_restartButton.bounds = sf::FloatRect(sf::Vector2f(centerX, 220), sf::Vector2f(buttonWidth, buttonHeight));
    m_restartButton.text = "Play again";

    m_menuButton.bounds = sf::FloatRect(sf::Vector2f(centerX, 290), sf::Vector2f(buttonWidth, buttonHeight));
    m_menuButton.text = "Menu";
}

void Game::run() {
    while (m_window->isOpen()) {
        processEvents();
        update();
        render();
    }
    stopMatch();
}

void Game::processEvents() {
    while (const std::optional event = m_window->pollEvent()) {
        if (event->is<sf::Event::Closed>()) {
            m_window->close();
        }
        else if (const auto* mouseMoved = event->getIf<sf::Event::MouseMoved>()) {
            handleMouseMove(mouseMoved->position.x, mouseMoved->position.y);
        }
        else if (const auto* keyPressed = event->getIf<sf::Event::KeyPressed>()) {
            if (keyPressed->code == sf::Keyboard::Key::Escape) {
                if (m_screen == Screen::MainMenu) {
                    m_window->close();
                } else {
                    stopMatch();
                    m_screen = Screen::MainMenu;
                }
            } else if (m_screen == Screen::Playing) {
                if (keyPressed->code == sf::Keyboard::Key::Q) {
                    handlePromotionKey(PieceType::Queen);
                } else if (keyPressed->code == sf::Keyboard::Key::R) {
                    handlePromotionKey(PieceType::Rook);
                } else if (keyPressed->code == sf::Keyboard::Key::B) {
                    handlePromotionKey(PieceType::Bishop);
                } else if (keyPressed->code == sf::Keyboard::Key::N) {
                    handlePromotionKey(PieceType::Knight);
                }
            }
        }
        else if (const auto* mousePressed = event->getIf<sf::Event::MouseButtonPressed>()) {
            if (mousePressed->button == sf::Mouse::Button::Left) {
                if (m_screen == Screen::MainMenu
                    || (m_coordinator && !m_coordinator->getState().isRunning())) {
                    handleMenuClick(mousePressed->position.x, mousePressed->position.y);
                } else {
                    handleClick(mousePressed->position.x, mousePressed->position.y);
                }
            } else if (mousePressed->button == sf::Mouse::Button::Right) {
                deselectPiece();
            }
        }
    }
}

void Game::handleMouseMove(int x, int y) {
    sf::Vector2f pos(static_cast<float>(x), static_cast<float>(y));

    for (Button* button : {&m_pvpButton, &m_pvaButton, &m_playButton, &m_quitButton,
                           &m_restartButton, &m_menuButton}) {
        button->hovered = button->bounds.contains(pos);
    }

    if (m_screen == Screen::Playing) {
        m_hoveredSquare = m_renderer->screenToBoard(x, y);
    }
}

void Game::handleMenuClick(int x, int y) {
    sf::Vector2f pos(static_cast<float>(x), static_cast<float>(y));

    if (m_screen == Screen::MainMenu) {
        if (m_pvpButton.bounds.contains(pos)) {
            m_gameMode = GameMode::PlayerVsPlayer;
            m_pvpButton.selected = true;
            m_pvaButton.selected = false;
        } else if (m_pvaButton.bounds.contains(pos)) {
            m_gameMode = GameMode::PlayerVsAI;
            m_pvpButton.selected = false;
            m_pvaButton.selected = true;
        } else if (m_playButton.bounds.contains(pos)) {
            startMatch();
        } else if (m_quitButton.bounds.contains(pos)) {
            m_window->close();
        }
    } else {
        if (m_restartButton.bounds.contains(pos)) {
            startMatch();
        } else if (m_menuButton.bounds.contains(pos)) {
            stopMatch();
            m_screen = Screen::MainMenu;
        }
    }
}

void Game::update() {
    if (m_screen != Screen::Playing || !m_coordinator) return;

    std::optional<MoveInfo> applied = m_coordinator->poll();
    if (!applied) return;

    const GameState& state = m_coordinator->getState();
    std::cout << toString(flip(state.getCurrentTurn())) << ": "
              << applied->from.toString() << applied->move.getDestination().toString() << std::endl;

    m_moveSubmitted = false;
    deselectPiece();

    if (!state.isRunning()) {
        std::cout << "checkmate! " << toString(flip(state.getCurrentTurn())) << " wins" << std::endl;
    }
}

void Game::render() {
    m_window->clear(sf::Color(0, 0, 0));

    if (m_screen == Screen::MainMenu || !m_coordinator) {
        drawMainMenu();
    } else {
        const GameState& state = m_coordinator->getState();
        const std::vector<Move>* movesPtr = m_currentLegalMoves.empty() ? nullptr : &m_currentLegalMoves;

        m_renderer->render(state, movesPtr, m_hoveredSquare);

        if (!state.isRunning()) {
            drawGameOverMenu();
        }
    }

    m_window->display();
}

void Game::handleClick(int x, int y) {
    if (!m_coordinator) return;

    GameState& state = m_coordinator->getState();
    if (!state.isRunning()) return;

    // Block input during the AI turn and while our move is on its way
    if (!getHumanToMove() || m_moveSubmitted) return;

    std::optional<Coordinate> clicked = m_renderer->screenToBoard(x, y);
    if (!clicked) {
        deselectPiece();
        return;
    }

    const std::optional<Coordinate>& selected = state.getSelectedSquare();
    if (selected) {
        if (*clicked == *selected) {
            deselectPiece();
            return;
        }

        const std::optional<Piece>& clickedPiece = state.getBoard().getPiece(*clicked);
        if (clickedPiece && clickedPiece->getColor() == state.getCurrentTurn()) {
            selectPiece(*clicked);
            return;
        }

        tryMove(*clicked);
    } else {
        selectPiece(*clicked);
    }
}

void Game::handlePromotionKey(PieceType type) {
    if (!m_coordinator) return;

    GameState& state = m_coordinator->getState();
    state.setPromotionChoice(type);

    // Refresh so that a pending promotion carries the new piece
    if (state.getSelectedSquare()) {
        m_currentLegalMoves = state.getMoves(*state.getSelectedSquare(), true);
    }
}

void Game::selectPiece(const Coordinate& coord) {
    GameState& state = m_coordinator->getState();

    if (!state.selectSquare(coord)) {
        deselectPiece();
        return;
    }

    m_currentLegalMoves = state.getMoves(coord, true);
}

void Game::deselectPiece() {
    if (m_coordinator) {
        m_coordinator->getState().clearSelection();
    }
    m_currentLegalMoves.clear();
}

void Game::tryMove(const Coordinate& to) {
    const std::optional<Coordinate> from = m_coordinator->getState().getSelectedSquare();
    HumanPlayer* human = getHumanToMove();
    if (!from || !human) {
        return;
    }

    auto it = std::find(m_currentLegalMoves.begin(), m_currentLegalMoves.end(), to);
    if (it != m_currentLegalMoves.end()) {
        human->submitMove({*from, *it});
        m_moveSubmitted = true;
    }

    deselectPiece();
}

HumanPlayer* Game::getHumanToMove() const {
    if (!m_coordinator) return nullptr;
    return m_coordinator->getState().getCurrentTurn() == Color::White ? m_whiteHuman : m_blackHuman;
}

void Game::startMatch() {
    stopMatch();

    GameState initial;

    if (m_gameMode == GameMode::PlayerVsAI) {
        // Random side for the human
        std::random_device rd;
        std::mt19937 rng(rd());
        std::uniform_int_distribution<int> dist(0, 1);
        Color humanColor = (dist(rng) == 0) ? Color::White : Color::Black;

        auto human = std::make_unique<HumanPlayer>(initial, humanColor);
        auto ai = std::make_unique<AIPlayer>(initial, flip(humanColor));
        if (humanColor == Color::White) {
            m_whiteHuman = human.get();
            m_whitePlayer = std::move(human);
            m_blackPlayer = std::move(ai);
        } else {
            m_blackHuman = human.get();
            m_blackPlayer = std::move(human);
            m_whitePlayer = std::move(ai);
        }
        std::cout << "New game: you play " << toString(humanColor) << std::endl;
    } else {
        auto white = std::make_unique<HumanPlayer>(initial, Color::White);
        auto black = std::make_unique<HumanPlayer>(initial, Color::Black);
        m_whiteHuman = white.get();
        m_blackHuman = black.get();
        m_whitePlayer = std::move(white);
        m_blackPlayer = std::move(black);
        std::cout << "New game: player vs player" << std::endl;
    }

    m_coordinator = std::make_unique<MatchCoordinator>(initial, *m_whitePlayer, *m_blackPlayer);

    m_whiteWorker = std::make_unique<PlayerWorker>(*m_whitePlayer, PlayerWorker::DEFAULT_INTERVAL);
    m_blackWorker = std::make_unique<PlayerWorker>(*m_blackPlayer, PlayerWorker::DEFAULT_INTERVAL);
    m_whiteWorker->start();
    m_blackWorker->start();

    m_moveSubmitted = false;
    m_screen = Screen::Playing;
}

void Game::stopMatch() {
    // Workers first: they still reference the players
    m_whiteWorker.reset();
    m_blackWorker.reset();
    m_coordinator.reset();
    m_whiteHuman = nullptr;
    m_blackHuman = nullptr;
    m_whitePlayer.reset();
    m_blackPlayer.reset();

    m_currentLegalMoves.clear();
    m_hoveredSquare.reset();
    m_moveSubmitted = false;
}

void Game::drawButton(const Button& button, unsigned int textSize) {
    const sf::Font* font = m_renderer->getFont();
    if (!font) return;

    sf::Color buttonColor;
    if (button.selected) {
        buttonColor = sf::Color(0, 79, 122);
    } else if (button.hovered) {
        buttonColor = sf::Color(4, 38, 56);
    } else {
        buttonColor = sf::Color(60, 60, 60);
    }

    sf::RectangleShape shape(sf::Vector2f(button.bounds.size.x, button.bounds.size.y));
    shape.setPosition(sf::Vector2f(button.bounds.position.x, button.bounds.position.y));
    shape.setFillColor(buttonColor);
    shape.setOutlineColor(button.selected ? sf::Color(161, 222, 255) : sf::Color(80, 80, 80));
    shape.setOutlineThickness(button.selected ? 2 : 1);
    m_window->draw(shape);

    sf::Text text(*font, button.text, textSize);
    text.setFillColor(sf::Color::White);
    sf::FloatRect textBounds = text.getLocalBounds();
    text.setPosition(sf::Vector2f(
        button.bounds.position.x + (button.bounds.size.x - textBounds.size.x) / 2,
        button.bounds.position.y + (button.bounds.size.y - textBounds.size.y) / 2 - 3
    ));
    m_window->draw(text);
}

void Game::drawMainMenu() {
    const sf::Font* font = m_renderer->getFont();
    if (!font) return;

    sf::Text title(*font, "SCHAAK", 56);
    title.setFillColor(sf::Color(161, 222, 255));
    title.setStyle(sf::Text::Bold);
    sf::FloatRect titleBounds = title.getLocalBounds();
    title.setPosition(sf::Vector2f((WINDOW_WIDTH - titleBounds.size.x) / 2, 20));
    m_window->draw(title);

    sf::Text subtitle(*font, sf::String(U"\u2654 \u2655 \u2656 \u2657 \u2658 \u2659"), 28);
    subtitle.setFillColor(sf::Color(180, 180, 180));
    sf::FloatRect subBounds = subtitle.getLocalBounds();
    subtitle.setPosition(sf::Vector2f((WINDOW_WIDTH - subBounds.size.x) / 2, 90));
    m_window->draw(subtitle);

    sf::Text modeLabel(*font, "Game mode:", 18);
    modeLabel.setFillColor(sf::Color(200, 200, 200));
    sf::FloatRect modeLabelBounds = modeLabel.getLocalBounds();
    modeLabel.setPosition(sf::Vector2f((WINDOW_WIDTH - modeLabelBounds.size.x) / 2, 140));
    m_window->draw(modeLabel);

    drawButton(m_pvpButton, 16);
    drawButton(m_pvaButton, 16);
    drawButton(m_playButton, 22);
    drawButton(m_quitButton, 22);
}

void Game::drawGameOverMenu() {
    const sf::Font* font = m_renderer->getFont();
    if (!font) return;

    sf::RectangleShape overlay(sf::Vector2f(static_cast<float>(WINDOW_WIDTH),
                                            static_cast<float>(WINDOW_HEIGHT)));
    overlay.setFillColor(sf::Color(0, 0, 0, 200));
    m_window->draw(overlay);

    Color winner = flip(m_coordinator->getState().getCurrentTurn());
    std::string resultText = std::string("Checkmate! ") + (winner == Color::White ? "White" : "Black") + " wins";

    sf::Text result(*font, resultText, 36);
    result.setFillColor(sf::Color(220, 180, 50));
    result.setStyle(sf::Text::Bold);
    sf::FloatRect resultBounds = result.getLocalBounds();
    result.setPosition(sf::Vector2f((WINDOW_WIDTH - resultBounds.size.x) / 2, 130));
    m_window->draw(result);

    drawButton(m_restartButton, 22);
    drawButton(m_menuButton, 22);
}

} // namespace Schaak
