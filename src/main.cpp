#include "Game.hpp"
#include <iostream>

int main() {
    std::cout << "Starting schaak..." << std::endl;

    Schaak::Game game;

    if (!game.initialize()) {
        std::cerr << "Failed to initialize game!" << std::endl;
        return 1;
    }

    std::cout << "Controls:" << std::endl;
    std::cout << "  - Left click to select/move pieces" << std::endl;
    std::cout << "  - Right click to deselect" << std::endl;
    std::cout << "  - Press 'ESC' to leave the game, again to quit" << std::endl;
    std::cout << "  - Promotion piece: Q=Queen, R=Rook, B=Bishop, N=Knight" << std::endl;

    game.run();

    return 0;
}
