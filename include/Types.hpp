/*
** EPITECH PROJECT, 2025
** schaak
** File description:
** Types.hpp
*/
#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace Schaak {

enum class PieceType {
    Pawn,
    Rook,
    Knight,
    Bishop,
    Queen,
    King
};

enum class Color {
    White,
    Black
};

inline Color flip(Color color) {
    return color == Color::White ? Color::Black : Color::White;
}

inline const char* toString(Color color) {
    return color == Color::White ? "white" : "black";
}

// (0, 0) is a1, (7, 0) is h1, (0, 7) is a8, (7, 7) is h8
struct Coordinate {
    int file;
    int rank;

    bool operator==(const Coordinate& other) const {
        return file == other.file && rank == other.rank;
    }

    bool operator!=(const Coordinate& other) const {
        return !(*this == other);
    }

    bool isValid() const {
        return file >= 0 && file < 8 && rank >= 0 && rank < 8;
    }

    int index() const { return file + 8 * rank; }

    std::string toString() const;

    static std::optional<Coordinate> fromString(std::string_view text);
};

enum class GameStatus {
    Playing,
    Check,
    Checkmate
};

} // namespace Schaak
