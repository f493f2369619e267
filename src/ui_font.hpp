#pragma once
#include "sdl.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Built-in 5x7 bitmap font so the front end needs no SDL_ttf.
// Covers printable ASCII 0x20..0x5F; lowercase is drawn as uppercase and
// anything else falls back to '?'.

struct Color {
    uint8_t r = 255;
    uint8_t g = 255;
    uint8_t b = 255;
    uint8_t a = 255;
};

struct Glyph5x7 {
    // 7 rows, low 5 bits used (bit 4 is the leftmost column).
    uint8_t rows[7];
};

inline constexpr int FONT_FIRST = 0x20;
inline constexpr int FONT_LAST = 0x5F;

inline constexpr Glyph5x7 kFont5x7[FONT_LAST - FONT_FIRST + 1] = {
    {{0x00,0x00,0x00,0x00,0x00,0x00,0x00}}, // ' '
    {{0x04,0x04,0x04,0x04,0x04,0x00,0x04}}, // '!'
    {{0x0A,0x0A,0x00,0x00,0x00,0x00,0x00}}, // '"'
    {{0x0A,0x0A,0x1F,0x0A,0x1F,0x0A,0x0A}}, // '#'
    {{0x04,0x0F,0x14,0x0E,0x05,0x1E,0x04}}, // '$'
    {{0x18,0x19,0x02,0x04,0x08,0x13,0x03}}, // '%'
    {{0x0C,0x12,0x14,0x08,0x15,0x12,0x0D}}, // '&'
    {{0x04,0x04,0x00,0x00,0x00,0x00,0x00}}, // "'"
    {{0x04,0x08,0x10,0x10,0x10,0x08,0x04}}, // '('
    {{0x04,0x02,0x01,0x01,0x01,0x02,0x04}}, // ')'
    {{0x00,0x04,0x15,0x0E,0x15,0x04,0x00}}, // '*'
    {{0x00,0x04,0x04,0x1F,0x04,0x04,0x00}}, // '+'
    {{0x00,0x00,0x00,0x00,0x00,0x0C,0x04}}, // ','
    {{0x00,0x00,0x00,0x1F,0x00,0x00,0x00}}, // '-'
    {{0x00,0x00,0x00,0x00,0x00,0x0C,0x0C}}, // '.'
    {{0x01,0x02,0x04,0x08,0x10,0x00,0x00}}, // '/'
    {{0x0E,0x11,0x13,0x15,0x19,0x11,0x0E}}, // '0'
    {{0x04,0x0C,0x04,0x04,0x04,0x04,0x0E}}, // '1'
    {{0x0E,0x11,0x01,0x02,0x04,0x08,0x1F}}, // '2'
    {{0x1E,0x01,0x01,0x0E,0x01,0x01,0x1E}}, // '3'
    {{0x02,0x06,0x0A,0x12,0x1F,0x02,0x02}}, // '4'
    {{0x1F,0x10,0x10,0x1E,0x01,0x01,0x1E}}, // '5'
    {{0x06,0x08,0x10,0x1E,0x11,0x11,0x0E}}, // '6'
    {{0x1F,0x01,0x02,0x04,0x08,0x08,0x08}}, // '7'
    {{0x0E,0x11,0x11,0x0E,0x11,0x11,0x0E}}, // '8'
    {{0x0E,0x11,0x11,0x0F,0x01,0x02,0x0C}}, // '9'
    {{0x00,0x0C,0x0C,0x00,0x0C,0x0C,0x00}}, // ':'
    {{0x00,0x0C,0x0C,0x00,0x0C,0x04,0x00}}, // ';'
    {{0x01,0x02,0x04,0x08,0x04,0x02,0x01}}, // '<'
    {{0x00,0x00,0x1F,0x00,0x1F,0x00,0x00}}, // '='
    {{0x10,0x08,0x04,0x02,0x04,0x08,0x10}}, // '>'
    {{0x0E,0x11,0x01,0x02,0x04,0x00,0x04}}, // '?'
    {{0x0E,0x11,0x17,0x15,0x17,0x10,0x0E}}, // '@'
    {{0x0E,0x11,0x11,0x1F,0x11,0x11,0x11}}, // 'A'
    {{0x1E,0x11,0x11,0x1E,0x11,0x11,0x1E}}, // 'B'
    {{0x0E,0x11,0x10,0x10,0x10,0x11,0x0E}}, // 'C'
    {{0x1C,0x12,0x11,0x11,0x11,0x12,0x1C}}, // 'D'
    {{0x1F,0x10,0x10,0x1E,0x10,0x10,0x1F}}, // 'E'
    {{0x1F,0x10,0x10,0x1E,0x10,0x10,0x10}}, // 'F'
    {{0x0E,0x11,0x10,0x10,0x13,0x11,0x0E}}, // 'G'
    {{0x11,0x11,0x11,0x1F,0x11,0x11,0x11}}, // 'H'
    {{0x0E,0x04,0x04,0x04,0x04,0x04,0x0E}}, // 'I'
    {{0x01,0x01,0x01,0x01,0x11,0x11,0x0E}}, // 'J'
    {{0x11,0x12,0x14,0x18,0x14,0x12,0x11}}, // 'K'
    {{0x10,0x10,0x10,0x10,0x10,0x10,0x1F}}, // 'L'
    {{0x11,0x1B,0x15,0x15,0x11,0x11,0x11}}, // 'M'
    {{0x11,0x11,0x19,0x15,0x13,0x11,0x11}}, // 'N'
    {{0x0E,0x11,0x11,0x11,0x11,0x11,0x0E}}, // 'O'
    {{0x1E,0x11,0x11,0x1E,0x10,0x10,0x10}}, // 'P'
    {{0x0E,0x11,0x11,0x11,0x15,0x12,0x0D}}, // 'Q'
    {{0x1E,0x11,0x11,0x1E,0x14,0x12,0x11}}, // 'R'
    {{0x0F,0x10,0x10,0x0E,0x01,0x01,0x1E}}, // 'S'
    {{0x1F,0x04,0x04,0x04,0x04,0x04,0x04}}, // 'T'
    {{0x11,0x11,0x11,0x11,0x11,0x11,0x0E}}, // 'U'
    {{0x11,0x11,0x11,0x11,0x11,0x0A,0x04}}, // 'V'
    {{0x11,0x11,0x11,0x15,0x15,0x15,0x0A}}, // 'W'
    {{0x11,0x11,0x0A,0x04,0x0A,0x11,0x11}}, // 'X'
    {{0x11,0x11,0x0A,0x04,0x04,0x04,0x04}}, // 'Y'
    {{0x1F,0x01,0x02,0x04,0x08,0x10,0x1F}}, // 'Z'
    {{0x1C,0x10,0x10,0x10,0x10,0x10,0x1C}}, // '['
    {{0x10,0x08,0x04,0x02,0x01,0x00,0x00}}, // '\\'
    {{0x07,0x01,0x01,0x01,0x01,0x01,0x07}}, // ']'
    {{0x0E,0x11,0x02,0x04,0x04,0x00,0x04}}, // '^' (unsupported)
    {{0x00,0x00,0x00,0x00,0x00,0x00,0x1F}}, // '_'
};

inline const Glyph5x7& glyph5x7(char c) {
    if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    const int i = static_cast<unsigned char>(c);
    if (i < FONT_FIRST || i > FONT_LAST) return kFont5x7['?' - FONT_FIRST];
    return kFont5x7[i - FONT_FIRST];
}

// Pixel width of `text` at `scale` (one blank column between glyphs).
inline int textWidth5x7(const std::string& text, int scale) {
    return static_cast<int>(text.size()) * 6 * scale;
}

inline void drawText5x7(SDL_Renderer* r, int x, int y, int scale, Color c, const std::string& text) {
    SDL_SetRenderDrawBlendMode(r, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(r, c.r, c.g, c.b, c.a);

    int penX = x;
    for (char ch : text) {
        const Glyph5x7& g = glyph5x7(ch);
        for (int row = 0; row < 7; ++row) {
            for (int col = 0; col < 5; ++col) {
                if (!(g.rows[row] & (1 << (4 - col)))) continue;
                SDL_Rect px{penX + col * scale, y + row * scale, scale, scale};
                SDL_RenderFillRect(r, &px);
            }
        }
        penX += 6 * scale;
    }
}

// Greedy word wrap into lines of at most `maxChars` characters. Words longer
// than a line are split.
inline std::vector<std::string> wrapText(const std::string& text, int maxChars) {
    if (maxChars < 1) maxChars = 1;
    const size_t limit = static_cast<size_t>(maxChars);

    std::vector<std::string> lines;
    std::string line;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && text[i] == ' ') ++i;
        size_t j = i;
        while (j < text.size() && text[j] != ' ') ++j;
        std::string word = text.substr(i, j - i);
        i = j;
        if (word.empty()) break;

        while (word.size() > limit) {
            if (!line.empty()) {
                lines.push_back(line);
                line.clear();
            }
            lines.push_back(word.substr(0, limit));
            word.erase(0, limit);
        }
        if (line.empty()) {
            line = word;
        } else if (line.size() + 1 + word.size() <= limit) {
            line += " " + word;
        } else {
            lines.push_back(line);
            line = word;
        }
    }
    if (!line.empty()) lines.push_back(line);
    return lines;
}

// Draws wrapped text and returns the number of lines used.
inline int drawTextWrapped5x7(SDL_Renderer* r, int x, int y, int scale, Color c,
                              const std::string& text, int maxWidthPx) {
    if (scale <= 0) scale = 1;
    const std::vector<std::string> lines = wrapText(text, maxWidthPx / (6 * scale));
    int cy = y;
    for (const std::string& l : lines) {
        drawText5x7(r, x, cy, scale, c, l);
        cy += 8 * scale;
    }
    return static_cast<int>(lines.size());
}
