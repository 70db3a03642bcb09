#ifndef TESSEL_TERMINAL_HPP
#define TESSEL_TERMINAL_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace Tessel::Utils::Terminal {
    namespace Colors {
        inline constexpr std::string_view kReset        = "\033[0m";
        inline constexpr std::string_view kBrightBlack  = "\033[90m";
        inline constexpr std::string_view kBrightRed    = "\033[91m";
        inline constexpr std::string_view kBrightGreen  = "\033[92m";
        inline constexpr std::string_view kBrightYellow = "\033[93m";
        inline constexpr std::string_view kBrightBlue   = "\033[94m";
        inline constexpr std::string_view kBrightCyan   = "\033[96m";
    }

    namespace Symbols {
        inline constexpr std::string_view kCheck = "✔";
        inline constexpr std::string_view kCross = "✘";

        inline constexpr std::string_view kBoxTopLeft         = "┏";
        inline constexpr std::string_view kBoxTopSeparator    = "┳";
        inline constexpr std::string_view kBoxTopRight        = "┓";
        inline constexpr std::string_view kBoxMiddleLeft      = "┣";
        inline constexpr std::string_view kBoxMiddleSeparator = "╋";
        inline constexpr std::string_view kBoxMiddleRight     = "┫";
        inline constexpr std::string_view kBoxBottomLeft      = "┗";
        inline constexpr std::string_view kBoxBottomSeparator = "┻";
        inline constexpr std::string_view kBoxBottomRight     = "┛";
        inline constexpr std::string_view kBoxHorizontal      = "━";
        inline constexpr std::string_view kBoxVertical        = "┃";
    }

    inline std::string Repeat(std::string_view glyph, std::size_t count) {
        std::string s; s.reserve(glyph.size() * count);
        for (std::size_t i = 0; i < count; ++i) s.append(glyph);
        return s;
    }

    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }

    // Left-aligns `s` in a cell of `width` columns (ASCII content only).
    inline std::string Pad(std::string_view s, std::size_t width) {
        std::string out(s);
        if (out.size() < width) out.append(width - out.size(), ' ');
        return out;
    }

    enum class HSepKind { Top, Middle, Bottom };

    // spacings = widths of each segment between vertical junctions.
    inline std::string HSeparator(const std::vector<std::size_t>& spacings,
                                  std::string_view color,
                                  HSepKind kind) {
        using namespace Symbols;
        std::string_view left = kBoxMiddleLeft;
        std::string_view junction = kBoxMiddleSeparator;
        std::string_view right = kBoxMiddleRight;
        if (kind == HSepKind::Top) {
            left = kBoxTopLeft; junction = kBoxTopSeparator; right = kBoxTopRight;
        } else if (kind == HSepKind::Bottom) {
            left = kBoxBottomLeft; junction = kBoxBottomSeparator; right = kBoxBottomRight;
        }

        std::string out;
        out.append(left);
        for (std::size_t i = 0; i < spacings.size(); ++i) {
            out.append(Repeat(kBoxHorizontal, spacings[i]));
            if (i + 1 < spacings.size()) out.append(junction);
        }
        out.append(right);
        return ApplyColor(out, color);
    }

    inline std::string Row(const std::vector<std::string>& cells,
                           const std::vector<std::size_t>& spacings,
                           std::string_view color) {
        const std::string bar = ApplyColor(Symbols::kBoxVertical, color);
        std::string out = bar;
        for (std::size_t i = 0; i < spacings.size(); ++i) {
            const std::string cell = i < cells.size() ? cells[i] : std::string{};
            out.append(" ").append(Pad(cell, spacings[i] > 1 ? spacings[i] - 1 : 0)).append(bar);
        }
        return out;
    }
}

#endif // TESSEL_TERMINAL_HPP
