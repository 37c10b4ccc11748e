#ifndef PRISM_CON_HIGHLIGHT_FORMATTER_HPP
#define PRISM_CON_HIGHLIGHT_FORMATTER_HPP

#include "../core/palette.hpp"
#include "../core/role_flags.hpp"
#include <algorithm>
#include <utility>
#include <string>
#include <vector>

namespace prism {

    /// One keyword map plus the colour used for its words that carry no
    /// colour of their own.
    struct KeywordLayer {
        const WordColourMap *words;
        std::string defaultColour;

        KeywordLayer(const WordColourMap *w, std::string colour)
            : words(w), defaultColour(std::move(colour)) {}
    };

    /// Keyword highlighting for normal output.
    ///
    /// Splits the text on every keyword (longest first) and emits each piece
    /// as `reset + colour + piece`.  Text outside keywords gets the message
    /// colour.  Earlier layers win when a word appears in several maps, and
    /// a word is only considered if it is shorter than the text itself.
    /// The separator is always rendered in the disabled colour.
    ///
    /// Stateless and idempotent: the same inputs always give the same output.
    /// With colour disabled the text is returned unchanged.
    class HighlightFormatter {
    public:
        static std::string format(const std::string &text,
                                  const std::string &messageColour,
                                  const std::vector<KeywordLayer> &layers,
                                  const Palette &palette,
                                  const std::string &separator) {
            if (!palette.enabled) return text;

            WordColourMap merged;
            for (size_t i = 0; i < layers.size(); ++i) {
                if (!layers[i].words) continue;
                for (WordColourMap::const_iterator it = layers[i].words->begin();
                     it != layers[i].words->end(); ++it) {
                    // Empty keywords cannot be split on; skip them.
                    if (it->first.empty() || it->first.size() >= text.size()) continue;
                    if (merged.count(it->first)) continue;
                    merged[it->first] = it->second.empty() ? layers[i].defaultColour : it->second;
                }
            }
            if (!separator.empty()) {
                merged[separator] = palette.disabled;
            }

            std::vector<std::string> words;
            words.reserve(merged.size());
            for (WordColourMap::const_iterator it = merged.begin(); it != merged.end(); ++it) {
                words.push_back(it->first);
            }
            std::stable_sort(words.begin(), words.end(),
                [](const std::string &a, const std::string &b) { return a.size() > b.size(); });

            std::vector<Piece> pieces(1, Piece(text, messageColour, false));
            for (size_t w = 0; w < words.size(); ++w) {
                pieces = splitOn(pieces, words[w], merged[words[w]]);
            }

            std::string result;
            result.reserve(text.size() + pieces.size() * 12);
            for (size_t i = 0; i < pieces.size(); ++i) {
                result += palette.none;
                result += pieces[i].colour;
                result += pieces[i].text;
            }
            return result;
        }

    private:
        struct Piece {
            std::string text;
            std::string colour;
            bool keyword;  ///< already a matched keyword; never split again

            Piece(std::string t, std::string c, bool k)
                : text(std::move(t)), colour(std::move(c)), keyword(k) {}
        };

        static std::vector<Piece> splitOn(const std::vector<Piece> &pieces,
                                          const std::string &word,
                                          const std::string &wordColour) {
            std::vector<Piece> result;
            result.reserve(pieces.size());
            for (size_t i = 0; i < pieces.size(); ++i) {
                const Piece &piece = pieces[i];
                if (piece.keyword) {
                    result.push_back(piece);
                    continue;
                }
                size_t start = 0;
                size_t pos;
                while ((pos = piece.text.find(word, start)) != std::string::npos) {
                    result.push_back(Piece(piece.text.substr(start, pos - start), piece.colour, false));
                    result.push_back(Piece(word, wordColour, true));
                    start = pos + word.size();
                }
                result.push_back(Piece(piece.text.substr(start), piece.colour, false));
            }
            return result;
        }
    };

} // namespace prism

#endif // PRISM_CON_HIGHLIGHT_FORMATTER_HPP
