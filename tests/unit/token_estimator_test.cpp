#include <cassert>
#include <stdexcept>
#include <string>
#include "text/token_estimator.hpp"

int main() {
    text::CharacterRatioEstimator chars;
    assert(chars.estimate("a") == 1);
    assert(chars.estimate("abcd") == 1);
    assert(chars.estimate("abcde") == 2);
    // Code points, not bytes: 21 characters, 22 bytes
    assert(text::utf8_length("Satz zwei ist länger.") == 21);
    assert(chars.estimate("Satz zwei ist länger.") == 6);
    assert(chars.estimate("Satz eins ist kurz.") == 5);
    // Deterministic
    assert(chars.estimate("Wiederholung") == chars.estimate("Wiederholung"));

    text::WordRatioEstimator words;
    assert(words.estimate("eins zwei drei") >= 10);
    assert(words.estimate("eins zwei drei") < words.estimate("eins zwei drei vier fünf sechs sieben acht neun zehn"));

    auto c = text::make_heuristic_estimator("chars");
    assert(c->name() == "chars");
    auto w = text::make_heuristic_estimator("words");
    assert(w->name() == "words");
    bool threw = false;
    try {
        text::make_heuristic_estimator("bytes");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // "ä" is two bytes; position 1 sits inside it
    const std::string s = "aäb";
    assert(text::utf8_boundary(s, 0) == 0);
    assert(text::utf8_boundary(s, 1) == 1);
    assert(text::utf8_boundary(s, 2) == 3);
    assert(text::utf8_boundary(s, 10) == s.size());
    return 0;
}
