#include <cassert>
#include <string>
#include <vector>
#include "text/sentence_splitter.hpp"

static std::vector<std::string> sentences(const text::SentenceSplitter& sp, const std::string& s) {
    std::vector<std::string> out;
    for (const auto& span : sp.split(s)) out.push_back(s.substr(span.begin, span.end - span.begin));
    return out;
}

int main() {
    text::SentenceSplitter plain;
    auto p = sentences(plain, "  Erster Satz. Zweiter Satz!  Dritter?! Rest ohne Punkt  ");
    assert(p.size() == 4);
    assert(p[0] == "Erster Satz.");
    assert(p[1] == "Zweiter Satz!");
    assert(p[2] == "Dritter?!");
    assert(p[3] == "Rest ohne Punkt");

    // Closing quotes stay with their sentence
    auto q = sentences(plain, "Er sagte \"Hallo.\" Dann ging er.");
    assert(q.size() == 2);
    assert(q[0] == "Er sagte \"Hallo.\"");

    // Dots inside numbers are not boundaries
    auto n = sentences(plain, "Es kostet 3.50 Euro. Gut.");
    assert(n.size() == 2);

    assert(plain.split("").empty());
    assert(plain.split(" \n\t ").empty());

    auto de = text::make_sentence_splitter("de");
    assert(de->name() == "language:de");
    auto a = sentences(*de, "Wir treffen z.B. Dr. Müller am 3. Mai. Danach gehen wir.");
    assert(a.size() == 2);
    assert(a[0] == "Wir treffen z.B. Dr. Müller am 3. Mai.");
    assert(a[1] == "Danach gehen wir.");

    // Lowercase continuation is not a new sentence
    auto l = sentences(*de, "Das ist usw. und so weiter. Ende.");
    assert(l.size() == 2);

    auto en = text::make_sentence_splitter("en");
    auto e = sentences(*en, "Mr. Smith met J. Doe. They talked.");
    assert(e.size() == 2);
    assert(e[1] == "They talked.");

    auto other = text::make_sentence_splitter("fr");
    assert(other->name() == "punctuation");
    assert(other->split("M. Dupont est là. Oui.").size() == 3);
    return 0;
}
