#include <cassert>
#include <string>
#include "text/rule_based_corrector.hpp"

int main() {
    auto r = text::rule_based_correct("hallo äh welt. das ist ähm gut", false);
    assert(r.corrected_text == "Hallo welt. Das ist gut.");
    assert(r.corrections.size() == 3);
    assert(r.improvement_score > 0.0);

    // Repeated fillers collapse too
    auto rep = text::rule_based_correct("also äh äh gut", false);
    assert(rep.corrected_text == "also gut");

    auto d = text::rule_based_correct("ich hab das net gesehen", true);
    assert(d.corrected_text == "ich habe das nicht gesehen");
    assert(d.corrections.size() == 2);

    auto nd = text::rule_based_correct("ich hab das net gesehen", false);
    assert(nd.corrected_text == "ich hab das net gesehen");
    assert(nd.corrections.empty());
    assert(nd.improvement_score == 0.0);

    auto umlaut = text::rule_based_correct("erster satz. über den rest.", false);
    assert(umlaut.corrected_text == "Erster satz. Über den rest.");
    return 0;
}
