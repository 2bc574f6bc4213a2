#include <cassert>
#include <stdexcept>
#include <string>
#include "text/correction_prompts.hpp"

using namespace text;

static bool throws_invalid(const PromptRequest& r) {
    try {
        build_correction_prompt(r);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

int main() {
    assert(parse_correction_level("light") == CorrectionLevel::Light);
    assert(parse_correction_level("standard") == CorrectionLevel::Standard);
    assert(parse_correction_level("strict") == CorrectionLevel::Strict);
    bool threw = false;
    try { parse_correction_level("aggressive"); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);
    assert(available_levels().size() == 3);
    for (auto l : available_levels()) assert(parse_correction_level(to_string(l)) == l);

    PromptRequest r;
    r.text = "das ist ein test";
    r.level = CorrectionLevel::Light;
    CorrectionPrompt light = build_correction_prompt(r);
    assert(light.system.find("Rechtschreibkorrektur") != std::string::npos);
    assert(light.user == "Korrigiere folgenden Text:\n\ndas ist ein test");
    assert(light.combined() == light.system + "\n\n" + light.user);

    r.level = CorrectionLevel::Strict;
    CorrectionPrompt strict = build_correction_prompt(r);
    assert(strict.system != light.system);
    assert(strict.system.find("Standarddeutsch") != std::string::npos);

    // The text always comes last, after a blank line
    const std::string combined = strict.combined();
    assert(combined.substr(combined.rfind("\n\n") + 2) == r.text);

    r.dialect_normalization = true;
    CorrectionPrompt dialect = build_correction_prompt(r);
    assert(dialect.user.find("Hochdeutsch") != std::string::npos);
    assert(dialect.user.size() > r.text.size());
    r.dialect_normalization = false;

    r.prev_context = std::string("Davor.");
    CorrectionPrompt ctx = build_correction_prompt(r);
    assert(ctx.user.find("Vorheriger Kontext: Davor.") != std::string::npos);
    assert(ctx.user.find("[Kein nachfolgender Kontext]") != std::string::npos);
    assert(ctx.user.find("ZU KORRIGIERENDER TEXT:\n" + r.text) != std::string::npos);
    r.prev_context.reset();

    // Language picks the instruction wording; unknown languages use German
    PromptRequest en;
    en.text = "das ist ein test";
    en.language = "en";
    CorrectionPrompt english = build_correction_prompt(en);
    assert(english.user == "Correct the following text:\n\ndas ist ein test");
    assert(english.system.find("standard German") == std::string::npos);
    assert(english.system.find("German texts") != std::string::npos);
    en.next_context = std::string("Danach.");
    CorrectionPrompt en_ctx = build_correction_prompt(en);
    assert(en_ctx.user.find("[No previous context]") != std::string::npos);
    assert(en_ctx.user.find("TEXT TO CORRECT:\n" + en.text) != std::string::npos);
    assert(en_ctx.user.find("Following context: Danach.") != std::string::npos);
    en.next_context.reset();
    en.language = "fr";
    assert(build_correction_prompt(en).user == light.user);

    PromptRequest blank;
    blank.text = " \n\t";
    assert(throws_invalid(blank));

    PromptRequest longest;
    longest.text = std::string(kMaxPromptTextChars, 'a');
    assert(!throws_invalid(longest));
    longest.text.push_back('b');
    assert(throws_invalid(longest));
    // Limit counts characters, not bytes
    PromptRequest umlauts;
    for (size_t i = 0; i < kMaxPromptTextChars; ++i) umlauts.text += "ä";
    assert(!throws_invalid(umlauts));

    assert(estimate_prompt_tokens("kurz", CorrectionLevel::Light) > 0);
    assert(estimate_prompt_tokens(std::string(4000, 'a'), CorrectionLevel::Standard) >
           estimate_prompt_tokens("kurz", CorrectionLevel::Standard));
    return 0;
}
