// Copyright (c) 2025 VAM Desktop Live Whisper
// Prompt construction for the correction model

#include "text/correction_prompts.hpp"
#include "core/logging.hpp"
#include "text/token_estimator.hpp"

#include <stdexcept>

namespace text {

namespace {

const char* const kSystemLight =
    "Du bist ein Assistent für Rechtschreibkorrektur. Deine Aufgabe ist es, offensichtliche "
    "Rechtschreibfehler in deutschen Texten zu korrigieren, ohne dabei die ursprüngliche Bedeutung "
    "oder den Stil zu verändern.\n\n"
    "Befolge diese Regeln:\n"
    "- Korrigiere nur eindeutige Rechtschreibfehler\n"
    "- Behalte die ursprüngliche Satzstruktur bei\n"
    "- Verändere keine Umgangssprache oder regionalen Ausdrücke\n"
    "- Behalte alle Satzzeichen bei\n"
    "- Antworte nur mit dem korrigierten Text, ohne zusätzliche Erklärungen\n"
    "- Falls der Text bereits korrekt ist, gib ihn unverändert zurück";

const char* const kSystemStandard =
    "Du bist ein Assistent für Grammatik- und Rechtschreibkorrektur. Deine Aufgabe ist es, deutsche "
    "Texte zu korrigieren und dabei sowohl Rechtschreibung als auch grundlegende Grammatikfehler zu "
    "beheben.\n\n"
    "Befolge diese Regeln:\n"
    "- Korrigiere Rechtschreibfehler und grundlegende Grammatikfehler\n"
    "- Verbessere falsche Wortstellungen und Zeitformen\n"
    "- Korrigiere falsche Artikel (der, die, das)\n"
    "- Behalte den ursprünglichen Stil und Ton bei\n"
    "- Verändere keine bewussten Stilmittel oder Wortwahl\n"
    "- Behalte Umgangssprache bei, korrigiere aber deren Grammatik\n"
    "- Antworte nur mit dem korrigierten Text, ohne zusätzliche Erklärungen\n"
    "- Falls der Text bereits korrekt ist, gib ihn unverändert zurück";

const char* const kSystemStrict =
    "Du bist ein Assistent für umfassende Textkorrektur. Deine Aufgabe ist es, deutsche Texte "
    "vollständig zu korrigieren und zu optimieren, um höchste sprachliche Qualität zu erreichen.\n\n"
    "Befolge diese Regeln:\n"
    "- Korrigiere alle Rechtschreib- und Grammatikfehler\n"
    "- Verbessere Satzbau und Wortstellung für bessere Lesbarkeit\n"
    "- Optimiere Wortwahl und verwende präzisere Begriffe wo angebracht\n"
    "- Korrigiere Zeichensetzung und Groß-/Kleinschreibung\n"
    "- Wandle Umgangssprache in Standarddeutsch um\n"
    "- Verbessere den Textfluss und die Kohärenz\n"
    "- Behalte die ursprüngliche Bedeutung und Kernaussagen bei\n"
    "- Antworte nur mit dem korrigierten Text, ohne zusätzliche Erklärungen\n"
    "- Falls der Text bereits auf höchstem Niveau ist, gib ihn unverändert zurück";

const char* const kUserCorrection = "Korrigiere folgenden Text:\n\n";

const char* const kUserDialect =
    "Wandle den folgenden dialektalen oder umgangssprachlichen Text in korrektes Hochdeutsch um, "
    "behalte aber die ursprüngliche Bedeutung bei:\n\n";

const char* const kUserContextHead =
    "Korrigiere folgenden Text. Beachte dabei den Kontext der vorherigen und nachfolgenden "
    "Textpassagen:\n\nVorheriger Kontext: ";

const char* const kSystemLightEn =
    "You are a spelling correction assistant. Your task is to fix obvious spelling mistakes in "
    "German texts without changing their meaning or style.\n\n"
    "Follow these rules:\n"
    "- Only fix clear spelling mistakes\n"
    "- Keep the original sentence structure\n"
    "- Do not change colloquial or regional expressions\n"
    "- Keep all punctuation\n"
    "- Reply with the corrected text only, without explanations\n"
    "- If the text is already correct, return it unchanged";

const char* const kSystemStandardEn =
    "You are a grammar and spelling correction assistant. Your task is to correct German texts, "
    "fixing spelling as well as basic grammar mistakes.\n\n"
    "Follow these rules:\n"
    "- Fix spelling and basic grammar mistakes\n"
    "- Fix wrong word order and tenses\n"
    "- Fix wrong articles (der, die, das)\n"
    "- Keep the original style and tone\n"
    "- Do not change deliberate stylistic choices or wording\n"
    "- Keep colloquial language but fix its grammar\n"
    "- Reply with the corrected text only, without explanations\n"
    "- If the text is already correct, return it unchanged";

const char* const kSystemStrictEn =
    "You are a comprehensive text correction assistant. Your task is to fully correct and polish "
    "German texts to the highest linguistic quality.\n\n"
    "Follow these rules:\n"
    "- Fix all spelling and grammar mistakes\n"
    "- Improve sentence structure and word order for readability\n"
    "- Use more precise wording where appropriate\n"
    "- Fix punctuation and capitalization\n"
    "- Turn colloquial language into standard German\n"
    "- Improve flow and coherence\n"
    "- Keep the original meaning and key statements\n"
    "- Reply with the corrected text only, without explanations\n"
    "- If the text is already of the highest quality, return it unchanged";

const char* const kUserCorrectionEn = "Correct the following text:\n\n";

const char* const kUserDialectEn =
    "Convert the following dialectal or colloquial text into correct standard German while "
    "keeping its original meaning:\n\n";

const char* const kUserContextHeadEn =
    "Correct the following text. Take the context of the previous and following passages into "
    "account:\n\nPrevious context: ";

struct PromptTexts {
    const char* system_light;
    const char* system_standard;
    const char* system_strict;
    const char* user_correction;
    const char* user_dialect;
    const char* context_head;
    const char* no_prev_context;
    const char* text_marker;
    const char* next_context_head;
    const char* no_next_context;
};

const PromptTexts kGerman = {
    kSystemLight, kSystemStandard, kSystemStrict, kUserCorrection, kUserDialect, kUserContextHead,
    "[Kein vorheriger Kontext]", "\n\nZU KORRIGIERENDER TEXT:\n", "\n\nNachfolgender Kontext: ",
    "[Kein nachfolgender Kontext]",
};

const PromptTexts kEnglish = {
    kSystemLightEn, kSystemStandardEn, kSystemStrictEn, kUserCorrectionEn, kUserDialectEn,
    kUserContextHeadEn, "[No previous context]", "\n\nTEXT TO CORRECT:\n", "\n\nFollowing context: ",
    "[No following context]",
};

const PromptTexts& prompt_texts(const std::string& language) {
    if (language == "en") return kEnglish;
    if (language != "de") {
        core::log_warn("[prompts] language " + language + " not supported, using de");
    }
    return kGerman;
}

const char* system_prompt(CorrectionLevel level, const PromptTexts& t = kGerman) {
    switch (level) {
    case CorrectionLevel::Light: return t.system_light;
    case CorrectionLevel::Standard: return t.system_standard;
    case CorrectionLevel::Strict: return t.system_strict;
    }
    return t.system_standard;
}

} // namespace

const char* to_string(CorrectionLevel level) {
    switch (level) {
    case CorrectionLevel::Light: return "light";
    case CorrectionLevel::Standard: return "standard";
    case CorrectionLevel::Strict: return "strict";
    }
    return "standard";
}

CorrectionLevel parse_correction_level(const std::string& name) {
    if (name == "light") return CorrectionLevel::Light;
    if (name == "standard") return CorrectionLevel::Standard;
    if (name == "strict") return CorrectionLevel::Strict;
    throw std::invalid_argument("invalid correction level: " + name + " (light, standard, strict)");
}

std::vector<CorrectionLevel> available_levels() {
    return {CorrectionLevel::Light, CorrectionLevel::Standard, CorrectionLevel::Strict};
}

CorrectionPrompt build_correction_prompt(const PromptRequest& request) {
    if (request.text.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw std::invalid_argument("text cannot be empty or only whitespace");
    }
    if (utf8_length(request.text) > kMaxPromptTextChars) {
        throw std::invalid_argument("text too long for a single prompt (max 10,000 characters)");
    }

    const PromptTexts& t = prompt_texts(request.language);
    CorrectionPrompt p;
    p.system = system_prompt(request.level, t);
    const bool has_context = (request.prev_context && !request.prev_context->empty()) ||
                             (request.next_context && !request.next_context->empty());
    if (request.dialect_normalization) {
        p.user = std::string(t.user_dialect) + request.text;
    } else if (has_context) {
        p.user = t.context_head;
        p.user += (request.prev_context && !request.prev_context->empty())
                      ? *request.prev_context : std::string(t.no_prev_context);
        p.user += t.text_marker;
        p.user += request.text;
        p.user += t.next_context_head;
        p.user += (request.next_context && !request.next_context->empty())
                      ? *request.next_context : std::string(t.no_next_context);
    } else {
        p.user = std::string(t.user_correction) + request.text;
    }
    return p;
}

int estimate_prompt_tokens(const std::string& text, CorrectionLevel level) {
    const size_t chars = utf8_length(system_prompt(level)) +
                         utf8_length(std::string(kUserCorrection) + "{text}") +
                         utf8_length(text);
    return static_cast<int>(static_cast<double>(chars / 4) * 1.2);
}

} // namespace text
