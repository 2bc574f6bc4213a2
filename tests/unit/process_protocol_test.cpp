#include <cassert>
#include <stdexcept>
#include <string>
#include "llm/process_corrector.hpp"

int main() {
    const std::string raw = "Zeile eins\nZeile zwei\r\nPfad C:\\temp\\n";
    const std::string esc = llm::escape_line(raw);
    assert(esc.find('\n') == std::string::npos);
    assert(esc.find('\r') == std::string::npos);
    assert(llm::unescape_line(esc) == raw);
    assert(llm::escape_line("a\\b") == "a\\\\b");
    // Unknown escapes and a trailing backslash pass through
    assert(llm::unescape_line("x\\ty\\") == "x\\ty\\");

    assert(llm::clean_model_output("  \"Das ist korrigiert.\"\n") == "Das ist korrigiert.");
    assert(llm::clean_model_output("Zeile\n\n  zwei") == "Zeile zwei");
    assert(llm::clean_model_output("' zitiert '") == "zitiert");
    assert(llm::clean_model_output(" \n ").empty());

    llm::CorrectorOptions opt;
    opt.context_length = 4096;
    llm::ProcessCorrector corrector(opt);
    assert(corrector.max_chunk_tokens() == 2457);
    assert(llm::ProcessCorrector().max_chunk_tokens() == 1228);

    bool threw = false;
    opt.context_length = 8;
    try { llm::ProcessCorrector bad(opt); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);

    // Loader without a command fails cleanly
    threw = false;
    auto loader = llm::make_worker_loader({});
    try {
        loader(resource::ResourceClass::Correction, resource::LoadConfig{});
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    return 0;
}
