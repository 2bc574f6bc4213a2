// Stand-in correction worker speaking the line protocol.
// Answers with the text after the last blank line, "punkt" capitalized.
// Text containing SCHLAF makes it hang, ABSTURZ makes it exit.
// With "--silent" it never reports READY.
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include "llm/process_corrector.hpp"

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--silent") {
            std::this_thread::sleep_for(std::chrono::seconds(60));
            return 0;
        }
    }
    std::cout << llm::kReadyLine << std::endl;

    std::string line;
    while (std::getline(std::cin, line)) {
        const std::string prompt = llm::unescape_line(line);
        const size_t cut = prompt.rfind("\n\n");
        std::string text = cut == std::string::npos ? prompt : prompt.substr(cut + 2);
        if (text.find("SCHLAF") != std::string::npos) {
            std::this_thread::sleep_for(std::chrono::seconds(60));
        }
        if (text.find("ABSTURZ") != std::string::npos) {
            return 3;
        }
        for (size_t pos = text.find("punkt"); pos != std::string::npos; pos = text.find("punkt", pos + 1)) {
            text[pos] = 'P';
        }
        std::cout << llm::escape_line(text) << std::endl;
    }
    return 0;
}
