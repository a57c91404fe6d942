#include "hideez/prompt.hpp"

#include <istream>
#include <ostream>

namespace hideez {

static void trim(std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) { s.clear(); return; }
    const auto e = s.find_last_not_of(" \t\r\n");
    s = s.substr(b, e - b + 1);
}

bool Prompt::ask(const std::string& text,
                 const std::optional<std::string>& def,
                 std::string& answer,
                 std::string& err,
                 const Validator& validate) {
    for (;;) {
        out_ << text;
        if (def) out_ << " [" << *def << "]";
        out_ << ": " << std::flush;

        std::string line;
        if (!std::getline(in_, line)) {
            out_ << '\n';
            if (!def) { err = "input_closed"; return false; }
            answer = *def;
            return true;
        }
        trim(line);

        if (line.empty()) {
            if (!def) {
                out_ << "Error: a value is required\n";
                continue;
            }
            line = *def;
        }

        std::string reason;
        if (validate && !validate(line, reason)) {
            out_ << "Error: " << reason << '\n';
            continue;
        }
        answer = line;
        return true;
    }
}

} // namespace hideez
