#include "shell/IO.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

using namespace dw::shell;

namespace {

std::string trimLower(std::string v) {
    const auto notSpace = [](const unsigned char c) { return !std::isspace(c); };
    v.erase(v.begin(), std::ranges::find_if(v, notSpace));
    v.erase(std::find_if(v.rbegin(), v.rend(), notSpace).base(), v.end());
    std::ranges::transform(v, v.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v;
}

}

TerminalIO::TerminalIO() : in_(std::cin), out_(std::cout) {}

TerminalIO::TerminalIO(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

void TerminalIO::print(const std::string_view msg) {
    out_ << msg;
    if (msg.empty() || msg.back() != '\n') out_ << '\n';
    out_.flush();
}

bool TerminalIO::confirm(const std::string_view promptIn, const bool def_no) {
    const auto v = trimLower(prompt(promptIn, ""));
    if (v == "y" || v == "yes") return true;
    if (v == "n" || v == "no") return false;
    if (v.empty()) return !def_no;
    return false;
}

std::string TerminalIO::prompt(const std::string_view promptIn, const std::string_view def) {
    out_ << promptIn;
    out_.flush();

    std::string line;
    if (!std::getline(in_, line)) return std::string{def};
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line.empty() ? std::string{def} : line;
}
