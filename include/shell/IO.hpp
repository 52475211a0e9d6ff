#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

namespace dw::shell {

// Operator-facing channel: report lines, prompts, answers.
struct IO {
    virtual ~IO() = default;
    virtual void print(std::string_view s) = 0;
    virtual bool confirm(std::string_view prompt, bool def_no) = 0;
    virtual std::string prompt(std::string_view prompt, std::string_view def) = 0;
};

class TerminalIO final : public IO {
public:
    TerminalIO();   // stdin / stdout
    TerminalIO(std::istream& in, std::ostream& out);

    void print(std::string_view msg) override;
    bool confirm(std::string_view promptIn, bool def_no) override;
    std::string prompt(std::string_view promptIn, std::string_view def) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

}
