/**
 * Name: pybox::lex::StringInput
 * Purpose: Fragment text held in memory (agent submissions, tests).
 */
#pragma once

#include <sstream>
#include <string>
#include "lexer/InputSource.h"

namespace pybox::lex {

class StringInput : public InputSource {
public:
    StringInput(std::string text, std::string name);

    bool getline(std::string& out) override;

    const std::string& name() const override { return name_; }

private:
    std::string name_{};
    std::istringstream in_{};
};

} // namespace pybox::lex
