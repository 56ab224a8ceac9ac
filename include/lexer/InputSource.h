/**
 * Name: pybox::lex::InputSource
 * Purpose: Line-oriented source of fragment text.
 */
#pragma once

#include <string>

namespace pybox::lex {

class InputSource {
public:
    virtual ~InputSource() = default;

    virtual bool getline(std::string& out) = 0; // false on EOF
    virtual const std::string& name() const = 0;
};

} // namespace pybox::lex
