/**
 * Name: pybox::lex::FileInput
 * Purpose: Fragment text read from a file on disk.
 */
#pragma once

#include <fstream>
#include <string>
#include "lexer/InputSource.h"

namespace pybox::lex {

class FileInput : public InputSource {
public:
    // Throws exceptions::FileReadError when the file cannot be opened.
    explicit FileInput(std::string path);

    bool getline(std::string& out) override;

    const std::string& name() const override { return path_; }

private:
    std::string path_{};
    std::ifstream in_{};
};

} // namespace pybox::lex
