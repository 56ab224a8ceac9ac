#pragma once

#include <string>

namespace pybox::ast {
    // `name [as asname]` inside an import statement
    struct Alias {
        std::string name;
        std::string asname; // empty if none
        int line{0};
    };
}
