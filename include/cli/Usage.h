#pragma once

#include <string>

namespace pybox::cli {

    std::string Usage();

} // namespace pybox::cli
