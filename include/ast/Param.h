#pragma once

#include <memory>
#include <string>

namespace pybox::ast {
    struct Expr; // fwd

    enum class ParamKind { Positional, PositionalOnly, VarArgs, KeywordOnly, KwArgs };

    struct Param {
        std::string name;
        ParamKind kind{ParamKind::Positional};
        std::unique_ptr<Expr> defaultValue{}; // optional
        std::unique_ptr<Expr> annotation{};   // optional; never evaluated
        int line{0};
    };
} // namespace pybox::ast
