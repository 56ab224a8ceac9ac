#pragma once

#include <utility>
#include <memory>
#include <string>
#include <vector>
#include "ast/Call.h"
#include "ast/Expr.h"
#include "ast/HasBody.h"
#include "ast/HasName.h"
#include "ast/Stmt.h"

namespace pybox::ast {
    // Parsed so the validator can walk it; the interpreter rejects it.
    struct ClassDef final : Stmt, HasBody<Stmt>, HasName {
        std::vector<std::unique_ptr<Expr>> bases;
        std::vector<KeywordArg> keywords;
        std::vector<std::unique_ptr<Expr>> decorators;
        explicit ClassDef(std::string n) : Stmt(NodeKind::ClassDef), HasName{std::move(n)} {}
    };
}
