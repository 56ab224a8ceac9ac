/**
 * Name: Lexer headers umbrella
 * Purpose: Stable include aggregating the single-declaration lexer headers.
 */
#pragma once

#include "lexer/TokenKind.h"
#include "lexer/Token.h"
#include "lexer/ITokenStream.h"
#include "lexer/InputSource.h"
#include "lexer/FileInput.h"
#include "lexer/StringInput.h"
#include "lexer/LexerDecl.h"
