/**
 * Name: pybox::lex::TokenKind helpers
 * Purpose: Stable names for token kinds (token dumps and diagnostics).
 */
#include "lexer/TokenKind.h"

namespace pybox::lex {
    const char *to_string(const TokenKind k) {
        using enum pybox::lex::TokenKind;
        switch (k) {
            case End: return "End";
            case Newline: return "Newline";
            case Indent: return "Indent";
            case Dedent: return "Dedent";
            case Error: return "Error";
            case Def: return "Def";
            case Return: return "Return";
            case Del: return "Del";
            case If: return "If";
            case Else: return "Else";
            case Elif: return "Elif";
            case While: return "While";
            case For: return "For";
            case In: return "In";
            case Break: return "Break";
            case Continue: return "Continue";
            case Pass: return "Pass";
            case Try: return "Try";
            case Except: return "Except";
            case Finally: return "Finally";
            case With: return "With";
            case As: return "As";
            case Import: return "Import";
            case From: return "From";
            case Class: return "Class";
            case Async: return "Async";
            case Assert: return "Assert";
            case Raise: return "Raise";
            case Global: return "Global";
            case Nonlocal: return "Nonlocal";
            case Yield: return "Yield";
            case Await: return "Await";
            case Lambda: return "Lambda";
            case Is: return "Is";
            case And: return "And";
            case Or: return "Or";
            case Not: return "Not";
            case NoneLit: return "NoneLit";
            case BoolLit: return "BoolLit";
            case At: return "At";
            case Arrow: return "Arrow";
            case Colon: return "Colon";
            case ColonEqual: return "ColonEqual";
            case Semicolon: return "Semicolon";
            case Comma: return "Comma";
            case Dot: return "Dot";
            case Ellipsis: return "Ellipsis";
            case Equal: return "Equal";
            case Plus: return "Plus";
            case PlusEqual: return "PlusEqual";
            case Minus: return "Minus";
            case MinusEqual: return "MinusEqual";
            case Star: return "Star";
            case StarEqual: return "StarEqual";
            case StarStar: return "StarStar";
            case StarStarEqual: return "StarStarEqual";
            case Slash: return "Slash";
            case SlashEqual: return "SlashEqual";
            case SlashSlash: return "SlashSlash";
            case SlashSlashEqual: return "SlashSlashEqual";
            case Percent: return "Percent";
            case PercentEqual: return "PercentEqual";
            case LShift: return "LShift";
            case LShiftEqual: return "LShiftEqual";
            case RShift: return "RShift";
            case RShiftEqual: return "RShiftEqual";
            case Amp: return "Amp";
            case AmpEqual: return "AmpEqual";
            case Pipe: return "Pipe";
            case PipeEqual: return "PipeEqual";
            case Caret: return "Caret";
            case CaretEqual: return "CaretEqual";
            case Tilde: return "Tilde";
            case EqEq: return "EqEq";
            case NotEq: return "NotEq";
            case Lt: return "Lt";
            case Le: return "Le";
            case Gt: return "Gt";
            case Ge: return "Ge";
            case LParen: return "LParen";
            case RParen: return "RParen";
            case LBracket: return "LBracket";
            case RBracket: return "RBracket";
            case LBrace: return "LBrace";
            case RBrace: return "RBrace";
            case Ident: return "Ident";
            case Int: return "Int";
            case Float: return "Float";
            case Imag: return "Imag";
            case String: return "String";
            case Bytes: return "Bytes";
        }
        return "Unknown";
    }
} // namespace pybox::lex
