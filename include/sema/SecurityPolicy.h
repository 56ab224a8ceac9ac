/***
 * Name: pybox::sema policy tables
 * Purpose: Deny and allow lists consulted by the static security walk.
 * Theory of Operation:
 *   Imports are judged on their first dotted component. The allow list is
 *   consulted first; anything else that starts with a denied prefix is a
 *   violation (prefix match, so "osmosis" is denied by "os"), and the rest
 *   only warns. Attribute names are also denied when used as constant string
 *   subscripts.
 */
#pragma once

#include <array>
#include <string>
#include <string_view>

namespace pybox::sema {

inline constexpr std::array<std::string_view, 13> kAllowedImports{
    "asyncio", "typing", "dataclasses", "enum", "collections", "itertools", "functools",
    "math", "random", "re", "json", "time", "api"};

inline constexpr std::array<std::string_view, 38> kForbiddenModulePrefixes{
    "os",       "sys",        "subprocess", "socket",    "http",     "urllib",   "ftplib",
    "smtplib",  "pickle",     "shelve",     "marshal",   "importlib", "builtins", "__builtins__",
    "ctypes",   "multiprocessing", "threading", "concurrent", "signal", "resource", "pty",
    "tty",      "termios",    "fcntl",      "mmap",      "sysconfig", "platform", "getpass",
    "shutil",   "tempfile",   "pathlib",    "glob",      "fnmatch",  "linecache", "tokenize",
    "code",     "codeop",     "compile"};

inline constexpr std::array<std::string_view, 26> kForbiddenCalls{
    "exec",        "eval",     "compile",  "open",       "input",        "__import__", "globals",
    "locals",      "vars",     "setattr",  "delattr",    "issubclass",   "super",      "classmethod",
    "staticmethod", "property", "memoryview", "bytearray", "bytes",      "breakpoint", "help",
    "license",     "credits",  "copyright", "quit",      "exit"};

inline constexpr std::array<std::string_view, 6> kForbiddenMethods{
    "system", "popen", "spawn", "exec", "execv", "execve"};

inline constexpr std::array<std::string_view, 36> kForbiddenAttributes{
    "__class__",   "__bases__",   "__subclasses__", "__mro__",     "__code__",     "__globals__",
    "__dict__",    "__module__",  "__import__",     "__builtins__", "__loader__",  "__spec__",
    "__file__",    "__cached__",  "__annotations__", "__kwdefaults__", "__closure__", "__func__",
    "__self__",    "__name__",    "__qualname__",   "func_code",   "func_globals", "gi_frame",
    "gi_code",     "cr_frame",    "cr_code",        "ag_frame",    "ag_code",      "f_back",
    "f_builtins",  "f_code",      "f_globals",      "f_locals",    "tb_frame",     "tb_next"};

enum class ImportVerdict { Allowed, Unknown, Forbidden };

// Classify a dotted module name by its first component.
ImportVerdict classifyImport(std::string_view dottedName);

bool isForbiddenCall(std::string_view name);
bool isForbiddenMethod(std::string_view name);
bool isForbiddenAttribute(std::string_view name);

} // namespace pybox::sema
