// sred - Shift-reduce front-end pipeline for rule-driven parsers in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef SRED_INCLUDE_SRED_ERROR_HPP
#define SRED_INCLUDE_SRED_ERROR_HPP

#include <stdexcept>
#include <string>

namespace sred {

class sred_error : public std::runtime_error { using std::runtime_error::runtime_error; };
class bad_outcome_access : public sred_error { public: bad_outcome_access() : sred_error{"lexer outcome does not hold the requested alternative"} {} };
class bad_tree_access : public sred_error { public: bad_tree_access() : sred_error{"parse tree does not hold the requested alternative"} {} };
class bad_result_access : public sred_error { public: bad_result_access() : sred_error{"token result does not hold the requested alternative"} {} };
class bad_remainder : public sred_error { public: bad_remainder() : sred_error{"recognizer remainder is not a suffix of its input"} {} };
class stalled_recognizer_error : public sred_error { public: stalled_recognizer_error() : sred_error{"recognizer succeeded without consuming input"} {} };
class reenterant_lex_error : public sred_error { public: reenterant_lex_error() : sred_error{"token stream is non-reenterant"} {} };
class reenterant_parse_error : public sred_error { public: reenterant_parse_error() : sred_error{"reduction is non-reenterant"} {} };
class bad_recognizer : public sred_error { public: bad_recognizer() : sred_error{"null or invalid recognizer"} {} };
class bad_predicate : public sred_error { public: bad_predicate() : sred_error{"null terminal predicate"} {} };

} // namespace sred

#endif
