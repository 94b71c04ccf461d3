// sred - Shift-reduce front-end pipeline for rule-driven parsers in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef SRED_INCLUDE_SRED_SRED_HPP
#define SRED_INCLUDE_SRED_SRED_HPP

#include <sred/error.hpp>
#include <sred/identifier.hpp>
#include <sred/lexer.hpp>
#include <sred/recognizers.hpp>
#include <sred/grammar.hpp>

#endif
