#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include "arg_parser.hpp"

// Parse a size_t from a string.
// Format: decimal digits only.
// Bounds: inclusive [min, max].
// Invalid input: conversion failure or out-of-range sets ok=false and returns 0.
std::size_t parse_size_t(const std::string& value, std::size_t min, std::size_t max, bool& ok);

// Same as above for the value of @p flag. A missing flag sets ok=false.
std::size_t parse_size_t(const ArgParser& parser, const std::string& flag, std::size_t min,
                         std::size_t max, bool& ok);

// Parse a duration string like "90", "30s", "2m" or "1h".
// Format: non-negative integer followed by an optional s, m or h (seconds by default).
// Invalid input: parse failure sets ok=false and returns 0s.
std::chrono::seconds parse_duration(const std::string& value, bool& ok);

std::chrono::seconds parse_duration(const ArgParser& parser, const std::string& flag, bool& ok);

// Parse a boolean config value.
// Format: 1/true/yes/on or 0/false/no/off, case-insensitive. Empty counts as true.
bool parse_bool(const std::string& value, bool& ok);

#endif // PARSE_UTILS_HPP
