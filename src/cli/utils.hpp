//! # CLI Utilities Interface
//!
//! Shared helpers for the command-line front end.
//!
//! ## Functions
//!
//! | Function          | Description                          |
//! |-------------------|--------------------------------------|
//! | `split_words()`   | Split an option value on whitespace  |
//! | `format_size()`   | Human readable byte count            |
//! | `print_usage()`   | Print CLI help text                  |
//! | `print_version()` | Print tool version                   |

#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cyforge::cli {

// Option values
std::vector<std::string> split_words(std::string_view text);

// Output
std::string format_size(uintmax_t bytes);

// Help text
void print_usage();
void print_version();

} // namespace cyforge::cli
