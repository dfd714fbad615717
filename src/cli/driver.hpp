//! # CLI Driver Interface
//!
//! Entry point called by `main()`.

#pragma once

int cyforge_main(int argc, char* argv[]);
