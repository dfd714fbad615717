//! # Annotator
//!
//! Inserts optimisation directive comments into a source file before it is
//! handed to the compiler.
//!
//! ## Directives
//!
//! ```text
//! # cimport cython                              once, at the top
//! # @boundscheck(False)                         before def / async def / cpdef
//! # @wraparound(False)
//! # @nonecheck(False)
//! # @cdivision(True)
//! # cdef int i (annotated)                      before `for i in range(...)`
//! # @boundscheck(False) @wraparound(False) (loop)   before other for / while loops
//! ```
//!
//! This is a line-based heuristic, not a parser. Loops hidden in
//! comprehensions, `map()` calls or multi-statement lines are not detected.
//! Lines inside triple-quoted strings are left alone.
//!
//! A directive is only inserted when it does not already directly precede
//! the construct, so annotating an annotated file changes nothing.

#ifndef CYFORGE_ANNOTATE_ANNOTATOR_HPP
#define CYFORGE_ANNOTATE_ANNOTATOR_HPP

#include "common.hpp"
#include "scan/source_unit.hpp"

#include <string>
#include <string_view>

namespace cyforge::annotate {

struct AnnotatorOptions {
    bool annotate_functions = true;
    bool annotate_loops = true;
    std::string header_line = "# cimport cython";
};

struct AnnotatedSource {
    std::string text;
    size_t directives_added = 0;
};

class Annotator {
public:
    explicit Annotator(AnnotatorOptions options = {});

    /// Annotated copy of `source`. Idempotent.
    std::string annotate(std::string_view source) const;

    /// Reads the unit from disk and annotates it. Fails when the file cannot
    /// be read.
    Result<AnnotatedSource, std::string> annotate_unit(const SourceUnit& unit) const;

private:
    AnnotatedSource annotate_counted(std::string_view source) const;

    AnnotatorOptions options_;
};

} // namespace cyforge::annotate

#endif // CYFORGE_ANNOTATE_ANNOTATOR_HPP
