#pragma once

#include <string>

namespace arena::submission {

// Name of the first `def name(` in a stub, or "solve" when there is none.
std::string entry_point_from_stub(const std::string& stub);

// Derives the executable form of a raw agent response.
//
// Tried in order, first hit wins:
//   1. the whole response, when it already reads as code defining the entry point;
//   2. the first fenced code block that does;
//   3. the `def <entry_point>` block, dedented to column zero;
//   4. code-looking lines wrapped into `def <entry_point>():`;
//   5. `def <entry_point>():` with a `pass` body.
//
// Every result is in normal form (no CR, no trailing whitespace, no leading
// or trailing blank lines) and reads as code, so extracting it again returns
// it unchanged.
std::string extract_executable(const std::string& raw, const std::string& entry_point);

// True when `text` is in the form extract_executable produces.
bool is_executable_form(const std::string& text, const std::string& entry_point);

}  // namespace arena::submission
