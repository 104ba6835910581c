#pragma once

#include "position.hpp"

#include <cstddef>
#include <string>
#include <utility>

namespace lexemizer {

enum class Severity { Error, Warning };

// A problem found in one lexeme. `span` covers the whole lexeme, `at` points
// at the offending character inside it.
struct Diagnostic {
  Severity severity;
  std::string message;
  Span span;
  Position at;

  Diagnostic(Severity sev, std::string msg, Span s, Position p)
      : severity(sev), message(std::move(msg)), span(s), at(p) {}
};

const char *to_string(Severity severity);

} // namespace lexemizer
