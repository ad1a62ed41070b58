#pragma once

#include "frontend/span.h"
#include <string>
#include <vector>
#include <ostream>
#include <stdexcept>

// ANSI color codes for terminal output
namespace colors {
    constexpr const char* RESET   = "\033[0m";
    constexpr const char* BOLD    = "\033[1m";
    constexpr const char* DIM     = "\033[2m";

    constexpr const char* RED     = "\033[31m";
    constexpr const char* GREEN   = "\033[32m";
    constexpr const char* YELLOW  = "\033[33m";
    constexpr const char* CYAN    = "\033[36m";

    // Cleared by --no-color
    extern bool enabled;

    inline const char* paint(const char* code){ return enabled ? code : ""; }
}

enum class ErrorKind {
    // Lexical
    UnterminatedTag,
    UnterminatedComment,
    UnterminatedExpression,
    InvalidCharacterInName,
    ExpressionInsideTag,
    InvalidExpression,
    // Structural
    MismatchedClosingTag,
    UnexpectedClosingTag,
    UnclosedTag,
    UnclosedBlock,
    UnexpectedBlock,
    SlotOutsideComponent,
    ReservedSlotName,
    DuplicateLet,
    LetWithoutInnerContent,
    InvalidDirective,
    DuplicateDirective,
    UnsupportedAttribute,
    InvalidTag
};

const char* error_kind_name(ErrorKind kind);

// Fatal compile error: the template does not compile
class ParseError : public std::runtime_error {
public:
    ParseError(ErrorKind kind, const std::string& description, const Span& span, const std::string& file);

    ErrorKind kind;
    std::string description;
    Span span;
    std::string file;

    // MismatchedClosingTag / UnclosedTag details
    std::string expected;
    std::string found;
    Span open_span;
    Span close_span;
};

// User error raised while evaluating a compiled template
class RenderError : public std::runtime_error {
public:
    explicit RenderError(const std::string& message) : std::runtime_error(message) {}
};

// Declarative-metadata warning; never fatal
struct Diagnostic {
    std::string file;
    Span span;
    std::string message;

    std::string to_string() const;
};

class Diagnostics {
public:
    void warn(const std::string& file, const Span& span, const std::string& message);
    void merge(const Diagnostics& other);

    const std::vector<Diagnostic>& warnings() const { return entries; }
    bool empty() const { return entries.empty(); }
    size_t size() const { return entries.size(); }

    // True when some warning message contains the fragment
    bool contains(const std::string& fragment) const;

    void report(std::ostream& out) const;

private:
    std::vector<Diagnostic> entries;
};

struct ErrorHandler {
    [[noreturn]] static void compiler_error(ErrorKind kind, const std::string& message, const Span& span,
                                            const std::string& file);
    [[noreturn]] static void mismatched_tag(const std::string& expected, const std::string& found,
                                            const Span& open_span, const Span& close_span,
                                            const std::string& file);
    [[noreturn]] static void render_error(const std::string& message);
    [[noreturn]] static void invariant_violation(const std::string& message);

    // Driver-level errors are printed, not thrown
    static void cli_error(const std::string& message, const std::string& hint = "");
};
