#include "error.h"
#include <iostream>

namespace colors {
    bool enabled = true;
}

const char* error_kind_name(ErrorKind kind){
    switch(kind){
        case ErrorKind::UnterminatedTag: return "UnterminatedTag";
        case ErrorKind::UnterminatedComment: return "UnterminatedComment";
        case ErrorKind::UnterminatedExpression: return "UnterminatedExpression";
        case ErrorKind::InvalidCharacterInName: return "InvalidCharacterInName";
        case ErrorKind::ExpressionInsideTag: return "ExpressionInsideTag";
        case ErrorKind::InvalidExpression: return "InvalidExpression";
        case ErrorKind::MismatchedClosingTag: return "MismatchedClosingTag";
        case ErrorKind::UnexpectedClosingTag: return "UnexpectedClosingTag";
        case ErrorKind::UnclosedTag: return "UnclosedTag";
        case ErrorKind::UnclosedBlock: return "UnclosedBlock";
        case ErrorKind::UnexpectedBlock: return "UnexpectedBlock";
        case ErrorKind::SlotOutsideComponent: return "SlotOutsideComponent";
        case ErrorKind::ReservedSlotName: return "ReservedSlotName";
        case ErrorKind::DuplicateLet: return "DuplicateLet";
        case ErrorKind::LetWithoutInnerContent: return "LetWithoutInnerContent";
        case ErrorKind::InvalidDirective: return "InvalidDirective";
        case ErrorKind::DuplicateDirective: return "DuplicateDirective";
        case ErrorKind::UnsupportedAttribute: return "UnsupportedAttribute";
        case ErrorKind::InvalidTag: return "InvalidTag";
    }
    return "Unknown";
}

ParseError::ParseError(ErrorKind kind, const std::string& description, const Span& span, const std::string& file)
    : std::runtime_error(file + ":" + span.to_string() + ": " + description),
      kind(kind), description(description), span(span), file(file), open_span(span), close_span(span) {}

std::string Diagnostic::to_string() const {
    return file + ":" + span.to_string() + ": " + message;
}

void Diagnostics::warn(const std::string& file, const Span& span, const std::string& message){
    entries.push_back(Diagnostic{file, span, message});
}

void Diagnostics::merge(const Diagnostics& other){
    entries.insert(entries.end(), other.entries.begin(), other.entries.end());
}

bool Diagnostics::contains(const std::string& fragment) const {
    for(const auto& d : entries){
        if(d.message.find(fragment) != std::string::npos) return true;
    }
    return false;
}

void Diagnostics::report(std::ostream& out) const {
    for(const auto& d : entries){
        out << colors::paint(colors::YELLOW) << "Warning:" << colors::paint(colors::RESET)
            << " " << d.to_string() << std::endl;
    }
}

void ErrorHandler::compiler_error(ErrorKind kind, const std::string& message, const Span& span,
                                  const std::string& file){
    throw ParseError(kind, message, span, file);
}

void ErrorHandler::mismatched_tag(const std::string& expected, const std::string& found,
                                  const Span& open_span, const Span& close_span, const std::string& file){
    ParseError err(ErrorKind::MismatchedClosingTag,
                   "unmatched closing tag. Expected </" + expected + "> for <" + expected +
                   "> at line " + std::to_string(open_span.line) + ", got: </" + found + ">",
                   close_span, file);
    err.expected = expected;
    err.found = found;
    err.open_span = open_span;
    err.close_span = close_span;
    throw err;
}

void ErrorHandler::render_error(const std::string& message){
    throw RenderError(message);
}

void ErrorHandler::invariant_violation(const std::string& message){
    throw std::logic_error("render tree invariant violated: " + message);
}

void ErrorHandler::cli_error(const std::string& message, const std::string& hint){
    std::cerr << colors::paint(colors::RED) << "Error:" << colors::paint(colors::RESET) << " " << message << std::endl;
    if(!hint.empty()){
        std::cerr << colors::paint(colors::DIM) << "  " << hint << colors::paint(colors::RESET) << std::endl;
    }
}
