#pragma once

#include "markup.h"
#include <string>
#include <utility>
#include <vector>

enum class TokenizerMode { Text, TagOpen, TagName, AttrName, AttrValue, Comment, RawText };

// Everything needed to resume tokenizing where the previous chunk stopped
struct TokenizerState {
    TokenizerMode mode = TokenizerMode::Text;
    char quote = 0;                // AttrValue: '"', '\'' or '{'
    int brace_depth = 0;
    char string_quote = 0;         // Inside a string literal of a {expression}
    bool string_escape = false;    // Previous character of that literal was a backslash
    std::string raw_tag;           // RawText: name of the element being closed
    std::string buffer;            // Current text, comment, name or value
    MarkupToken pending;           // Tag under construction
    Attribute pending_attr;
    bool closing = false;          // Tag under construction is </name>
    bool after_name = false;       // AttrName: name read, waiting for '=' or the next attribute
    bool awaiting_value = false;   // AttrName: '=' read
    Span text_start;
    int line = 1;
    int column = 1;
};

class Tokenizer {
    private:
        std::string file;
        TokenizerState st;
        const std::string* chunk = nullptr;
        size_t pos = 0;

        char current();
        char peek(int offset = 1);
        void advance();
        Span here();

        void start_text();
        void flush_buffer_as_text(std::vector<MarkupToken>& out);
        void begin_tag();
        void finish_tag(std::vector<MarkupToken>& out, bool self_close);
        void finish_attr();
        bool starts_with_ci(const std::string& s);

        void step_text(std::vector<MarkupToken>& out);
        void step_tag_open(std::vector<MarkupToken>& out);
        void step_tag_name(std::vector<MarkupToken>& out);
        void step_attr_name(std::vector<MarkupToken>& out);
        void step_attr_value(std::vector<MarkupToken>& out);
        void step_comment(std::vector<MarkupToken>& out);
        void step_raw_text(std::vector<MarkupToken>& out);

        [[noreturn]] void fail_name_char(char c);
    public:
        explicit Tokenizer(const std::string& file_name = "nofile", TokenizerState start = {});

        // Tokenizes one chunk starting at the given source position
        void feed(const std::string& text, int line, int column, std::vector<MarkupToken>& out);
        // Emits pending text so an out-of-band token can follow; fails when a tag is still open
        void flush_text(std::vector<MarkupToken>& out, const Span& at);
        // Fails on any unterminated construct
        void finish(std::vector<MarkupToken>& out);

        const TokenizerState& state() const { return st; }
};

std::pair<std::vector<MarkupToken>, TokenizerState> tokenize(const std::string& source, TokenizerState start,
                                                             const std::string& file = "nofile");
