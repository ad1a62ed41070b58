#include "tokenizer.h"
#include "cli/error.h"
#include <cctype>
#include <unordered_set>

static bool is_space(char c){
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static bool is_tag_start(char c){
    return std::isalpha(static_cast<unsigned char>(c)) || c == '.' || c == ':';
}

static bool is_tag_name_char(char c){
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == ':';
}

static std::string lowercase(std::string s){
    for(auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool is_void_tag(const std::string& name){
    static const std::unordered_set<std::string> void_tags = {
        "area", "base", "br", "col", "command", "embed", "hr", "img", "input",
        "keygen", "link", "meta", "param", "source", "track", "wbr"
    };
    return void_tags.count(name) > 0;
}

bool is_raw_text_tag(const std::string& name){
    return name == "script" || name == "style";
}

TagKind classify_tag(const std::string& name){
    if(name.empty()) return TagKind::Element;
    if(name[0] == ':') return TagKind::Slot;
    if(name[0] == '.') return TagKind::LocalComponent;
    if(std::isupper(static_cast<unsigned char>(name[0])) || name.find('.') != std::string::npos){
        return TagKind::RemoteComponent;
    }
    if(is_void_tag(name)) return TagKind::Void;
    return TagKind::Element;
}

const char* attr_shape_name(AttrShape shape){
    switch(shape){
        case AttrShape::String: return "string";
        case AttrShape::Boolean: return "boolean";
        case AttrShape::Atom: return "atom";
        case AttrShape::Integer: return "integer";
        case AttrShape::Float: return "float";
        case AttrShape::List: return "list";
        case AttrShape::Map: return "map";
        case AttrShape::Expression: return "expression";
    }
    return "unknown";
}

Tokenizer::Tokenizer(const std::string& file_name, TokenizerState start) : file(file_name), st(std::move(start)){}

char Tokenizer::current(){
    return pos < chunk->size() ? (*chunk)[pos] : '\0';
}

char Tokenizer::peek(int offset){
    return (pos + offset) < chunk->size() ? (*chunk)[pos + offset] : '\0';
}

void Tokenizer::advance(){
    if(current() == '\n'){
        st.line++;
        st.column = 1;
    }else{
        st.column++;
    }
    pos++;
}

Span Tokenizer::here(){
    return Span::at(st.line, st.column);
}

bool Tokenizer::starts_with_ci(const std::string& s){
    for(size_t i = 0; i < s.size(); i++){
        char c = peek(static_cast<int>(i));
        if(std::tolower(static_cast<unsigned char>(c)) != std::tolower(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// '\0' is the end of the chunk; a close tag cut there is taken as complete
static bool ends_tag_name(char c){
    return c == '\0' || c == '>' || c == '/' || std::isspace(static_cast<unsigned char>(c));
}

void Tokenizer::fail_name_char(char c){
    std::string shown = c == '\0' ? "end of input" : std::string("\"") + c + "\"";
    ErrorHandler::compiler_error(ErrorKind::InvalidCharacterInName,
                                 "invalid character " + shown + " in tag or attribute name", here(), file);
}

void Tokenizer::start_text(){
    if(st.buffer.empty()) st.text_start = here();
}

void Tokenizer::flush_buffer_as_text(std::vector<MarkupToken>& out){
    if(st.buffer.empty()) return;
    MarkupToken tok;
    tok.type = MarkupType::Text;
    tok.content = std::move(st.buffer);
    tok.span = st.text_start;
    tok.span.line_end = st.line;
    tok.span.column_end = st.column;
    out.push_back(std::move(tok));
    st.buffer.clear();
}

void Tokenizer::begin_tag(){
    st.pending = MarkupToken{};
    st.pending.span = here();
    st.pending_attr = Attribute{};
    st.after_name = false;
    st.awaiting_value = false;
    st.buffer.clear();
}

void Tokenizer::finish_attr(){
    if(!st.buffer.empty()){
        st.pending_attr.name = st.buffer;
        st.buffer.clear();
    }
    if(!st.pending_attr.name.empty()){
        st.pending_attr.kind = AttrValueKind::Boolean;
        st.pending.attrs.push_back(st.pending_attr);
    }
    st.pending_attr = Attribute{};
    st.after_name = false;
    st.awaiting_value = false;
}

void Tokenizer::finish_tag(std::vector<MarkupToken>& out, bool self_close){
    st.pending.type = st.closing ? MarkupType::TagClose : MarkupType::TagOpen;
    st.pending.tag_kind = classify_tag(st.pending.name);
    st.pending.self_close = self_close;
    st.pending.span.line_end = st.line;
    st.pending.span.column_end = st.column;

    bool raw = !st.closing && !self_close && is_raw_text_tag(st.pending.name);
    std::string name = st.pending.name;
    out.push_back(std::move(st.pending));
    st.pending = MarkupToken{};
    st.buffer.clear();
    st.closing = false;

    if(raw){
        st.mode = TokenizerMode::RawText;
        st.raw_tag = name;
    }else{
        st.mode = TokenizerMode::Text;
    }
}

void Tokenizer::step_text(std::vector<MarkupToken>& out){
    char c = current();
    if(c == '<'){
        if(peek() == '!' && peek(2) == '-' && peek(3) == '-'){
            flush_buffer_as_text(out);
            start_text();
            st.buffer = "<!--";
            for(int i = 0; i < 4; i++) advance();
            st.mode = TokenizerMode::Comment;
            return;
        }
        if(peek() == '/' || is_tag_start(peek())){
            flush_buffer_as_text(out);
            begin_tag();
            st.closing = peek() == '/';
            advance();
            if(st.closing) advance();
            st.mode = TokenizerMode::TagName;
            return;
        }
    }
    // Doctype and stray '<' stay text
    start_text();
    st.buffer += c;
    advance();
}

void Tokenizer::step_tag_name(std::vector<MarkupToken>& out){
    char c = current();
    if(st.buffer.empty() && !is_tag_start(c)) fail_name_char(c);

    if(is_tag_name_char(c)){
        st.buffer += c;
        advance();
        return;
    }
    if(is_space(c)){
        st.pending.name = st.buffer;
        st.buffer.clear();
        st.mode = TokenizerMode::AttrName;
        advance();
        return;
    }
    if(c == '>'){
        st.pending.name = st.buffer;
        advance();
        finish_tag(out, false);
        return;
    }
    if(c == '/' && peek() == '>' && !st.closing){
        st.pending.name = st.buffer;
        advance(); advance();
        finish_tag(out, true);
        return;
    }
    fail_name_char(c);
}

void Tokenizer::step_attr_name(std::vector<MarkupToken>& out){
    char c = current();

    if(st.closing){
        if(is_space(c)){
            advance();
            return;
        }
        if(c == '>'){
            advance();
            finish_tag(out, false);
            return;
        }
        ErrorHandler::compiler_error(ErrorKind::InvalidCharacterInName,
                                     "expected closing tag </" + st.pending.name + "> to end with \">\"", here(), file);
    }

    if(is_space(c)){
        if(!st.buffer.empty()){
            st.pending_attr.name = st.buffer;
            st.buffer.clear();
            st.after_name = true;
        }
        advance();
        return;
    }

    if(st.awaiting_value){
        if(c == '"' || c == '\''){
            st.mode = TokenizerMode::AttrValue;
            st.quote = c;
            advance();
            st.pending_attr.value_span = here();
            return;
        }
        if(c == '{'){
            st.mode = TokenizerMode::AttrValue;
            st.quote = '{';
            st.brace_depth = 1;
            st.string_quote = 0;
            advance();
            st.pending_attr.value_span = here();
            return;
        }
        ErrorHandler::compiler_error(ErrorKind::InvalidCharacterInName,
                                     "invalid attribute value after `=` for \"" + st.pending_attr.name +
                                     "\". Expected either a value between quotes or an expression between curly braces",
                                     here(), file);
    }

    if(c == '>'){
        finish_attr();
        advance();
        finish_tag(out, false);
        return;
    }
    if(c == '/'){
        if(peek() != '>') fail_name_char(c);
        finish_attr();
        advance(); advance();
        finish_tag(out, true);
        return;
    }
    if(c == '='){
        if(!st.buffer.empty()){
            st.pending_attr.name = st.buffer;
            st.buffer.clear();
        }
        if(st.pending_attr.name.empty()) fail_name_char(c);
        st.awaiting_value = true;
        st.after_name = false;
        advance();
        return;
    }
    if(c == '{'){
        if(!st.buffer.empty()) fail_name_char(c);
        finish_attr();
        // Root spread: {expr} with no name
        st.pending_attr.span = here();
        st.mode = TokenizerMode::AttrValue;
        st.quote = '{';
        st.brace_depth = 1;
        st.string_quote = 0;
        advance();
        st.pending_attr.value_span = here();
        return;
    }
    if(c == '"' || c == '\'' || c == '<' || c == '}' || c == '`' || c == '\0'){
        fail_name_char(c);
    }

    if(st.after_name) finish_attr();
    if(st.buffer.empty()) st.pending_attr.span = here();
    st.buffer += c;
    advance();
}

void Tokenizer::step_attr_value(std::vector<MarkupToken>& out){
    char c = current();

    if(st.quote != '{'){
        if(c == st.quote){
            st.pending_attr.kind = AttrValueKind::Literal;
            st.pending_attr.value = st.buffer;
            st.pending_attr.delimiter = st.quote;
            st.pending.attrs.push_back(st.pending_attr);
            st.pending_attr = Attribute{};
            st.buffer.clear();
            st.awaiting_value = false;
            st.after_name = false;
            st.mode = TokenizerMode::AttrName;
            advance();
            return;
        }
        st.buffer += c;
        advance();
        return;
    }

    // Inside {expression}: balance braces, skipping string literals
    if(st.string_quote){
        // The escape may be the last character of a chunk
        if(st.string_escape) st.string_escape = false;
        else if(c == '\\') st.string_escape = true;
        else if(c == st.string_quote) st.string_quote = 0;
        st.buffer += c;
        advance();
        return;
    }
    if(c == '"' || c == '\''){
        st.string_quote = c;
    }else if(c == '{'){
        st.brace_depth++;
    }else if(c == '}'){
        st.brace_depth--;
        if(st.brace_depth == 0){
            st.pending_attr.kind = AttrValueKind::Expression;
            st.pending_attr.value = st.buffer;
            st.pending.attrs.push_back(st.pending_attr);
            st.pending_attr = Attribute{};
            st.buffer.clear();
            st.awaiting_value = false;
            st.after_name = false;
            st.mode = TokenizerMode::AttrName;
            advance();
            return;
        }
    }
    st.buffer += c;
    advance();
}

void Tokenizer::step_comment(std::vector<MarkupToken>& out){
    start_text();
    if(current() == '-' && peek() == '-' && peek(2) == '>'){
        st.buffer += "-->";
        advance(); advance(); advance();
        flush_buffer_as_text(out);
        st.mode = TokenizerMode::Text;
        return;
    }
    st.buffer += current();
    advance();
}

void Tokenizer::step_raw_text(std::vector<MarkupToken>& out){
    if(current() == '<' && peek() == '/' && starts_with_ci("</" + st.raw_tag) &&
       ends_tag_name(peek(static_cast<int>(st.raw_tag.size()) + 2))){
        flush_buffer_as_text(out);
        begin_tag();
        st.closing = true;
        advance(); advance();
        st.mode = TokenizerMode::TagName;
        st.raw_tag.clear();
        return;
    }
    start_text();
    st.buffer += current();
    advance();
}

void Tokenizer::feed(const std::string& text, int line, int column, std::vector<MarkupToken>& out){
    chunk = &text;
    pos = 0;
    st.line = line;
    st.column = column;

    while(pos < text.size()){
        switch(st.mode){
            case TokenizerMode::Text: step_text(out); break;
            case TokenizerMode::TagOpen:
            case TokenizerMode::TagName: step_tag_name(out); break;
            case TokenizerMode::AttrName: step_attr_name(out); break;
            case TokenizerMode::AttrValue: step_attr_value(out); break;
            case TokenizerMode::Comment: step_comment(out); break;
            case TokenizerMode::RawText: step_raw_text(out); break;
        }
    }
    chunk = nullptr;
}

void Tokenizer::flush_text(std::vector<MarkupToken>& out, const Span& at){
    switch(st.mode){
        case TokenizerMode::Text:
        case TokenizerMode::Comment:
        case TokenizerMode::RawText:
            flush_buffer_as_text(out);
            return;
        default:
            ErrorHandler::compiler_error(ErrorKind::ExpressionInsideTag,
                                         "EEx expressions are not allowed inside tags. Use attr={...} or {...} instead",
                                         at, file);
    }
}

void Tokenizer::finish(std::vector<MarkupToken>& out){
    switch(st.mode){
        case TokenizerMode::Text:
            flush_buffer_as_text(out);
            return;
        case TokenizerMode::Comment:
            ErrorHandler::compiler_error(ErrorKind::UnterminatedComment,
                                         "expected closing `-->` for comment", st.text_start, file);
        case TokenizerMode::RawText:
            ErrorHandler::compiler_error(ErrorKind::UnterminatedTag,
                                         "end of template reached without closing tag for <" + st.raw_tag + ">",
                                         st.text_start, file);
        default: {
            std::string name = st.pending.name.empty() ? st.buffer : st.pending.name;
            ErrorHandler::compiler_error(ErrorKind::UnterminatedTag,
                                         "end of template reached without closing `>` for <" +
                                         std::string(st.closing ? "/" : "") + name + ">",
                                         st.pending.span, file);
        }
    }
}

std::pair<std::vector<MarkupToken>, TokenizerState> tokenize(const std::string& source, TokenizerState start,
                                                             const std::string& file){
    int line = start.line;
    int column = start.column;
    Tokenizer tokenizer(file, std::move(start));
    std::vector<MarkupToken> tokens;
    tokenizer.feed(source, line, column, tokens);
    // Text stays buffered in the returned state so the next chunk can continue it
    return {std::move(tokens), tokenizer.state()};
}
