#include "eex.h"
#include "tokenizer.h"
#include "cli/error.h"
#include <cctype>

std::string trim(const std::string& s){
    size_t start = 0;
    while(start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
    size_t end = s.size();
    while(end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(start, end - start);
}

BlockRole block_role(const std::string& code){
    std::string t = trim(code);
    if(t == "end") return BlockRole::End;
    if(t == "else") return BlockRole::Middle;
    if(t == "do") return BlockRole::Start;
    if(t.size() > 3 && t.compare(t.size() - 3, 3, " do") == 0) return BlockRole::Start;
    if(t.size() > 3 && t.compare(t.size() - 3, 3, ")do") == 0) return BlockRole::Start;
    return BlockRole::None;
}

namespace {

struct Cursor {
    const std::string& src;
    size_t pos = 0;
    int line = 1;
    int column = 1;

    bool at(const char* s) const { return src.compare(pos, std::char_traits<char>::length(s), s) == 0; }
    void advance(size_t n = 1){
        for(size_t i = 0; i < n && pos < src.size(); i++){
            if(src[pos] == '\n'){
                line++;
                column = 1;
            }else{
                column++;
            }
            pos++;
        }
    }
};

}

std::vector<MarkupToken> lex_template(const std::string& source, const std::string& file){
    std::vector<MarkupToken> tokens;
    Tokenizer tokenizer(file);
    Cursor cur{source};

    std::string text;
    int text_line = 1;
    int text_column = 1;

    auto flush_text = [&](){
        if(!text.empty()) tokenizer.feed(text, text_line, text_column, tokens);
        text.clear();
    };

    while(cur.pos < source.size()){
        if(!cur.at("<%")){
            if(text.empty()){
                text_line = cur.line;
                text_column = cur.column;
            }
            text += source[cur.pos];
            cur.advance();
            continue;
        }

        // <%% is a literal <%
        if(cur.at("<%%")){
            if(text.empty()){
                text_line = cur.line;
                text_column = cur.column;
            }
            text += "<%";
            cur.advance(3);
            continue;
        }

        Span open = Span::at(cur.line, cur.column);
        bool comment = cur.at("<%#");
        std::string marker;
        if(cur.at("<%=")){
            marker = "=";
            cur.advance(3);
        }else{
            cur.advance(comment ? 3 : 2);
        }

        size_t close = source.find("%>", cur.pos);
        if(close == std::string::npos){
            ErrorHandler::compiler_error(ErrorKind::UnterminatedExpression,
                                         "missing token '%>' for expression started here", open, file);
        }

        Span code_span = Span::at(cur.line, cur.column);
        std::string code = source.substr(cur.pos, close - cur.pos);
        cur.advance(close - cur.pos + 2);
        code_span.line_end = cur.line;
        code_span.column_end = cur.column;

        flush_text();
        if(comment) continue;

        tokenizer.flush_text(tokens, open);

        MarkupToken tok;
        tok.type = MarkupType::Expression;
        tok.content = code;
        tok.marker = marker;
        tok.role = block_role(code);
        tok.span = code_span;
        tokens.push_back(std::move(tok));
    }

    flush_text();
    tokenizer.finish(tokens);
    return tokens;
}
