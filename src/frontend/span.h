#pragma once

#include <string>

// Line/column range in template source, 1-based
struct Span {
    int line = 1;
    int column = 1;
    int line_end = 1;
    int column_end = 1;

    static Span at(int line, int column){
        return Span{line, column, line, column};
    }

    std::string to_string() const {
        return std::to_string(line) + ":" + std::to_string(column);
    }
};
