#pragma once

#include "markup.h"
#include <string>
#include <vector>

// Splits template source at <% %> markers, tokenizes the markup between them and
// interleaves Expression tokens where the markers were
std::vector<MarkupToken> lex_template(const std::string& source, const std::string& file = "nofile");

// Classifies block markers: `... do`, `else`, `end`
BlockRole block_role(const std::string& code);

std::string trim(const std::string& s);
