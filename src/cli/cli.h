#pragma once

#include "compiler/template_compiler.h"
#include <nlohmann/json.hpp>
#include <string>

struct CliOptions {
    std::string command;               // check, render, diff
    std::string template_path;
    std::string assigns_path;
    std::string before_path;
    std::string after_path;
    std::string components_dir;
    std::string file_name;             // Name used in diagnostics; defaults to the template path
    bool json = false;
};

// Print help message
void print_help(const char* program_name);

// Each returns the process exit code
int check_command(const CliOptions& options);
int render_command(const CliOptions& options);
int diff_command(const CliOptions& options);

// Reads attr/slot declarations from a JSON sidecar into the compiler:
// {"attrs": [{"name", "type", "required", "default", "doc"}], "slots": [{"name", "required", "attrs": [...]}]}
void declare_from_json(TemplateCompiler& compiler, const nlohmann::json& decl, const std::string& file);

// "string", "integer", ... or a struct name such as "User"
AttrType parse_attr_type(const std::string& name, std::string& struct_name);
