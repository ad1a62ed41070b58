#include "cli.h"
#include "cli/error.h"
#include "session/live_template.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;
using namespace colors;

void print_help(const char* program_name) {
    std::cout << std::endl;
    std::cout << "  " << paint(BOLD) << "livetree" << paint(RESET) << " " << paint(DIM)
              << "- Template compiler and render-tree diff engine" << paint(RESET) << std::endl;
    std::cout << std::endl;
    std::cout << "  " << paint(BOLD) << "Usage:" << paint(RESET) << std::endl;
    std::cout << "    " << paint(CYAN) << program_name << " check" << paint(RESET) << " <template>                   Compile and report warnings" << std::endl;
    std::cout << "    " << paint(CYAN) << program_name << " render" << paint(RESET) << " <template> [options]        Render to HTML or a full patch" << std::endl;
    std::cout << "    " << paint(CYAN) << program_name << " diff" << paint(RESET) << " <template> --before a --after b   Print the incremental patch" << std::endl;
    std::cout << std::endl;
    std::cout << "  " << paint(BOLD) << "Options:" << paint(RESET) << std::endl;
    std::cout << "    " << paint(DIM) << "--assigns <file.json>" << paint(RESET) << "   Assigns for render" << std::endl;
    std::cout << "    " << paint(DIM) << "--json" << paint(RESET) << "                  Print the wire patch instead of HTML" << std::endl;
    std::cout << "    " << paint(DIM) << "--before, --after" << paint(RESET) << "       Assigns of the two renders compared by diff" << std::endl;
    std::cout << "    " << paint(DIM) << "--components <dir>" << paint(RESET) << "      Compile every *.heex in dir as a local component" << std::endl;
    std::cout << "    " << paint(DIM) << "--file-name <name>" << paint(RESET) << "      File name used in diagnostics" << std::endl;
    std::cout << "    " << paint(DIM) << "--no-color" << paint(RESET) << "              Disable colored output" << std::endl;
    std::cout << std::endl;
    std::cout << "  " << paint(BOLD) << "Examples:" << paint(RESET) << std::endl;
    std::cout << "    " << paint(DIM) << "$" << paint(RESET) << " livetree render page.heex --assigns page.json" << std::endl;
    std::cout << "    " << paint(DIM) << "$" << paint(RESET) << " livetree diff page.heex --before v1.json --after v2.json" << std::endl;
    std::cout << std::endl;
}

static bool read_file(const std::string& path, std::string& out){
    std::ifstream file(path);
    if(!file){
        ErrorHandler::cli_error("could not open " + path);
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

static bool read_json(const std::string& path, nlohmann::json& out){
    std::string text;
    if(!read_file(path, text)) return false;
    out = nlohmann::json::parse(text);
    return true;
}

AttrType parse_attr_type(const std::string& name, std::string& struct_name){
    static const std::map<std::string, AttrType> types = {
        {"any", AttrType::Any}, {"string", AttrType::String}, {"atom", AttrType::Atom},
        {"boolean", AttrType::Boolean}, {"integer", AttrType::Integer}, {"float", AttrType::Float},
        {"list", AttrType::List}, {"map", AttrType::Map}, {"global", AttrType::Global}
    };
    auto it = types.find(name);
    if(it != types.end()) return it->second;
    struct_name = name;
    return AttrType::Struct;
}

static void declare_attr(TemplateCompiler& compiler, const nlohmann::json& attr){
    AttrOptions opts;
    std::string type_name = attr.value("type", std::string("any"));
    AttrType type = parse_attr_type(type_name, opts.struct_name);
    opts.required = attr.value("required", false);
    opts.doc = attr.value("doc", std::string());
    if(attr.contains("default")) opts.default_value = Value::from_json(attr.at("default"));
    opts.span = Span::at(attr.value("line", 1), 1);
    compiler.attr(attr.at("name").get<std::string>(), type, std::move(opts));
}

void declare_from_json(TemplateCompiler& compiler, const nlohmann::json& decl, const std::string& file){
    if(!decl.is_object()) ErrorHandler::render_error(file + ": declarations must be a JSON object");
    for(const auto& attr : decl.value("attrs", nlohmann::json::array())) declare_attr(compiler, attr);
    for(const auto& slot : decl.value("slots", nlohmann::json::array())){
        SlotOptions opts;
        opts.required = slot.value("required", false);
        opts.doc = slot.value("doc", std::string());
        opts.span = Span::at(slot.value("line", 1), 1);
        compiler.begin_slot(slot.at("name").get<std::string>(), std::move(opts));
        for(const auto& attr : slot.value("attrs", nlohmann::json::array())) declare_attr(compiler, attr);
        compiler.end_slot();
    }
}

// Compiles the components directory and the template into one unit
static bool compile_unit(const CliOptions& options, ComponentLibrary& library, TemplatePtr& tmpl, Diagnostics& diags){
    std::string source;
    if(!read_file(options.template_path, source)) return false;
    std::string name = options.file_name.empty() ? options.template_path : options.file_name;

    TemplateCompiler compiler("Template", name);

    if(!options.components_dir.empty()){
        if(!fs::is_directory(options.components_dir)){
            ErrorHandler::cli_error("components directory not found: " + options.components_dir);
            return false;
        }
        std::vector<fs::path> files;
        for(const auto& entry : fs::directory_iterator(options.components_dir)){
            if(entry.is_regular_file() && entry.path().extension() == ".heex") files.push_back(entry.path());
        }
        // Sort for deterministic order
        std::sort(files.begin(), files.end());

        for(const auto& path : files){
            std::string body;
            if(!read_file(path.string(), body)) return false;

            fs::path sidecar = path;
            sidecar.replace_extension(".json");
            if(fs::exists(sidecar)){
                nlohmann::json decl;
                if(!read_json(sidecar.string(), decl)) return false;
                declare_from_json(compiler, decl, sidecar.string());
            }

            compiler.component(path.stem().string(), body, path.string());
        }
    }

    tmpl = compiler.compile(source);
    CompiledUnitPtr unit = compiler.finish();
    diags.merge(compiler.diagnostics());
    library.add(unit);
    library.verify(diags);
    return true;
}

static bool load_bindings(const std::string& path, BindingSet& out){
    if(path.empty()){
        out = BindingSet();
        return true;
    }
    nlohmann::json j;
    if(!read_json(path, j)) return false;
    out = BindingSet::from_json(j);
    return true;
}

int check_command(const CliOptions& options){
    ComponentLibrary library;
    TemplatePtr tmpl;
    Diagnostics diags;
    if(!compile_unit(options, library, tmpl, diags)) return 1;
    diags.report(std::cerr);
    std::cerr << paint(GREEN) << "OK" << paint(RESET) << " " << tmpl->parts.size() << " dynamic parts, "
              << diags.size() << " warnings" << std::endl;
    return 0;
}

int render_command(const CliOptions& options){
    ComponentLibrary library;
    TemplatePtr tmpl;
    Diagnostics diags;
    if(!compile_unit(options, library, tmpl, diags)) return 1;
    diags.report(std::cerr);

    BindingSet bindings;
    if(!load_bindings(options.assigns_path, bindings)) return 1;

    std::cerr << paint(DIM) << "Rendering " << options.template_path << "..." << paint(RESET) << std::endl;
    LiveTemplate live(tmpl, &library);
    Patch patch = live.render(bindings);
    if(options.json){
        std::cout << patch.dump(2) << std::endl;
    }else{
        std::cout << live.html() << std::endl;
    }
    return 0;
}

int diff_command(const CliOptions& options){
    if(options.before_path.empty() || options.after_path.empty()){
        ErrorHandler::cli_error("diff requires --before and --after", "Example: livetree diff page.heex --before a.json --after b.json");
        return 1;
    }
    ComponentLibrary library;
    TemplatePtr tmpl;
    Diagnostics diags;
    if(!compile_unit(options, library, tmpl, diags)) return 1;
    diags.report(std::cerr);

    BindingSet bindings;
    if(!load_bindings(options.before_path, bindings)) return 1;
    BindingSet after;
    if(!load_bindings(options.after_path, after)) return 1;

    LiveTemplate live(tmpl, &library);
    live.render(bindings);

    // Only keys whose values differ end up in the changed set
    std::vector<std::string> dropped;
    for(const auto& [key, value] : bindings.values()){
        if(!after.get(key)) dropped.push_back(key);
    }
    for(const auto& key : dropped) bindings.remove(key);
    for(const auto& [key, value] : after.values()) bindings.assign(key, value);

    std::cerr << paint(DIM) << "Changed: " << bindings.changed().to_string() << paint(RESET) << std::endl;
    Patch patch = live.render(bindings);
    std::cout << patch.dump(2) << std::endl;
    return 0;
}
