#pragma once

#include "template.h"
#include "analysis/declarative.h"
#include <string>
#include <vector>

// Lowers a parsed template tree into a compiled Template
class TemplateCodegen {
public:
    TemplateCodegen(const std::string& module, const std::string& file);

    TemplatePtr generate(TemplateTree& tree);

    // Component calls seen while generating, for declarative verification
    const std::vector<ComponentCallRecord>& calls() const { return call_records; }

private:
    struct Emitter {
        std::vector<std::string> statics{""};
        std::vector<DynamicPart> parts;

        void text(const std::string& s) { statics.back() += s; }
        void part(DynamicPart p){
            parts.push_back(std::move(p));
            statics.emplace_back();
        }
    };

    std::string module;
    std::string file;
    std::vector<ComponentCallRecord> call_records;

    TemplatePtr build(NodeList& nodes, const LocalNames& locals, bool top_level);
    TemplatePtr build_single(std::unique_ptr<TemplateNode> node, const LocalNames& locals);
    void emit_nodes(NodeList& nodes, Emitter& e, const LocalNames& locals);
    void emit_node(TemplateNode& node, Emitter& e, const LocalNames& locals);
    void emit_element(ElementNode& el, Emitter& e, const LocalNames& locals);
    void emit_attribute(ParsedAttribute& attr, Emitter& e, const LocalNames& locals);
    DynamicPart loop_part(Generator generator, NodeList& body_nodes, const LocalNames& locals, const Span& span);
    DynamicPart component_part(ComponentCallNode& call, const LocalNames& locals);
    AttrBinding bind_attribute(ParsedAttribute& attr, const LocalNames& locals);
};

// Parses and compiles one template source
TemplatePtr compile_template(const std::string& source, const std::string& module = "Template",
                             const std::string& file = "nofile",
                             std::vector<ComponentCallRecord>* calls = nullptr);
