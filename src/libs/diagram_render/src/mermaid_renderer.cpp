#include <diagram_render/renderer.hpp>
#include <diagram_model/mapping.hpp>
#include <algorithm>
#include <map>
#include <utility>
#include <string_view>
#include <vector>

namespace diagram_render {

namespace {

constexpr std::string_view k_indent = "    ";

// Shared line writer for both layouts; only the visiting order differs.
class MermaidWriter {
public:
    void line(int depth, std::string_view text) {
        for (int i = 0; i < depth; ++i)
            out_ += k_indent;
        out_ += text;
        out_ += '\n';
    }

    void blank() { out_ += '\n'; }

    void front_matter(const std::string& title) {
        line(0, "```mermaid");
        line(0, "---");
        line(0, "title: " + title);
        line(0, "config:");
        line(0, "  class:");
        line(0, "    hideEmptyMembersBox: true");
        line(0, "---");
        line(0, "classDiagram");
    }

    void close() { line(0, "```"); }

    void body(const diagram_model::DiagramEntity& entity, int depth) {
        line(depth, "class " + entity.name + " {");
        for (const auto& p : entity.properties)
            line(depth + 1, format_member(p));
        for (const auto& m : entity.methods)
            line(depth + 1, format_method(m));
        line(depth, "}");
    }

    void stereotype(const diagram_model::DiagramEntity& entity) {
        line(1, format_stereotype(entity));
    }

    void relationships(const diagram_model::DiagramEntity& entity) {
        for (const auto& r : entity.relationships)
            line(1, format_relationship(r));
    }

    std::string take() { return std::move(out_); }

private:
    std::string out_;
};

void write_flat(MermaidWriter& w, const std::vector<diagram_model::DiagramEntity>& entities) {
    for (const auto& e : entities) {
        w.body(e, 1);
        w.stereotype(e);
        w.relationships(e);
    }
}

// Mermaid needs every class declared before a stereotype or edge refers to it.
void write_grouped(MermaidWriter& w, const std::vector<diagram_model::DiagramEntity>& entities) {
    std::vector<const diagram_model::DiagramEntity*> unscoped;
    std::map<std::string, std::vector<const diagram_model::DiagramEntity*>> scoped;
    for (const auto& e : entities) {
        if (e.ns)
            scoped[namespace_key(*e.ns)].push_back(&e);
        else
            unscoped.push_back(&e);
    }

    for (const auto* e : unscoped)
        w.body(*e, 1);
    for (const auto& [key, members] : scoped) {
        w.line(1, "namespace " + key + " {");
        for (const auto* e : members)
            w.body(*e, 2);
        w.line(1, "}");
    }

    w.blank();
    for (const auto& e : entities)
        w.stereotype(e);

    w.blank();
    for (const auto& e : entities)
        w.relationships(e);
}

} // namespace

std::string render_mermaid(const diagram_model::ClassDiagram& diagram, RenderLayout layout) {
    MermaidWriter w;
    w.front_matter(diagram.title);
    switch (layout) {
    case RenderLayout::Flat:
        write_flat(w, diagram.entities);
        break;
    case RenderLayout::GroupedByNamespace:
        write_grouped(w, diagram.entities);
        break;
    }
    w.close();
    return w.take();
}

std::string format_member(const diagram_model::Member& member) {
    std::string out(diagram_model::visibility_token(member.visibility));
    out += " " + member.type + " " + member.name;
    return out;
}

std::string format_method(const diagram_model::MethodSig& method) {
    std::string out(diagram_model::visibility_token(method.visibility));
    out += " ";
    if (method.is_async)
        out += "async ";
    out += method.return_type + " " + method.name + "(";
    for (std::size_t i = 0; i < method.parameters.size(); ++i) {
        if (i > 0) out += ", ";
        out += method.parameters[i];
    }
    out += ")";
    return out;
}

std::string format_relationship(const diagram_model::Relationship& relationship) {
    std::string out = relationship.from + " ";
    out += diagram_model::link_token(relationship.link_style, relationship.kind);
    out += diagram_model::relationship_token(relationship.kind);
    out += " " + relationship.to + " : ";
    out += diagram_model::relationship_context(relationship.kind);
    return out;
}

std::string format_stereotype(const diagram_model::DiagramEntity& entity) {
    if (entity.is_abstract && entity.kind == diagram_model::EntityKind::Class)
        return "<<abstract>> " + entity.name;
    std::string out = "<<";
    out += diagram_model::entity_kind_name(entity.kind);
    out += ">> " + entity.name;
    return out;
}

std::string namespace_key(const std::string& ns) {
    std::string key = ns;
    std::replace(key.begin(), key.end(), '.', '-');
    return key;
}

} // namespace diagram_render
