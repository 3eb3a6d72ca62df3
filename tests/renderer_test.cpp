#include "test_helpers.hpp"

#include <diagram_render/renderer.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <sstream>

using namespace diagram_model;
using namespace diagram_render;
using namespace test_helpers;

namespace {

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    for (std::string line; std::getline(in, line);)
        out.push_back(line);
    return out;
}

std::size_t index_of(const std::vector<std::string>& lines, const std::string& wanted) {
    for (std::size_t i = 0; i < lines.size(); ++i)
        if (lines[i] == wanted) return i;
    return lines.size();
}

} // namespace

class RendererTest : public ::testing::Test {
protected:
    ClassDiagram diagram_;

    void SetUp() override {
        DiagramEntity animal;
        animal.name = "Animal";
        animal.is_abstract = true;
        animal.ns = "Zoo.Animals";
        animal.properties = { Member{ "Name", "String", Visibility::Public, false } };

        DiagramEntity dog;
        dog.name = "Dog";
        dog.ns = "Zoo.Animals";
        dog.properties = { Member{ "Toys", "List<Toy>", Visibility::Public, true } };
        dog.methods = { MethodSig{ "FetchAsync", "Task", Visibility::Public, { "Toy toy", "Int32 count" }, true },
                        MethodSig{ "Bark", "Void", Visibility::Protected, {}, false } };
        dog.relationships = {
            edge("Dog", "Animal", RelationshipKind::Inheritance),
            edge("Toy", "Dog", RelationshipKind::Aggregation),
            edge("Dog", "Status", RelationshipKind::Dependency),
        };

        DiagramEntity toy;
        toy.name = "Toy";
        toy.ns = "Zoo.Items";

        DiagramEntity program;
        program.name = "Program";
        program.visibility = Visibility::Internal;

        DiagramEntity status;
        status.name = "Status";
        status.kind = EntityKind::Enum;
        status.properties = { Member{ "Active", "enum", Visibility::Public, false } };

        diagram_.title = "Animal";
        diagram_.entities = { animal, dog, toy, program, status };
    }
};

TEST(FormatTest, MembersAndMethods) {
    EXPECT_EQ(format_member(Member{ "Toys", "List<Toy>", Visibility::Private, true }), "- List<Toy> Toys");
    EXPECT_EQ(format_method(MethodSig{ "Run", "Void", Visibility::Public, {}, false }), "+ Void Run()");
    EXPECT_EQ(format_method(MethodSig{ "LoadAsync", "Task", Visibility::Internal, { "String path", "Int32 n" }, true }),
        "~ async Task LoadAsync(String path, Int32 n)");
}

TEST(FormatTest, RelationshipLines) {
    EXPECT_EQ(format_relationship(edge("Dog", "Animal", RelationshipKind::Inheritance)), "Dog --|> Animal : inherits");
    EXPECT_EQ(format_relationship(edge("Dog", "IPet", RelationshipKind::Realization)), "Dog ..|> IPet : realizes");
    EXPECT_EQ(format_relationship(edge("Toy", "Dog", RelationshipKind::Aggregation)), "Toy --o Dog : aggregates");
    EXPECT_EQ(format_relationship(edge("Dog", "Owner", RelationshipKind::Association)), "Dog --> Owner : associates");
    EXPECT_EQ(format_relationship(edge("Dog", "Status", RelationshipKind::Dependency)), "Dog ..> Status : depends on");
    EXPECT_EQ(format_relationship(edge("Car", "Wheel", RelationshipKind::Composition)), "Car --* Wheel : composes");
    EXPECT_EQ(format_relationship(edge("A", "B", RelationshipKind::Link)), "A .. B : links");
}

TEST(FormatTest, Stereotypes) {
    DiagramEntity e;
    e.name = "Shape";
    e.is_abstract = true;
    EXPECT_EQ(format_stereotype(e), "<<abstract>> Shape");
    e.kind = EntityKind::Interface;
    EXPECT_EQ(format_stereotype(e), "<<Interface>> Shape");
    e.kind = EntityKind::Enum;
    e.is_abstract = false;
    EXPECT_EQ(format_stereotype(e), "<<Enum>> Shape");
    e.kind = EntityKind::Class;
    EXPECT_EQ(format_stereotype(e), "<<Class>> Shape");
}

TEST(FormatTest, NamespaceKeyReplacesDots) {
    EXPECT_EQ(namespace_key("Zoo.Animals.Pets"), "Zoo-Animals-Pets");
    EXPECT_EQ(namespace_key("Zoo"), "Zoo");
}

TEST_F(RendererTest, FlatLayoutExactText) {
    const std::string expected =
        "```mermaid\n"
        "---\n"
        "title: Animal\n"
        "config:\n"
        "  class:\n"
        "    hideEmptyMembersBox: true\n"
        "---\n"
        "classDiagram\n"
        "    class Animal {\n"
        "        + String Name\n"
        "    }\n"
        "    <<abstract>> Animal\n"
        "    class Dog {\n"
        "        + List<Toy> Toys\n"
        "        + async Task FetchAsync(Toy toy, Int32 count)\n"
        "        # Void Bark()\n"
        "    }\n"
        "    <<Class>> Dog\n"
        "    Dog --|> Animal : inherits\n"
        "    Toy --o Dog : aggregates\n"
        "    Dog ..> Status : depends on\n"
        "    class Toy {\n"
        "    }\n"
        "    <<Class>> Toy\n"
        "    class Program {\n"
        "    }\n"
        "    <<Class>> Program\n"
        "    class Status {\n"
        "        + enum Active\n"
        "    }\n"
        "    <<Enum>> Status\n"
        "```\n";
    EXPECT_EQ(render_mermaid(diagram_, RenderLayout::Flat), expected);
}

TEST_F(RendererTest, GroupedLayoutExactText) {
    const std::string expected =
        "```mermaid\n"
        "---\n"
        "title: Animal\n"
        "config:\n"
        "  class:\n"
        "    hideEmptyMembersBox: true\n"
        "---\n"
        "classDiagram\n"
        "    class Program {\n"
        "    }\n"
        "    class Status {\n"
        "        + enum Active\n"
        "    }\n"
        "    namespace Zoo-Animals {\n"
        "        class Animal {\n"
        "            + String Name\n"
        "        }\n"
        "        class Dog {\n"
        "            + List<Toy> Toys\n"
        "            + async Task FetchAsync(Toy toy, Int32 count)\n"
        "            # Void Bark()\n"
        "        }\n"
        "    }\n"
        "    namespace Zoo-Items {\n"
        "        class Toy {\n"
        "        }\n"
        "    }\n"
        "\n"
        "    <<abstract>> Animal\n"
        "    <<Class>> Dog\n"
        "    <<Class>> Toy\n"
        "    <<Class>> Program\n"
        "    <<Enum>> Status\n"
        "\n"
        "    Dog --|> Animal : inherits\n"
        "    Toy --o Dog : aggregates\n"
        "    Dog ..> Status : depends on\n"
        "```\n";
    EXPECT_EQ(render_mermaid(diagram_, RenderLayout::GroupedByNamespace), expected);
}

TEST_F(RendererTest, GroupedPhasesAreOrdered) {
    const auto lines = lines_of(render_mermaid(diagram_, RenderLayout::GroupedByNamespace));
    std::size_t last_body = 0;
    std::size_t first_stereotype = lines.size();
    std::size_t last_stereotype = 0;
    std::size_t first_edge = lines.size();
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const std::string& l = lines[i];
        if (l.find("class ") != std::string::npos || l.find("namespace ") != std::string::npos)
            last_body = i;
        if (l.find("<<") != std::string::npos) {
            first_stereotype = std::min(first_stereotype, i);
            last_stereotype = i;
        }
        if (l.find(" : ") != std::string::npos)
            first_edge = std::min(first_edge, i);
    }
    EXPECT_LT(last_body, first_stereotype);
    EXPECT_LT(last_stereotype, first_edge);
}

TEST_F(RendererTest, UnscopedEntitiesNeverGetPlaceholderNamespace) {
    const auto lines = lines_of(render_mermaid(diagram_, RenderLayout::GroupedByNamespace));
    EXPECT_LT(index_of(lines, "    class Program {"), lines.size());
    for (const auto& l : lines)
        if (l.find("namespace ") != std::string::npos)
            EXPECT_TRUE(l == "    namespace Zoo-Animals {" || l == "    namespace Zoo-Items {") << l;
}

TEST_F(RendererTest, RenderingIsDeterministic) {
    EXPECT_EQ(render_mermaid(diagram_, RenderLayout::Flat), render_mermaid(diagram_, RenderLayout::Flat));
    EXPECT_EQ(render_mermaid(diagram_, RenderLayout::GroupedByNamespace),
        render_mermaid(diagram_, RenderLayout::GroupedByNamespace));
}

TEST_F(RendererTest, DanglingEdgesStillRender) {
    diagram_.entities.pop_back();
    const auto lines = lines_of(render_mermaid(diagram_, RenderLayout::Flat));
    EXPECT_LT(index_of(lines, "    Dog ..> Status : depends on"), lines.size());
    EXPECT_EQ(index_of(lines, "    <<Enum>> Status"), lines.size());
}

TEST(RendererEmptyTest, EmptyDiagramStillHasHeader) {
    ClassDiagram d;
    d.title = "UML Diagram";
    const std::string flat = render_mermaid(d, RenderLayout::Flat);
    EXPECT_EQ(flat,
        "```mermaid\n---\ntitle: UML Diagram\nconfig:\n  class:\n    hideEmptyMembersBox: true\n---\n"
        "classDiagram\n```\n");
    const std::string grouped = render_mermaid(d, RenderLayout::GroupedByNamespace);
    EXPECT_EQ(grouped,
        "```mermaid\n---\ntitle: UML Diagram\nconfig:\n  class:\n    hideEmptyMembersBox: true\n---\n"
        "classDiagram\n\n\n```\n");
}
