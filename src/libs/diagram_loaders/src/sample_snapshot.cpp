#include <diagram_loaders/sample_snapshot.hpp>
#include <initializer_list>
#include <utility>

namespace diagram_loaders {

diagram_model::TypeSnapshot generate_sample_snapshot() {
    using diagram_model::Accessibility;
    using diagram_model::TypeKind;
    using diagram_model::TypeRef;

    diagram_model::TypeSnapshot out;
    out.project = "Sample";

    auto ref = [](const char* name, const char* ns, TypeKind kind) {
        TypeRef t;
        t.name = name;
        t.ns = ns;
        t.kind = kind;
        return t;
    };
    auto system_ref = [&](const char* name) { return ref(name, "System", TypeKind::Struct); };
    auto string_ref = [&]() {
        TypeRef t = ref("String", "System", TypeKind::Class);
        t.interfaces = { "IEnumerable" };
        return t;
    };
    auto list_of = [&](TypeRef arg) {
        TypeRef t = ref("List", "System.Collections.Generic", TypeKind::Class);
        t.type_arguments.push_back(std::move(arg));
        t.interfaces = { "IList", "ICollection", "IEnumerable" };
        return t;
    };
    auto array_of = [](TypeRef element) {
        TypeRef t;
        t.kind = TypeKind::Array;
        t.ns = "System";
        t.element_type.push_back(std::move(element));
        t.interfaces = { "IList", "ICollection", "IEnumerable" };
        return t;
    };
    auto prop = [](const char* name, TypeRef type, Accessibility access = Accessibility::Public) {
        diagram_model::PropertyDescription p;
        p.name = name;
        p.type = std::move(type);
        p.accessibility = access;
        return p;
    };
    auto method = [](const char* name, TypeRef ret,
        std::initializer_list<std::pair<const char*, TypeRef>> params = {},
        bool is_async = false, Accessibility access = Accessibility::Public)
    {
        diagram_model::MethodDescription m;
        m.name = name;
        m.return_type = std::move(ret);
        m.accessibility = access;
        m.is_async = is_async;
        for (const auto& [pname, ptype] : params)
            m.parameters.push_back(diagram_model::ParameterDescription{ pname, ptype });
        return m;
    };
    auto type = [](const char* name, TypeKind kind, const char* ns, bool is_abstract = false) {
        diagram_model::TypeDescription t;
        t.name = name;
        t.kind = kind;
        t.ns = ns;
        t.is_abstract = is_abstract;
        t.accessibility = Accessibility::Public;
        return t;
    };

    const TypeRef object = ref("Object", "System", TypeKind::Class);
    const TypeRef living_thing = ref("LivingThing", "Zoo.Animals", TypeKind::Class);
    const TypeRef animal = ref("Animal", "Zoo.Animals", TypeKind::Class);
    const TypeRef feedable = ref("IFeedable", "Zoo.Animals", TypeKind::Interface);
    const TypeRef pet = ref("IPet", "Zoo.Animals", TypeKind::Interface);
    const TypeRef status = ref("Status", "Zoo.Animals", TypeKind::Enum);
    const TypeRef role = ref("Role", "Zoo.People", TypeKind::Enum);
    const TypeRef toy = ref("Toy", "Zoo.Items", TypeKind::Class);
    const TypeRef bowl = ref("Bowl", "Zoo.Items", TypeKind::Class);
    const TypeRef owner = ref("Owner", "Zoo.People", TypeKind::Class);
    const TypeRef dog = ref("Dog", "Zoo.Animals", TypeKind::Class);
    const TypeRef task = ref("Task", "System.Threading.Tasks", TypeKind::Class);

    // Animals.cs
    {
        diagram_model::SourceFile src;
        src.path = "Animals.cs";

        auto t_living = type("LivingThing", TypeKind::Class, "Zoo.Animals", true);
        t_living.direct_base = { object };
        t_living.ancestors = { object };
        t_living.properties = { prop("Age", system_ref("Int32"), Accessibility::Protected) };
        src.types.push_back(std::move(t_living));

        auto t_animal = type("Animal", TypeKind::Class, "Zoo.Animals", true);
        t_animal.direct_base = { living_thing };
        t_animal.ancestors = { living_thing, object };
        t_animal.interfaces = { feedable };
        t_animal.properties = { prop("Name", string_ref()), prop("State", status) };
        t_animal.methods = { method("Feed", system_ref("Void"), { { "grams", system_ref("Int32") } }) };
        src.types.push_back(std::move(t_animal));

        auto t_dog = type("Dog", TypeKind::Class, "Zoo.Animals");
        t_dog.direct_base = { animal };
        t_dog.ancestors = { animal, living_thing, object };
        t_dog.interfaces = { pet };
        t_dog.properties = {
            prop("Toys", list_of(toy)),
            prop("Bowls", array_of(bowl), Accessibility::Internal),
            prop("Owner", owner),
            prop("Born", system_ref("DateTime"), Accessibility::Private),
        };
        auto ctor = method("Dog", system_ref("Void"));
        ctor.method_kind = diagram_model::MethodKind::Constructor;
        t_dog.methods = {
            ctor,
            method("Bark", system_ref("Void")),
            method("FetchAsync", task, { { "toy", toy }, { "throws", system_ref("Int32") } }, true),
        };
        src.types.push_back(std::move(t_dog));

        auto t_feedable = type("IFeedable", TypeKind::Interface, "Zoo.Animals");
        t_feedable.methods = { method("Feed", system_ref("Void"), { { "grams", system_ref("Int32") } }) };
        src.types.push_back(std::move(t_feedable));

        auto t_pet = type("IPet", TypeKind::Interface, "Zoo.Animals");
        t_pet.interfaces = { feedable };
        t_pet.properties = { prop("Owner", owner) };
        src.types.push_back(std::move(t_pet));

        src.enums.push_back(diagram_model::EnumDescription{ "Status", { "Active", "Retired" } });
        out.sources.push_back(std::move(src));
    }

    // Items.cs
    {
        diagram_model::SourceFile src;
        src.path = "Items.cs";

        auto t_toy = type("Toy", TypeKind::Class, "Zoo.Items");
        t_toy.direct_base = { object };
        t_toy.properties = { prop("Label", string_ref()) };
        src.types.push_back(std::move(t_toy));

        auto t_bowl = type("Bowl", TypeKind::Class, "Zoo.Items");
        t_bowl.direct_base = { object };
        t_bowl.properties = { prop("Capacity", system_ref("Double")) };
        src.types.push_back(std::move(t_bowl));
        out.sources.push_back(std::move(src));
    }

    // People.cs
    {
        diagram_model::SourceFile src;
        src.path = "People.cs";

        auto t_owner = type("Owner", TypeKind::Class, "Zoo.People");
        t_owner.direct_base = { object };
        t_owner.properties = {
            prop("Dogs", list_of(dog)),
            prop("Favorite", dog),
            prop("Role", role),
        };
        src.types.push_back(std::move(t_owner));

        auto t_registry = type("Registry", TypeKind::Class, "");
        t_registry.direct_base = { object };
        t_registry.accessibility = Accessibility::Internal;
        t_registry.properties = { prop("Owners", list_of(owner)) };
        t_registry.methods = { method("Find", owner, { { "name", string_ref() } }) };
        src.types.push_back(std::move(t_registry));

        auto t_broken = type("Broken", TypeKind::Class, "Zoo.People");
        t_broken.has_symbol = false;
        src.types.push_back(std::move(t_broken));

        src.enums.push_back(diagram_model::EnumDescription{ "Role", { "Keeper", "Visitor" } });
        out.sources.push_back(std::move(src));
    }

    return out;
}

} // namespace diagram_loaders
