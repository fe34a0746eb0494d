#include <cassert>
#include <iostream>
#include <string>
#include <utility>

#include <TaggedJson/json.hpp>
#include <TaggedJson/schema_builder.hpp>

#include "../test_model.hpp"

using namespace TaggedJson;
using namespace test_model;

namespace {

SchemaRef circle_ref() { return SchemaRef::Reference("Circle"); }
SchemaRef square_ref() { return SchemaRef::Reference("Square"); }
SchemaRef string_ref() { return SchemaRef::Inline(MetaSchema("string")); }

CaseDeclaration make_case(std::string_view identifier, std::string_view name, SchemaRef (*ref)(),
                          std::optional<std::string_view> tag = std::nullopt) {
    CaseDeclaration c;
    c.identifier = identifier;
    c.payload = PayloadInfo{name, ref, nullptr};
    c.explicitTag = tag;
    return c;
}

const MetaSchema& inline_schema(const SchemaRef& ref) {
    const MetaSchema* s = ref.unwrap_inline();
    assert(s);
    return *s;
}

std::string to_string(const SchemaRef& ref) {
    std::string out;
    bool ok = SchemaToString(ref, out);
    assert(ok);
    return out;
}

} // namespace

void shape_schema() {
    SchemaRef ref = SchemaOf<Shape>();
    assert(ref.is_inline());
    const MetaSchema& s = inline_schema(ref);

    assert(s.type == "object");
    assert(!s.title && !s.description && !s.external_docs);

    assert(s.one_of.size() == 2);
    assert(s.one_of[0] == SchemaRef::Reference("Circle"));
    assert(s.one_of[1] == SchemaRef::Reference("Square"));
    // Built once and shared
    assert(SchemaOf<Shape>().unwrap_inline() == &s);

    const SchemaRef* prop = s.find_property("type");
    assert(prop);
    const MetaSchema& tagSchema = inline_schema(*prop);
    assert(tagSchema.type == "string");
    assert((tagSchema.enum_items == std::vector<std::string>{"Circle", "sq"}));

    assert(s.discriminator);
    assert(s.discriminator->property_name == "type");
    // Only explicitly tagged cases are mapped
    assert(s.discriminator->mapping.size() == 1);
    assert(s.discriminator->mapping[0].first == "sq");
    assert(s.discriminator->mapping[0].second == "#/components/schemas/Square");

    const std::string json = to_string(ref);
    assert(json.starts_with(R"({"type":"object",)"));
    assert(json.find(R"("properties":{"type":{"type":"string","enum":["Circle","sq"]}})") != std::string::npos);
    assert(json.find(R"("oneOf":[{"$ref":"#/components/schemas/Circle"},{"$ref":"#/components/schemas/Square"}])") != std::string::npos);
    assert(json.find(R"("discriminator":{"propertyName":"type","mapping":{"sq":"#/components/schemas/Square"}})") != std::string::npos);
}

void figure_schema() {
    const SchemaRef ref = SchemaOf<Figure>();
    const MetaSchema& s = inline_schema(ref);
    assert(s.title == "Figure");
    assert(s.description == "Anything that can be drawn");
    assert(s.external_docs);
    assert(s.external_docs->url == "https://example.com/figures");
    assert(s.external_docs->description == "Figure catalogue");

    assert(s.discriminator->mapping.size() == 1);
    assert(s.discriminator->mapping[0] == std::make_pair(std::string("poly"), std::string("#/components/schemas/Polygon")));

    const std::string json = to_string(ref);
    assert(json.find(R"("externalDocs":{"url":"https://example.com/figures","description":"Figure catalogue"})") != std::string::npos);
}

void nested_union_schema() {
    const SchemaRef ref = SchemaOf<Entity>();
    const MetaSchema& s = inline_schema(ref);
    assert(s.one_of.size() == 3);
    // Union payloads are inlined, not referenced
    assert(s.one_of[0].is_inline());
    assert(inline_schema(s.one_of[0]).discriminator->property_name == "type");
    assert(inline_schema(s.one_of[1]) == inline_schema(SchemaOf<Shape>()));
    assert(s.one_of[2] == SchemaRef::Reference("Point"));

    const MetaSchema& tags = inline_schema(*s.find_property("kind"));
    assert((tags.enum_items == std::vector<std::string>{"Figure", "object", "pt"}));
    assert(s.discriminator->mapping.size() == 1);
    assert(s.discriminator->mapping[0].first == "pt");
}

void hand_written_declarations() {
    UnionDeclaration<3> decl{};
    decl.name = "object";
    decl.discriminatorProperty = "kind";
    decl.cases = {
        make_case("A", "Circle", &circle_ref, "dup"),
        make_case("B", "Square", &square_ref, "dup"),
        make_case("C", "Circle", &circle_ref),
    };
    auto resolved = resolve(decl);
    assert(resolved);
    assert(check_unique_tags(resolved.cases()) == DeclarationError::duplicate_tag);

    // Duplicates are kept, in declaration order
    auto built = BuildSchema(decl, resolved.cases());
    assert(built);
    const MetaSchema& s = built.schema();
    assert((inline_schema(*s.find_property("kind")).enum_items == std::vector<std::string>{"dup", "dup", "Circle"}));
    assert(s.one_of.size() == 3);
    assert(s.discriminator->mapping.size() == 2);
    assert(s.discriminator->mapping[0].second == "#/components/schemas/Circle");
    assert(s.discriminator->mapping[1].second == "#/components/schemas/Square");
}

void explicit_tag_needs_reference() {
    UnionDeclaration<2> decl{};
    decl.name = "object";
    decl.discriminatorProperty = "kind";
    decl.cases = {
        make_case("Circle", "Circle", &circle_ref),
        make_case("Text", "string", &string_ref, "text"),
    };
    auto resolved = resolve(decl);
    assert(resolved);
    auto built = BuildSchema(decl, resolved.cases());
    assert(!built);
    assert(built.error() == SchemaBuildError::not_a_reference);
    assert(built.errorCase() == 1);

    // Without the explicit tag the inline schema is fine
    decl.cases[1].explicitTag.reset();
    resolved = resolve(decl);
    built = BuildSchema(decl, resolved.cases());
    assert(built);
    assert(built.schema().one_of[1] == SchemaRef::Inline(MetaSchema("string")));
    assert(built.schema().discriminator->mapping.empty());

    const std::string json = to_string(SchemaRef::Inline(built.schema()));
    assert(json.find("mapping") == std::string::npos);
}

void invalid_declarations() {
    UnionDeclaration<2> decl{};
    decl.name = "object";
    decl.discriminatorProperty = "kind";
    decl.cases = {
        make_case("Circle", "Circle", &circle_ref),
        make_case("Pair", "Square", &square_ref),
    };
    decl.cases[1].payloadCount = 2;
    auto resolved = resolve(decl);
    assert(!resolved);
    assert(resolved.error() == DeclarationError::invalid_case_shape);
    assert(resolved.errorCase() == 1);

    decl.cases[1].payloadCount = 1;
    decl.discriminatorProperty = "";
    resolved = resolve(decl);
    assert(resolved.error() == DeclarationError::empty_property_name);
}

void object_schemas() {
    Registry registry;
    RegisterType<Polygon>(registry);
    auto polygon = registry.find("Polygon");
    assert(polygon);
    assert(polygon->title == "Closed polygon");
    assert((polygon->required == std::vector<std::string>{"points"}));

    const MetaSchema& points = inline_schema(*polygon->find_property("points"));
    assert(points.type == "array");
    assert(points.description == "Vertices in drawing order");
    assert(*points.items == SchemaRef::Reference("Point"));

    auto square = registry.find("Square");
    assert(!square);
    auto point = registry.find("Point");
    assert(point);
    assert((point->required == std::vector<std::string>{"x", "y"}));
    assert(inline_schema(*point->find_property("x")).format == "int32");
}

int main() {
    shape_schema();
    figure_schema();
    nested_union_schema();
    hand_written_declarations();
    explicit_tag_needs_reference();
    invalid_declarations();
    object_schemas();
    std::cout << "schema tests passed" << std::endl;
    return 0;
}
