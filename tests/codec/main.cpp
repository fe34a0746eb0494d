#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <TaggedJson/json.hpp>
#include <TaggedJson/error_formatting.hpp>

#include "../test_model.hpp"

// Integer-valued shapes, so the wire text is exact
namespace wire {

struct Circle {
    int radius;
    bool operator==(const Circle&) const = default;
};
struct Square {
    int side;
    bool operator==(const Square&) const = default;
};

} // namespace wire

template<> struct TaggedJson::Annotated<wire::Circle> {
    using Options = OptionsPack<options::name<"Circle">>;
};
template<> struct TaggedJson::Annotated<wire::Square> {
    using Options = OptionsPack<options::name<"Square">>;
};

namespace wire {

using Shape = TaggedJson::OneOf<
    TaggedJson::options::property_name<"type">,
    TaggedJson::Case<"Circle", Circle>,
    TaggedJson::Case<"Square", Square, TaggedJson::options::mapping<"sq">>
>;

} // namespace wire

using namespace TaggedJson;
using namespace test_model;

namespace {

// First key of the top level object in `json`
std::string first_key(const std::string& json) {
    YyjsonDocument doc(json);
    assert(doc.ok());
    yyjson_val* root = doc.root();
    assert(yyjson_is_obj(root));
    yyjson_obj_iter it;
    yyjson_obj_iter_init(root, &it);
    yyjson_val* key = yyjson_obj_iter_next(&it);
    assert(key);
    return std::string(string_of(key));
}

std::size_t key_count(const std::string& json, std::string_view key) {
    YyjsonDocument doc(json);
    assert(doc.ok());
    std::size_t n = 0;
    yyjson_obj_iter it;
    yyjson_obj_iter_init(doc.root(), &it);
    while(yyjson_val* k = yyjson_obj_iter_next(&it)) {
        if(string_of(k) == key) n ++;
    }
    return n;
}

} // namespace

void shape_scenario() {
    Shape s;
    auto r = Parse(s, R"({"type":"Circle","radius":1.5})");
    assert(r);
    assert(s.is<"Circle">());
    assert(s.get<"Circle">().radius == 1.5);

    r = Parse(s, R"({"radius":2,"type":"sq","side":3})");
    assert(r);
    assert(s.is<"Square">());
    assert(s.get<"Square">().side == 3.0);

    std::string out;
    auto w = Serialize(Shape::make<"Square">(Square{3}), out);
    assert(w);
    assert(out.starts_with(R"({"type":"sq",)"));
    assert(key_count(out, "type") == 1);

    out.clear();
    assert(Serialize(Shape::make<"Circle">(Circle{0.5}), out));
    assert(out.starts_with(R"({"type":"Circle",)"));
}

void shape_scenario_wire_text() {
    std::string out;
    auto w = Serialize(wire::Shape::make<"Circle">(wire::Circle{2}), out);
    assert(w);
    assert(out == R"({"type":"Circle","radius":2})");

    out.clear();
    w = Serialize(wire::Shape::make<"Square">(wire::Square{3}), out);
    assert(w);
    assert(out == R"({"type":"sq","side":3})");

    wire::Shape s;
    auto r = Parse(s, R"({"type":"sq","side":3})");
    assert(r);
    assert(s == wire::Shape::make<"Square">(wire::Square{3}));

    r = Parse(s, R"({"type":"Circle","radius":2})");
    assert(r);
    assert(s == wire::Shape::make<"Circle">(wire::Circle{2}));

    r = Parse(s, R"({"type":"triangle"})");
    assert(!r);
    assert(r.error() == ParseError::EXPECTED_TYPE);
    assert(ParseResultToString(r) ==
        R"(When parsing $, parsing error 'EXPECTED_TYPE' in object: unrecognized discriminator value "triangle" in property 'type')");
    assert(s.is<"Circle">());
}

void round_trip() {
    const std::vector<Shape> shapes = {
        Shape::make<"Circle">(Circle{1.25}),
        Shape::make<"Square">(Square{-4}),
    };
    for(const Shape& original: shapes) {
        std::string out;
        assert(Serialize(original, out));
        Shape back;
        back.emplace<"Square">(Square{99});
        auto r = Parse(back, out);
        assert(r);
        assert(back == original);
        assert(first_key(out) == "type");
    }

    Drawing d{
        "sketch",
        { Shape::make<"Square">(Square{2}), Shape::make<"Circle">(Circle{1}) },
        Figure::make<"Polygon">(Polygon{std::vector<Point>{{0, 0}, {4, 0}, {0, 3}}, "triangle"})
    };
    std::string out;
    assert(Serialize(d, out));
    Drawing back;
    assert(Parse(back, out));
    assert(back == d);

    d.background.reset();
    out.clear();
    assert(Serialize(d, out));
    assert(out.find("background") == std::string::npos);
    assert(Parse(back, out));
    assert(!back.background);
    assert(back == d);
}

void unknown_and_missing_discriminator() {
    Shape s;
    auto r = Parse(s, R"({"type":"Hexagon","side":1})");
    assert(!r);
    assert(r.error() == ParseError::EXPECTED_TYPE);
    assert(r.typeName() == "object");
    assert(r.detail().find("Hexagon") != std::string::npos);

    // Case identifiers are not tags
    r = Parse(s, R"({"type":"Square","side":1})");
    assert(!r);
    assert(r.error() == ParseError::EXPECTED_TYPE);

    r = Parse(s, R"({"side":1})");
    assert(!r);
    assert(r.error() == ParseError::EXPECTED_TYPE);
    assert(r.detail().find("type") != std::string::npos);

    r = Parse(s, R"({"type":7,"side":1})");
    assert(!r);
    assert(r.error() == ParseError::EXPECTED_TYPE);

    r = Parse(s, R"({"type":null,"side":1})");
    assert(!r);
    assert(r.error() == ParseError::EXPECTED_TYPE);

    r = Parse(s, R"(["sq", 1])");
    assert(!r);
    assert(r.error() == ParseError::EXPECTED_TYPE);

    r = Parse(s, R"("sq")");
    assert(!r);
    assert(r.error() == ParseError::EXPECTED_TYPE);

    r = Parse(s, R"({"type":"sq",)");
    assert(!r);
    assert(r.error() == ParseError::READER_ERROR);
}

void payload_errors_propagate() {
    Shape s = Shape::make<"Circle">(Circle{7});

    auto r = Parse(s, R"({"type":"Circle"})");
    assert(!r);
    assert(r.error() == ParseError::MISSING_FIELD);
    assert(r.typeName() == "Circle");
    assert(r.detail() == "radius");
    // A failed parse leaves the previous value in place
    assert(s.is<"Circle">() && s.get<"Circle">().radius == 7);

    r = Parse(s, R"({"type":"sq","side":"big"})");
    assert(!r);
    assert(r.error() == ParseError::WRONG_JSON_FOR_NUMBER_STORAGE);
    assert(r.typeName() == "number(double)");
    assert(r.errorPath().size() == 1);
    assert(r.errorPath()[0].field_name == "side");
    assert(s.is<"Circle">());

    Drawing d;
    r = Parse(d, R"({"title":"t","shapes":[{"type":"Circle","radius":1},{"type":"sq","side":null}]})");
    assert(!r);
    assert(r.error() == ParseError::NULL_IN_NON_OPTIONAL);
    assert(ParseResultToString(r).starts_with("When parsing $.shapes[1].side,"));

    r = Parse(d, R"({"title":"t","shapes":[{"type":"Triangle"}]})");
    assert(!r);
    assert(r.error() == ParseError::EXPECTED_TYPE);
    assert(JsonPathToString(r) == "$.shapes[0]");
}

void discriminator_overrides_payload_field() {
    Figure f = Figure::make<"Marker">(Marker{"pin", 3});
    std::string out;
    assert(Serialize(f, out));
    assert(out == R"({"type":"Marker","size":3})");

    Figure back;
    assert(Parse(back, out));
    assert(back.is<"Marker">());
    assert(back.get<"Marker">().type == "Marker");
    assert(back.get<"Marker">().size == 3);
}

void nested_unions() {
    Entity e = Entity::make<"Shape">(Shape::make<"Square">(Square{5}));
    std::string out;
    assert(Serialize(e, out));
    assert(first_key(out) == "kind");
    assert(out.starts_with(R"({"kind":"object","type":"sq",)"));

    Entity back;
    assert(Parse(back, out));
    assert(back == e);

    e = Entity::make<"Figure">(Figure::make<"Polygon">(Polygon{std::vector<Point>{{1, 2}}, std::nullopt}));
    out.clear();
    assert(Serialize(e, out));
    assert(out.starts_with(R"({"kind":"Figure","type":"poly",)"));
    assert(Parse(back, out));
    assert(back.is<"Figure">());
    assert(back.get<"Figure">().get<"Polygon">().points.get().size() == 1);

    e = Entity::make<"Point">(Point{1, 2});
    out.clear();
    assert(Serialize(e, out));
    assert(out == R"({"kind":"pt","x":1,"y":2})");

    // Inner discriminator is checked after the outer one matched
    auto r = Parse(back, R"({"kind":"object","type":"pt","x":1,"y":2})");
    assert(!r);
    assert(r.error() == ParseError::EXPECTED_TYPE);
    assert(r.detail().find("pt") != std::string::npos);
}

void non_object_payload() {
    Measure m = Measure::make<"Count">(3);
    std::string out;
    auto w = Serialize(m, out);
    assert(!w);
    assert(w.error() == SerializeError::NON_OBJECT_PAYLOAD);
    assert(out.empty());

    // Decoding hands the whole object to the int payload, which rejects it
    auto r = Parse(m, R"({"unit":"integer(int32)"})");
    assert(!r);
    assert(r.error() == ParseError::WRONG_JSON_FOR_NUMBER_STORAGE);
    assert(r.typeName() == "integer(int32)");

    m = Measure::make<"Circle">(Circle{2});
    assert(Serialize(m, out));
    assert(out.starts_with(R"({"unit":"Circle",)"));
}

namespace {

// Converts to std::string by throwing
struct UnreadableText {
    operator std::string() const { throw std::runtime_error("unreadable"); }
};

} // namespace

void recursive_model() {
    const Node tree = Node::make<"Group">(Group{"root", {
        Node::make<"Leaf">(Leaf{"a", 1}),
        Node::make<"Group">(Group{"inner", {Node::make<"Leaf">(Leaf{"b", 2})}}),
    }});

    std::string out;
    auto w = Serialize(tree, out);
    assert(w);
    assert(out == R"({"type":"Group","id":"root","children":[)"
                  R"({"type":"Leaf","id":"a","weight":1},)"
                  R"({"type":"Group","id":"inner","children":[{"type":"Leaf","id":"b","weight":2}]}]})");

    Node back;
    auto r = Parse(back, out);
    assert(r);
    assert(back == tree);
    assert(back.get<"Group">().children[1].get<"Group">().children[0].tag() == "Leaf");

    r = Parse(back, R"({"type":"Group","id":"r","children":[{"type":"Group","id":"i","children":[{"type":"Leaf","id":"x"}]}]})");
    assert(!r);
    assert(r.error() == ParseError::MISSING_FIELD);
    assert(r.typeName() == "Leaf");
    assert(r.detail() == "weight");
    assert(JsonPathToString(r) == "$.children[0].children[0]");
}

void valueless_union() {
    Figure f = Figure::make<"Marker">(Marker{"pin", 1});
    bool threw = false;
    try {
        f.emplace<"Marker">(UnreadableText{}, 2);
    } catch(const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    assert(f.value.valueless_by_exception());
    assert(f.index() == std::variant_npos);
    assert(f.tag().empty());
    assert(f.case_identifier().empty());

    std::string out;
    auto w = Serialize(f, out);
    assert(!w);
    assert(w.error() == SerializeError::WRITER_ERROR);
    assert(out.empty());

    // Parsing restores a value
    auto r = Parse(f, R"({"type":"Circle","radius":1})");
    assert(r);
    assert(f.tag() == "Circle");
}

int main() {
    shape_scenario();
    shape_scenario_wire_text();
    round_trip();
    unknown_and_missing_discriminator();
    payload_errors_propagate();
    discriminator_overrides_payload_field();
    nested_unions();
    non_object_payload();
    recursive_model();
    valueless_union();
    std::cout << "codec tests passed" << std::endl;
    return 0;
}
