// Basic TaggedJson usage: a discriminated union of two shapes

#include <TaggedJson/json.hpp>
#include <TaggedJson/error_formatting.hpp>
#include <iostream>
#include <string>

using namespace TaggedJson;

struct Circle {
    double radius;
};
struct Square {
    double side;
};

template<> struct TaggedJson::Annotated<Circle> {
    using Options = OptionsPack<options::name<"Circle">>;
};
template<> struct TaggedJson::Annotated<Square> {
    using Options = OptionsPack<options::name<"Square">>;
};

using Shape = OneOf<
    options::property_name<"type">,
    Case<"Circle", Circle>,
    Case<"Square", Square, options::mapping<"sq">>
>;

int main() {
    Shape shape;
    auto result = Parse(shape, std::string_view(R"({"type": "sq", "side": 3})"));
    if (!result) {
        std::cout << ParseResultToString(result) << std::endl;
        return 1;
    }
    std::cout << "Parsed case " << shape.case_identifier() << " (tag \"" << shape.tag() << "\")" << std::endl;

    shape.visit([](const auto& s) {
        if constexpr (requires { s.side; }) {
            std::cout << "Square side: " << s.side << std::endl;
        } else {
            std::cout << "Circle radius: " << s.radius << std::endl;
        }
    });

    std::string out;
    Serialize(Shape::make<"Circle">(Circle{1.5}), out);
    std::cout << out << std::endl;
    /* {"type":"Circle","radius":1.5} */

    result = Parse(shape, std::string_view(R"({"type": "Triangle"})"));
    std::cout << ParseResultToString(result) << std::endl;
    /* When parsing $, parsing error 'EXPECTED_TYPE' in object: unrecognized discriminator value "Triangle" in property 'type' */

    return 0;
}
