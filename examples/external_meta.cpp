// Attaching names and field options from outside the type, and reflecting a
// non-aggregate through StructMeta
#include <TaggedJson/json.hpp>
#include <TaggedJson/struct_introspection.hpp>
using TaggedJson::Annotated;
using TaggedJson::options::description, TaggedJson::options::name, TaggedJson::options::key;
#include <iostream>
#include <format>
using std::cout;
using std::endl;
using std::format;


struct Motor {
    int rpm = 0;
    float load = 0;
};
template<> struct TaggedJson::Annotated<Motor> {
    using Options = OptionsPack<
        name<"Motor">
        >;
};

template<> struct TaggedJson::AnnotatedField<Motor, 1> {
    using Options = OptionsPack<
        key<"load_pct">,
        description<"Load in percent of rated torque">
        >;
};

class Sensor {
public:
    Sensor() = default;
    double reading() const { return value; }

    double value = 0;
    std::string unit = "C";
};
template<> struct TaggedJson::StructMeta<Sensor> {
    using Fields = StructFields<
        Field<&Sensor::value, "value">,
        Field<&Sensor::unit, "unit", description<"SI unit symbol">>
        >;
};
template<> struct TaggedJson::Annotated<Sensor> {
    using Options = OptionsPack<
        name<"Sensor">
        >;
};

using Device = TaggedJson::OneOf<
    TaggedJson::options::property_name<"device">,
    TaggedJson::Case<"Motor", Motor>,
    TaggedJson::Case<"Sensor", Sensor, TaggedJson::options::mapping<"temp">>
>;


int main() {
    std::string out;
    TaggedJson::Serialize(Device::make<"Motor">(Motor{1200, 0.5f}), out);
    cout << out << endl;
    /* {"device":"Motor","rpm":1200,"load_pct":0.5} */

    Device d;
    TaggedJson::Parse(d, std::string_view(R"({"device":"temp","value":21.5,"unit":"K"})"));
    const Sensor& s = d.get<"Sensor">();
    cout << format("sensor: {} {}", s.reading(), s.unit) << endl;
    /* sensor: 21.5 K */

    TaggedJson::Registry registry;
    TaggedJson::RegisterType<Device>(registry);
    out.clear();
    TaggedJson::ComponentsToString(registry, out);
    cout << out << endl;
}
