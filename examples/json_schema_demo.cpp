/**
 * OpenAPI schema generation for discriminated unions
 *
 * Registers every payload of a union in a Registry, then prints the union's
 * inline schema and the shared components document.
 *
 * For the assertions behind this output, see: tests/schema/main.cpp
 */

#include <TaggedJson/json.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace TaggedJson;
using namespace TaggedJson::options;

struct Card {
    std::string number;
    A<std::string, key<"holder_name">, description<"Name as printed on the card">> holder;
};

struct BankTransfer {
    std::string iban;
    std::optional<std::string> reference;
};

struct Voucher {
    std::string code;
    std::vector<std::string> restrictions;
};

template<> struct TaggedJson::Annotated<Card> {
    using Options = OptionsPack<name<"Card">, description<"Credit or debit card">>;
};
template<> struct TaggedJson::Annotated<BankTransfer> {
    using Options = OptionsPack<name<"BankTransfer">>;
};
template<> struct TaggedJson::Annotated<Voucher> {
    using Options = OptionsPack<name<"Voucher">>;
};

using PaymentMethod = OneOf<
    property_name<"method">,
    title<"Payment method">,
    description<"How an order is paid">,
    external_docs<"https://example.com/docs/payments", "Payment guide">,
    Case<"Card", Card, mapping<"card">>,
    Case<"BankTransfer", BankTransfer, mapping<"sepa">>,
    Case<"Voucher", Voucher>
>;

struct Order {
    int id;
    PaymentMethod payment;
};
template<> struct TaggedJson::Annotated<Order> {
    using Options = OptionsPack<name<"Order">>;
};

int main() {
    std::string out;
    SchemaToString(SchemaOf<PaymentMethod>(), out, YYJSON_WRITE_PRETTY);
    std::cout << "PaymentMethod schema:" << std::endl << out << std::endl;

    Registry registry;
    RegisterType<Order>(registry);
    out.clear();
    ComponentsToString(registry, out, YYJSON_WRITE_PRETTY);
    std::cout << "Components:" << std::endl << out << std::endl;

    Order order{42, PaymentMethod::make<"BankTransfer">(BankTransfer{"DE89370400440532013000", std::nullopt})};
    out.clear();
    Serialize(order, out);
    std::cout << out << std::endl;
    /* {"id":42,"payment":{"method":"sepa","iban":"DE89370400440532013000"}} */
    return 0;
}
