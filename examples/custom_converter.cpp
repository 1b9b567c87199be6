#include "adaptr/adaptr.hpp"
#include <cstdio>
#include <iostream>

using namespace adaptr;

// ============================================================================
// A class the library cannot look into
// ============================================================================

class Money {
public:
    Money() = default;
    Money(std::int64_t cents, std::string currency) : cents_(cents), currency_(std::move(currency)) {}

    std::int64_t cents() const { return cents_; }
    const std::string& currency() const { return currency_; }

    std::string to_string() const {
        char buffer[48];
        std::snprintf(buffer, sizeof(buffer), "%lld.%02lld %s", static_cast<long long>(cents_ / 100),
                      static_cast<long long>(cents_ < 0 ? -(cents_ % 100) : cents_ % 100), currency_.c_str());
        return buffer;
    }

    static std::optional<Money> parse(const std::string& text) {
        long long units = 0;
        unsigned cents = 0;
        char currency[4] = {};
        if (std::sscanf(text.c_str(), "%lld.%2u %3s", &units, &cents, currency) != 3) {
            return std::nullopt;
        }
        return Money(units * 100 + (units < 0 ? -static_cast<long long>(cents) : cents), currency);
    }

private:
    std::int64_t cents_ = 0;
    std::string currency_ = "EUR";
};

// Give Money a stable name instead of the compiler's spelling
template<>
struct adaptr::Declare<Money> {
    static TypeDeclPtr declaration() { return TypeDecl::opaque("acme.Money"); }
};

struct Invoice {
    std::string customer;
    Money total;
    std::vector<Money> lines;
};

// ============================================================================
// Plugin bundling converter and schema fragment
// ============================================================================

class MoneyPlugin : public Plugin {
public:
    std::string name() const override { return "acme.money"; }

    void install(Adapter& adapter) const override {
        adapter.register_converter<Money>(Converter{
            "acme.money_text",
            [](const ObjectRef& object, const TypeDescriptor&, ConversionContext&) {
                return Value(object.as<Money>().to_string());
            },
            [](const Value& value, const MutableRef& object, const TypeDescriptor&, ConversionContext& ctx) {
                if (!value.is_text()) {
                    ctx.mismatch("money must be text like \"12.50 EUR\"");
                }
                auto parsed = Money::parse(value.as_text());
                if (!parsed) {
                    ctx.mismatch("'" + value.as_text() + "' is not an amount");
                }
                object.as<Money>() = *parsed;
            }});

        // Lets schema-driven formats (binary) handle the opaque type
        adapter.register_hook<HookPoint::DeriveSchema>("acme.money_schema",
            [](const TypeDescriptor& type, const SchemaPtr*) -> HookResult<SchemaPtr> {
                if (type.kind() != Kind::Opaque || type.name() != "acme.Money") {
                    return HookResult<SchemaPtr>::not_applicable();
                }
                auto schema = std::make_shared<Schema>();
                schema->kind = SchemaKind::Text;
                return SchemaPtr(schema);
            });
    }
};

// ============================================================================
// A format of our own
// ============================================================================

class DebugCodec : public Codec {
public:
    std::string name() const override { return "debug"; }
    SchemaUse schema_use() const override { return SchemaUse::Ignored; }

    Bytes encode(const Value& value, const Schema*) const override {
        return to_bytes(value.to_debug_string());
    }

    Value decode(std::span<const std::byte>, const Schema*) const override {
        throw DecodeError("the debug format is write-only");
    }
};

int main() {
    std::cout << "adaptr Custom Converter Example\n";
    std::cout << "===============================\n\n";

    Adapter adapter;
    adapter.install(MoneyPlugin{});
    adapter.register_codec(std::make_shared<DebugCodec>());

    Invoice invoice{"Elvira Shipping", Money(125050, "EUR"), {Money(100000, "EUR"), Money(25050, "EUR")}};

    // ========================================================================
    // Example 1: The converter inside a record and a list
    // ========================================================================

    std::cout << "=== Example 1: JSON ===\n\n";

    Bytes json = adapter.dump(invoice, "json");
    std::cout << "  " << as_text(json) << "\n";

    Invoice back = adapter.load<Invoice>(json, "json");
    std::cout << "  Total: " << back.total.to_string() << " over " << back.lines.size() << " lines\n\n";

    // ========================================================================
    // Example 2: Binary via the schema hook
    // ========================================================================

    std::cout << "=== Example 2: Binary ===\n\n";

    std::cout << "  Schema: " << adapter.schema_for<Invoice>()->to_string() << "\n";
    Bytes binary = adapter.dump(invoice, "binary");
    std::cout << "  " << binary.size() << " bytes, total "
              << adapter.load<Invoice>(binary, "binary").total.to_string() << "\n\n";

    // ========================================================================
    // Example 3: Hooks and codecs
    // ========================================================================

    std::cout << "=== Example 3: Hooks and codecs ===\n\n";

    adapter.register_hook<HookPoint::ToIntermediate>("acme.hide_customer",
        [](const TypeDescriptor& type, const Value* partial) -> HookResult<Value> {
            if (type.name() != "Invoice" || !partial) {
                return HookResult<Value>::not_applicable();
            }
            Object copy = partial->as_object();
            copy.insert_or_assign("customer", "<hidden>");
            return Value(std::move(copy));
        });
    std::cout << "  " << as_text(adapter.dump(invoice, "DEBUG")) << "\n";

    try {
        (void)adapter.load<Invoice>(to_bytes(R"({"customer":"x","total":"lots","lines":[]})"), "json");
    } catch (const SchemaMismatchError& e) {
        std::cout << "  " << e.what() << "\n";
    }

    std::cout << "\nDone.\n";
    return 0;
}
