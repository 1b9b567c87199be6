/**
 * @file test_adapter_roundtrip.cpp
 * @brief Adapter facade: round trips, failures, plugins and customization
 *
 * Validates:
 * - Nested optional collections survive every format
 * - Missing converters, missing fields and unknown fields
 * - Runtime declarations through load_value
 * - Plugins, streams and the default adapter
 * - Recursive records and Declare<T> specializations
 * - Flat records through every format, CSV included
 */

#include "adaptr/adaptr.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using namespace adaptr;

using Readings = std::vector<std::map<std::string, std::optional<std::int64_t>>>;

struct Survey {
    std::string station;
    Readings readings;
};

struct Mooring {
    std::string name;
    std::optional<std::int64_t> berth;
    std::optional<std::string> note;
    std::variant<std::int64_t, std::string> tag;
};

struct Anchorage {
    std::optional<std::string> note;
};

struct Account {
    std::string user;
    std::string password;
};

// No aggregate: resolved as an opaque type
class Beacon {
public:
    Beacon() = default;
    explicit Beacon(int channel) : channel_(channel) {}
    int channel() const { return channel_; }

private:
    int channel_ = 0;
};

struct Buoy {
    std::string name;
    Beacon beacon;
};

struct TreeNode {
    std::int64_t value;
    std::vector<TreeNode> children;
};

class LatLon {
public:
    LatLon() = default;
    LatLon(double lat, double lon) : lat_(lat), lon_(lon) {}
    double lat() const { return lat_; }
    double lon() const { return lon_; }
    void set(double lat, double lon) {
        lat_ = lat;
        lon_ = lon;
    }

private:
    double lat_ = 0.0;
    double lon_ = 0.0;
};

template<>
struct adaptr::Declare<LatLon> {
    static TypeDeclPtr declaration() { return TypeDecl::opaque("geo.LatLon"); }
};

struct Harbour {
    std::string name;
    LatLon position;
};

Converter lat_lon_converter() {
    return Converter{
        "geo.lat_lon",
        [](const ObjectRef& object, const TypeDescriptor&, ConversionContext&) {
            const auto& p = object.as<LatLon>();
            return Value::array({p.lat(), p.lon()});
        },
        [](const Value& value, const MutableRef& object, const TypeDescriptor&, ConversionContext& ctx) {
            if (!value.is_array() || value.as_array().size() != 2) {
                ctx.mismatch("expected [lat, lon]");
            }
            const auto& pair = value.as_array();
            auto number = [](const Value& v) { return v.is_int() ? static_cast<double>(v.as_int()) : v.as_float(); };
            object.as<LatLon>().set(number(pair[0]), number(pair[1]));
        }};
}

// Writes a tree node the same way the record converter does, field by field
Converter tree_converter() {
    return Converter{
        "test.tree",
        [](const ObjectRef& object, const TypeDescriptor& type, ConversionContext& ctx) {
            Object out;
            object.binding().for_each_field(object.get(), [&](std::size_t i, ObjectRef field) {
                auto scope = ctx.field(type.fields()[i].name);
                out.insert_or_assign(type.fields()[i].name, ctx.to_intermediate(field));
            });
            return Value(std::move(out));
        },
        [](const Value& value, const MutableRef& object, const TypeDescriptor& type, ConversionContext& ctx) {
            object.binding().for_each_mutable_field(object.get(), [&](std::size_t i, MutableRef field) {
                auto scope = ctx.field(type.fields()[i].name);
                const Value* item = value.as_object().find(type.fields()[i].name);
                if (!item) {
                    ctx.mismatch("missing required field '" + type.fields()[i].name + "'");
                }
                ctx.from_intermediate(*item, field);
            });
        }};
}

class CountingPlugin : public Plugin {
public:
    std::string name() const override { return "test.counting"; }
    void install(Adapter& adapter) const override {
        adapter.register_converter<LatLon>(lat_lon_converter());
    }
};

int main() {
    std::cout << "=== Adapter Round Trip Tests ===\n\n";

    // Test 1: Nested optional collections
    {
        std::cout << "Test 1: Nested optional collections\n";

        Adapter adapter;
        Survey survey;
        survey.station = "north";
        survey.readings.push_back({{"x", 1}, {"y", std::nullopt}});
        survey.readings.emplace_back();

        for (const char* format : {"json", "binary"}) {
            Bytes data = adapter.dump(survey, format);
            Survey back = adapter.load<Survey>(data, format);
            assert(back.station == "north");
            assert(back.readings.size() == 2);
            assert(back.readings[0].at("x") == 1);
            assert(back.readings[0].count("y") == 1);
            assert(!back.readings[0].at("y").has_value());
            assert(back.readings[1].empty());
            std::cout << "  " << format << ": " << data.size() << " bytes\n";
        }

        Value v = adapter.to_intermediate(survey.readings);
        assert(v.to_debug_string().find("null") != std::string::npos);
        Readings back = adapter.from_intermediate<Readings>(v);
        assert(back == survey.readings);

        std::cout << "  PASS: Null entries and empty maps kept\n\n";
    }

    // Test 2: Opaque type without a converter
    {
        std::cout << "Test 2: Opaque type without a converter\n";

        Adapter adapter;
        bool threw = false;
        try {
            (void)adapter.dump(Buoy{"red", Beacon{16}}, "json");
        } catch (const NoConverterError& e) {
            threw = true;
            std::string message = e.what();
            std::cout << "  " << message << "\n";
            assert(message.find("opaque") != std::string::npos);
            assert(message.find("Beacon") != std::string::npos);
            assert(e.kind() == ErrorKind::NoConverter);
        }
        assert(threw);

        std::cout << "  PASS: NoConverterError names the opaque type\n\n";
    }

    // Test 3: Missing and unknown fields
    {
        std::cout << "Test 3: Missing and unknown fields\n";

        Adapter adapter;
        bool missing = false;
        try {
            (void)adapter.load<Account>(to_bytes(R"({"user":"ada"})"), "json");
        } catch (const SchemaMismatchError& e) {
            missing = true;
            assert(std::string(e.what()).find("missing required field") != std::string::npos);
        }
        assert(missing);

        std::ostringstream log;
        adapter.logger().set_sink(&log);
        Account loaded = adapter.load<Account>(to_bytes(R"({"user":"ada","password":"pw","role":"admin"})"), "json");
        adapter.logger().set_sink(&std::cerr);
        assert(loaded.user == "ada" && loaded.password == "pw");
        std::cout << "  " << log.str();
        assert(log.str().find("[Adapter]") == 0);
        assert(log.str().find("'role'") != std::string::npos);

        AdapterConfig strict;
        strict.reject_unknown_fields.value() = true;
        Adapter strict_adapter(strict);
        bool rejected = false;
        try {
            (void)strict_adapter.load<Account>(to_bytes(R"({"user":"ada","password":"pw","role":"admin"})"), "json");
        } catch (const SchemaMismatchError& e) {
            rejected = true;
            assert(std::string(e.what()).find("unknown field 'role'") != std::string::npos);
        }
        assert(rejected);

        std::cout << "  PASS: Required fields enforced, unknown fields logged or rejected\n\n";
    }

    // Test 4: Runtime declarations
    {
        std::cout << "Test 4: Runtime declarations\n";

        Adapter adapter;
        auto point = TypeDecl::record("Point", {
            {"x", TypeDecl::integer(32)},
            {"y", TypeDecl::nullable(TypeDecl::integer(32))},
            {"label", TypeDecl::text(), Value("origin")},
        });

        Value v = adapter.load_value(to_bytes(R"({"x":4})"), point, "json");
        assert(v == Value::object({{"x", 4}, {"y", Value{}}, {"label", "origin"}}));

        bool range = false;
        try {
            (void)adapter.load_value(to_bytes(R"({"x":5000000000})"), point, "json");
        } catch (const RangeError&) {
            range = true;
        }
        assert(range);

        // The binary form of the same declaration
        auto schema = adapter.schema_for(adapter.resolve(point));
        Bytes binary = adapter.codec("binary")->encode(v, schema.get());
        assert(adapter.load_value(binary, point, "binary") == v);

        std::cout << "  PASS: Defaults applied, ranges checked\n\n";
    }

    // Test 5: Codecs and plugins
    {
        std::cout << "Test 5: Codecs and plugins\n";

        Adapter adapter;
        assert(adapter.installed("adaptr.builtin"));
        assert(adapter.installed("adaptr.binary"));
        assert(adapter.installed("adaptr.json"));
        assert(adapter.installed("adaptr.csv"));
        assert(!adapter.installed("test.counting"));

        bool unknown = false;
        try {
            (void)adapter.dump(Account{"a", "b"}, "xml");
        } catch (const UnknownFormatError& e) {
            unknown = true;
            assert(std::string(e.what()) == "'xml' serialization format not supported");
        }
        assert(unknown);

        bool duplicate = false;
        try {
            adapter.install(JsonPlugin{});
        } catch (const std::invalid_argument&) {
            duplicate = true;
        }
        assert(duplicate);

        adapter.install(CountingPlugin{});
        assert(adapter.installed("test.counting"));

        std::cout << "  PASS: Built-in plugins present, duplicates rejected\n\n";
    }

    // Test 6: Declare<T> specialization
    {
        std::cout << "Test 6: Declare<T> specialization\n";

        Adapter adapter;
        adapter.install(CountingPlugin{});

        auto descriptor = adapter.resolve<Harbour>();
        assert(descriptor->fields()[1].type->to_string() == "opaque geo.LatLon");

        Harbour kiel{"Kiel", LatLon(54.5, 10.25)};
        Bytes data = adapter.dump(kiel, "json");
        std::cout << "  " << as_text(data) << "\n";
        assert(as_text(data) == R"({"name":"Kiel","position":[54.5,10.25]})");

        Harbour back = adapter.load<Harbour>(data, "json");
        assert(back.name == "Kiel");
        assert(back.position.lat() == 54.5 && back.position.lon() == 10.25);

        std::cout << "  PASS: Custom declaration with its converter\n\n";
    }

    // Test 7: Recursive records
    {
        std::cout << "Test 7: Recursive records\n";

        Adapter adapter;
        TreeNode tree{1, {{2, {}}, {3, {{4, {}}}}}};

        bool unsupported = false;
        try {
            (void)adapter.dump(tree, "json");
        } catch (const UnsupportedTypeError& e) {
            unsupported = true;
            assert(e.subject() == "TreeNode");
        }
        assert(unsupported);

        adapter.register_converter<TreeNode>(tree_converter());
        Bytes data = adapter.dump(tree, "json");
        std::cout << "  " << as_text(data) << "\n";

        TreeNode back = adapter.load<TreeNode>(data, "json");
        assert(back.value == 1);
        assert(back.children.size() == 2);
        assert(back.children[1].children[0].value == 4);

        // The schema stops at the back-reference
        bool no_schema = false;
        try {
            (void)adapter.dump(tree, "binary");
        } catch (const SchemaError&) {
            no_schema = true;
        }
        assert(no_schema);

        std::cout << "  PASS: Resolvable once a converter is registered\n\n";
    }

    // Test 8: Streams and the default adapter
    {
        std::cout << "Test 8: Streams and the default adapter\n";

        std::stringstream stream;
        default_adapter().dump_to_stream(Account{"ada", "pw"}, stream, "json");
        assert(stream.str() == R"({"user":"ada","password":"pw"})");

        Account back = default_adapter().load_from_stream<Account>(stream, "json");
        assert(back.user == "ada");

        Bytes data = adaptr::dump(Account{"bob", "x"}, "binary");
        assert(adaptr::load<Account>(data, "binary").user == "bob");

        Value v = adaptr::to_intermediate(Account{"eve", "y"});
        assert(adaptr::from_intermediate<Account>(v).password == "y");

        std::vector<Account> accounts{{"a", "1"}, {"b", "2"}};
        auto many = adaptr::load_many<Account>(adaptr::dump_many(accounts, "csv"), "csv");
        assert(many.size() == 2 && many[1].user == "b");

        std::cout << "  PASS: Stream helpers and free functions\n\n";
    }

    // Test 9: Flat records through every format
    {
        std::cout << "Test 9: Flat records through every format\n";

        Adapter adapter;
        std::vector<Mooring> moorings{
            {"", std::nullopt, std::nullopt, std::string("5")},
            {"Kiel", 3, std::string(""), std::int64_t{5}},
            {"a,\"b\"", -1, std::string("line\nbreak"), std::string("")}};
        std::vector<Anchorage> empty_notes{{std::nullopt}, {std::string("")}, {std::nullopt}};

        for (const char* format : {"json", "binary", "csv"}) {
            for (const auto& mooring : moorings) {
                Mooring back = adapter.load<Mooring>(adapter.dump(mooring, format), format);
                assert(back.name == mooring.name);
                assert(back.berth == mooring.berth);
                assert(back.note == mooring.note);
                assert(back.tag == mooring.tag);
            }

            auto many = adapter.load_many<Mooring>(adapter.dump_many(moorings, format), format);
            assert(many.size() == moorings.size());
            assert(many[0].tag.index() == 1 && std::get<std::string>(many[0].tag) == "5");
            assert(many[1].tag.index() == 0 && std::get<std::int64_t>(many[1].tag) == 5);

            Anchorage none = adapter.load<Anchorage>(adapter.dump(Anchorage{}, format), format);
            assert(!none.note.has_value());
            auto notes = adapter.load_many<Anchorage>(adapter.dump_many(empty_notes, format), format);
            assert(notes.size() == 3);
            assert(!notes[0].note.has_value());
            assert(notes[1].note == std::string(""));
            assert(!notes[2].note.has_value());

            std::cout << "  " << format << ": ok\n";
        }

        std::cout << "  PASS: Nulls, empty strings and union text survive\n\n";
    }

    // Test 10: Union alternatives that accept the same value
    {
        std::cout << "Test 10: Union alternatives that accept the same value\n";

        Adapter adapter;

        // Equal scores go to the alternative declared first
        using WideFirst = std::variant<std::int64_t, std::int32_t>;
        WideFirst narrow = std::int32_t{7};
        WideFirst back = adapter.from_intermediate<WideFirst>(adapter.to_intermediate(narrow));
        assert(back.index() == 0);
        assert(std::get<std::int64_t>(back) == 7);

        // Declared narrow first, the width decides
        using NarrowFirst = std::variant<std::int32_t, std::int64_t>;
        assert(adapter.from_intermediate<NarrowFirst>(Value(7)).index() == 0);
        assert(adapter.from_intermediate<NarrowFirst>(Value(std::int64_t{1} << 40)).index() == 1);

        std::cout << "  PASS: Ties resolved by declaration order\n\n";
    }

    std::cout << "=== All Adapter Round Trip Tests Passed! ===\n";
    std::cout << "✓ Nested collections in every format\n";
    std::cout << "✓ Conversion failures\n";
    std::cout << "✓ Runtime declarations\n";
    std::cout << "✓ Plugins and customization\n";
    std::cout << "✓ Flat records in CSV\n";

    return 0;
}
