/**
 * @file test_json_codec.cpp
 * @brief JSON text format, schema coercion and newline-delimited streams
 */

#include "adaptr/adapter.hpp"
#include "adaptr/codec/base64.hpp"
#include "adaptr/codec/json_codec.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using namespace adaptr;

struct Document {
    std::string title;
    Bytes payload;
    double score;
    std::optional<std::string> author;
};

struct Reading {
    std::string sensor;
    std::variant<std::int64_t, std::string> value;
};

std::string text_of(const Bytes& data) {
    return std::string(as_text(data));
}

SchemaPtr scalar(SchemaKind kind, std::uint8_t bits = 0) {
    auto s = std::make_shared<Schema>();
    s->kind = kind;
    s->bits = bits;
    return s;
}

int main() {
    std::cout << "=== JSON Codec Tests ===\n\n";

    JsonCodec codec;

    // Test 1: Encoding
    {
        std::cout << "Test 1: Encoding\n";

        Value v = Value::object({{"name", "Elvira"}, {"crew", 3}, {"active", true}, {"port", Value{}}});
        std::string json = text_of(codec.encode(v, nullptr));
        std::cout << "  " << json << "\n";
        assert(json == R"({"name":"Elvira","crew":3,"active":true,"port":null})");

        Bytes raw{std::byte{'h'}, std::byte{'i'}};
        assert(text_of(codec.encode(Value(raw), nullptr)) == "\"aGk=\"");

        std::cout << "  PASS: Key order kept, bytes as base64\n\n";
    }

    // Test 2: Non-finite floats
    {
        std::cout << "Test 2: Non-finite floats\n";

        for (double d : {std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::infinity()}) {
            bool threw = false;
            try {
                (void)codec.encode(Value::array({1, d}), nullptr);
            } catch (const RangeError&) {
                threw = true;
            }
            assert(threw);
        }

        std::cout << "  PASS: NaN and infinity raise RangeError\n\n";
    }

    // Test 3: Decoding without a schema
    {
        std::cout << "Test 3: Decoding without a schema\n";

        Value v = codec.decode(to_bytes(R"({"a":[1,2.5,"x",null,false],"b":{}})"), nullptr);
        const auto& a = v.as_object().find("a")->as_array();
        assert(a[0] == Value(1));
        assert(a[1] == Value(2.5));
        assert(a[2] == Value("x"));
        assert(a[3].is_null());
        assert(a[4] == Value(false));
        assert(v.as_object().find("b")->as_object().empty());

        bool threw = false;
        try {
            (void)codec.decode(to_bytes("{\"a\": [1, 2"), nullptr);
        } catch (const DecodeError& e) {
            threw = true;
            std::cout << "  rejected: " << e.what() << "\n";
        }
        assert(threw);

        std::cout << "  PASS: Text decoded as written, malformed text rejected\n\n";
    }

    // Test 4: Coercion into a schema
    {
        std::cout << "Test 4: Coercion into a schema\n";

        Schema record;
        record.kind = SchemaKind::Record;
        record.name = "Sample";
        record.fields.push_back({"ratio", scalar(SchemaKind::Float, 64), std::nullopt});
        record.fields.push_back({"blob", scalar(SchemaKind::Bytes), std::nullopt});
        record.fields.push_back({"tries", scalar(SchemaKind::Int, 8), Value(3)});
        record.fields.push_back({"note", make_nullable(*scalar(SchemaKind::Text)), std::nullopt});

        Value coerced = coerce(Value::object({{"ratio", 2}, {"blob", "aGk="}, {"extra", 1}}), record);
        const auto& obj = coerced.as_object();
        assert(*obj.find("ratio") == Value(2.0));
        assert(obj.find("blob")->as_bytes().size() == 2);
        assert(*obj.find("tries") == Value(3));
        assert(obj.find("note")->is_null());
        assert(*obj.find("extra") == Value(1));     // unknown keys are kept

        bool missing = false;
        try {
            (void)coerce(Value::object({{"blob", "aGk="}}), record);
        } catch (const SchemaMismatchError& e) {
            missing = true;
            assert(std::string(e.what()).find("'ratio'") != std::string::npos);
        }
        assert(missing);

        bool range = false;
        try {
            (void)coerce(Value::object({{"ratio", 1.0}, {"blob", ""}, {"tries", 1000}}), record);
        } catch (const RangeError&) {
            range = true;
        }
        assert(range);

        bool bad_base64 = false;
        try {
            (void)coerce(Value("not base64!"), *scalar(SchemaKind::Bytes));
        } catch (const SchemaMismatchError&) {
            bad_base64 = true;
        }
        assert(bad_base64);

        // int64 extremes: the minimum is a power of two, the maximum rounds up to 2^63
        auto f64 = scalar(SchemaKind::Float, 64);
        const auto lowest = std::numeric_limits<std::int64_t>::min();
        assert(coerce(Value(lowest), *f64) == Value(static_cast<double>(lowest)));
        bool inexact = false;
        try {
            (void)coerce(Value(std::numeric_limits<std::int64_t>::max()), *f64);
        } catch (const RangeError& e) {
            inexact = true;
            std::cout << "  " << e.what() << "\n";
        }
        assert(inexact);

        std::cout << "  PASS: int->float, base64->bytes, defaults, nulls, ranges\n\n";
    }

    // Test 5: Union branches
    {
        std::cout << "Test 5: Union branches\n";

        Schema id;
        id.kind = SchemaKind::Union;
        id.branches = {scalar(SchemaKind::Int, 64), scalar(SchemaKind::Bytes), scalar(SchemaKind::Text)};

        // Text matches the text branch better than the base64 bytes branch
        assert(coerce(Value("aGk="), id) == Value("aGk="));
        assert(coerce(Value(5), id) == Value(5));

        bool threw = false;
        try {
            (void)coerce(Value(true), id);
        } catch (const SchemaMismatchError&) {
            threw = true;
        }
        assert(threw);

        std::cout << "  PASS: Best scoring branch wins\n\n";
    }

    // Test 6: Newline-delimited streams
    {
        std::cout << "Test 6: Newline-delimited streams\n";

        std::string text = text_of(codec.encode_many({Value::object({{"n", 1}}), Value::object({{"n", 2}})}, nullptr));
        assert(text == "{\"n\":1}\n{\"n\":2}\n");

        auto values = codec.decode_many(to_bytes("{\"n\":1}\r\n\r\n  \n{\"n\":2}"), nullptr);
        assert(values.size() == 2);
        assert(*values[1].as_object().find("n") == Value(2));

        assert(codec.decode_many(to_bytes(""), nullptr).empty());

        std::cout << "  PASS: One document per line, blank lines skipped\n\n";
    }

    // Test 7: Static types through the Adapter
    {
        std::cout << "Test 7: Static types through the Adapter\n";

        Adapter adapter;
        Document doc{"log", Bytes{std::byte{0}, std::byte{255}}, 2.0, std::nullopt};
        Bytes data = adapter.dump(doc, "json");
        std::cout << "  " << text_of(data) << "\n";
        assert(text_of(data).find("\"payload\":\"AP8=\"") != std::string::npos);

        Document back = adapter.load<Document>(data, "json");
        assert(back.title == "log");
        assert(back.payload == doc.payload);
        assert(back.score == 2.0);
        assert(!back.author.has_value());

        // Integral JSON numbers load into double fields; absent optionals are null
        Document sparse = adapter.load<Document>(to_bytes(R"({"title":"t","payload":"","score":7})"), "json");
        assert(sparse.score == 7.0);
        assert(sparse.payload.empty());
        assert(!sparse.author.has_value());

        std::cout << "  PASS: Round trip, coercion on load\n\n";
    }

    // Test 8: Variants and many values
    {
        std::cout << "Test 8: Variants and many values\n";

        Adapter adapter;
        std::vector<Reading> readings{{"depth", std::int64_t{12}}, {"status", std::string("ok")}};
        Bytes data = adapter.dump_many(readings, "json");
        assert(text_of(data) == "{\"sensor\":\"depth\",\"value\":12}\n{\"sensor\":\"status\",\"value\":\"ok\"}\n");

        auto back = adapter.load_many<Reading>(data, "json");
        assert(back.size() == 2);
        assert(std::get<std::int64_t>(back[0].value) == 12);
        assert(std::get<std::string>(back[1].value) == "ok");

        std::cout << "  PASS: Untagged variants pick their branch on load\n\n";
    }

    std::cout << "=== All JSON Codec Tests Passed! ===\n";
    std::cout << "✓ Encoding and decoding\n";
    std::cout << "✓ Schema coercion\n";
    std::cout << "✓ NDJSON\n";
    std::cout << "✓ Adapter round trips\n";

    return 0;
}
