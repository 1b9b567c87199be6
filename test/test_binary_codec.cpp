/**
 * @file test_binary_codec.cpp
 * @brief Binary format layout, range checks and schema evolution
 */

#include "adaptr/adapter.hpp"
#include "adaptr/codec/binary_codec.hpp"
#include "adaptr/codec/byte_buffer.hpp"

#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <vector>

using namespace adaptr;

// Version 1 of a stored record
struct CrewMemberV1 {
    std::string name;
};

// Version 2 appends fields with defaults
struct CrewMemberV2 {
    std::string name;
    rfl::DefaultVal<std::int32_t> rank = 2;
    std::optional<std::string> nickname;
};

// Version 3 drops rank from the middle
struct CrewMemberV3 {
    std::string name;
    std::optional<std::string> nickname;
};

struct Telemetry {
    std::int8_t heel;
    float speed;
    std::vector<double> samples;
    std::optional<std::uint16_t> depth;
};

SchemaPtr int_schema(std::uint8_t bits, bool is_signed = true) {
    auto s = std::make_shared<Schema>();
    s->kind = SchemaKind::Int;
    s->bits = bits;
    s->is_signed = is_signed;
    return s;
}

SchemaPtr float_schema(std::uint8_t bits) {
    auto s = std::make_shared<Schema>();
    s->kind = SchemaKind::Float;
    s->bits = bits;
    return s;
}

Bytes bytes_of(std::initializer_list<int> values) {
    Bytes out;
    for (int v : values) {
        out.push_back(static_cast<std::byte>(v));
    }
    return out;
}

int main() {
    std::cout << "=== Binary Codec Tests ===\n\n";

    BinaryCodec codec;

    // Test 1: Varints and zig-zag
    {
        std::cout << "Test 1: Varints and zig-zag\n";

        assert(zigzag_encode(0) == 0);
        assert(zigzag_encode(-1) == 1);
        assert(zigzag_encode(1) == 2);
        assert(zigzag_encode(-2) == 3);
        assert(zigzag_decode(zigzag_encode(std::numeric_limits<std::int64_t>::min())) ==
               std::numeric_limits<std::int64_t>::min());

        ByteWriter out;
        out.varint(300);
        Bytes encoded = out.take();
        assert(encoded == bytes_of({0xAC, 0x02}));

        ByteReader in(encoded);
        assert(in.varint() == 300);
        assert(in.remaining() == 0);

        std::cout << "  PASS: LEB128 300 -> AC 02\n\n";
    }

    // Test 2: Record layout
    {
        std::cout << "Test 2: Record layout\n";

        Schema point;
        point.kind = SchemaKind::Record;
        point.name = "Point";
        point.fields.push_back({"x", int_schema(64), std::nullopt});
        point.fields.push_back({"y", int_schema(64), std::nullopt});

        Bytes encoded = codec.encode(Value::object({{"x", 1}, {"y", -1}}), &point);
        assert(encoded == bytes_of({0x02, 0x02, 0x01}));

        // Field order comes from the schema, not from the value
        assert(codec.encode(Value::object({{"y", -1}, {"x", 1}}), &point) == encoded);

        Value decoded = codec.decode(encoded, &point);
        assert(decoded == Value::object({{"x", 1}, {"y", -1}}));

        std::cout << "  PASS: field count + zig-zag fields\n\n";
    }

    // Test 3: Nullable and union nodes
    {
        std::cout << "Test 3: Nullable and union nodes\n";

        auto text = std::make_shared<Schema>();
        text->kind = SchemaKind::Text;
        auto maybe_text = make_nullable(*text);

        assert(codec.encode(Value{}, maybe_text.get()) == bytes_of({0x00}));
        assert(codec.encode(Value("hi"), maybe_text.get()) == bytes_of({0x01, 0x02, 'h', 'i'}));
        assert(codec.decode(bytes_of({0x00}), maybe_text.get()).is_null());

        Schema id;
        id.kind = SchemaKind::Union;
        id.branches = {int_schema(64), text};
        assert(codec.encode(Value(7), &id) == bytes_of({0x00, 0x0E}));
        assert(codec.encode(Value("x"), &id) == bytes_of({0x01, 0x01, 'x'}));
        assert(codec.decode(bytes_of({0x01, 0x01, 'x'}), &id) == Value("x"));

        std::cout << "  PASS: Null flag, union branch index\n\n";
    }

    // Test 4: Integer range
    {
        std::cout << "Test 4: Integer range\n";

        auto int8 = int_schema(8);
        assert(codec.encode(Value(-128), int8.get()) == bytes_of({0xFF, 0x01}));

        bool encode_threw = false;
        try {
            (void)codec.encode(Value(200), int8.get());
        } catch (const RangeError& e) {
            encode_threw = true;
            std::cout << "  " << e.what() << "\n";
        }
        assert(encode_threw);

        // Written as int64, read back as int8
        Bytes wide = codec.encode(Value(300), int_schema(64).get());
        bool decode_threw = false;
        try {
            (void)codec.decode(wide, int8.get());
        } catch (const RangeError&) {
            decode_threw = true;
        }
        assert(decode_threw);

        bool unsigned_threw = false;
        try {
            (void)codec.encode(Value(-1), int_schema(32, false).get());
        } catch (const RangeError&) {
            unsigned_threw = true;
        }
        assert(unsigned_threw);

        std::cout << "  PASS: RangeError on both sides\n\n";
    }

    // Test 5: Float widths
    {
        std::cout << "Test 5: Float widths\n";

        auto f32 = float_schema(32);
        auto f64 = float_schema(64);

        Bytes one = codec.encode(Value(1.0), f32.get());
        assert(one == bytes_of({0x00, 0x00, 0x80, 0x3F}));
        assert(codec.decode(one, f32.get()) == Value(1.0));
        assert(codec.encode(Value(0.1), f64.get()).size() == 8);

        bool inexact = false;
        try {
            (void)codec.encode(Value(0.1), f32.get());
        } catch (const RangeError&) {
            inexact = true;
        }
        assert(inexact);

        const double nan = std::numeric_limits<double>::quiet_NaN();
        assert(codec.decode(codec.encode(Value(nan), f32.get()), f32.get()) == Value(nan));

        // Integers are accepted where floats are declared
        assert(codec.decode(codec.encode(Value(3), f64.get()), f64.get()) == Value(3.0));

        std::cout << "  PASS: float32 must be exact, NaN survives\n\n";
    }

    // Test 6: Malformed input
    {
        std::cout << "Test 6: Malformed input\n";

        auto text = std::make_shared<Schema>();
        text->kind = SchemaKind::Text;

        auto decode_fails = [&](const Bytes& data, const Schema& schema) {
            try {
                (void)codec.decode(data, &schema);
            } catch (const DecodeError& e) {
                std::cout << "  rejected: " << e.what() << "\n";
                return true;
            }
            return false;
        };

        assert(decode_fails(bytes_of({0x05, 'a', 'b'}), *text));           // truncated text
        assert(decode_fails(bytes_of({0x01, 'a', 0x00}), *text));          // trailing byte
        assert(decode_fails(bytes_of({}), *int_schema(64)));               // empty input
        assert(decode_fails(bytes_of({0x80, 0x80}), *int_schema(64)));     // unterminated varint
        assert(decode_fails(bytes_of({0x02}), *make_nullable(*text)));     // bad null flag

        Schema hull;
        hull.kind = SchemaKind::Enum;
        hull.name = "Hull";
        hull.symbols = {"Wood", "Steel"};
        assert(decode_fails(bytes_of({0x02}), hull));                      // enum index out of range

        // Null items take no bytes, so their count is capped instead
        Schema nulls;
        nulls.kind = SchemaKind::Array;
        nulls.items = std::make_shared<Schema>();
        assert(decode_fails(bytes_of({0xFF, 0xFF, 0xFF, 0xFF, 0x0F}), nulls));
        assert(codec.decode(bytes_of({0x03}), &nulls) == Value::array({Value{}, Value{}, Value{}}));

        // Sized items are bounded by the remaining input
        Schema numbers;
        numbers.kind = SchemaKind::Array;
        numbers.items = int_schema(64);
        assert(decode_fails(bytes_of({0xFF, 0xFF, 0xFF, 0xFF, 0x0F, 0x00}), numbers));

        std::cout << "  PASS: DecodeError for truncation and garbage\n\n";
    }

    // Test 7: Schema required
    {
        std::cout << "Test 7: Schema required\n";

        bool threw = false;
        try {
            (void)codec.encode(Value(1), nullptr);
        } catch (const SchemaError& e) {
            threw = true;
            assert(std::string(e.what()) == "the binary format requires a schema");
        }
        assert(threw);

        std::cout << "  PASS: SchemaError without a schema\n\n";
    }

    // Test 8: Static types through the Adapter
    {
        std::cout << "Test 8: Static types through the Adapter\n";

        Adapter adapter;
        Telemetry t{-12, 7.5f, {0.25, -1.0}, std::nullopt};
        Bytes data = adapter.dump(t, "binary");
        Telemetry back = adapter.load<Telemetry>(data, "binary");
        assert(back.heel == -12);
        assert(back.speed == 7.5f);
        assert((back.samples == std::vector<double>{0.25, -1.0}));
        assert(!back.depth.has_value());

        t.depth = 40000;
        back = adapter.load<Telemetry>(adapter.dump(t, "binary"), "binary");
        assert(back.depth == 40000);

        std::cout << "  PASS: Narrow integers, float32, optional\n\n";
    }

    // Test 9: Appended fields take their defaults
    {
        std::cout << "Test 9: Appended fields take their defaults\n";

        Adapter adapter;
        Bytes old_payload = adapter.dump(CrewMemberV1{"Elvira"}, "binary");

        CrewMemberV2 upgraded = adapter.load<CrewMemberV2>(old_payload, "binary");
        assert(upgraded.name == "Elvira");
        assert(upgraded.rank.value() == 2);
        assert(!upgraded.nickname.has_value());

        // The reverse direction has too many fields
        CrewMemberV2 current;
        current.name = "Elvira";
        bool threw = false;
        try {
            (void)adapter.load<CrewMemberV1>(adapter.dump(current, "binary"), "binary");
        } catch (const DecodeError&) {
            threw = true;
        }
        assert(threw);

        std::cout << "  PASS: Old payloads stay readable\n\n";
    }

    // Test 10: Fields matched by name with the writer's schema
    {
        std::cout << "Test 10: Fields matched by name with the writer's schema\n";

        Adapter adapter;
        auto v1 = adapter.schema_for<CrewMemberV1>();
        auto v2 = adapter.schema_for<CrewMemberV2>();

        // Reader knows more fields than the writer
        Bytes old_payload = adapter.dump(CrewMemberV1{"Elvira"}, "binary");
        CrewMemberV2 upgraded = adapter.load<CrewMemberV2>(old_payload, "binary", *v1);
        assert(upgraded.name == "Elvira");
        assert(upgraded.rank.value() == 2);
        assert(!upgraded.nickname.has_value());

        // Writer knows more fields than the reader
        CrewMemberV2 current;
        current.name = "Bo";
        current.rank.value() = 5;
        current.nickname = "Bosun";
        Bytes new_payload = adapter.dump(current, "binary");
        CrewMemberV1 downgraded = adapter.load<CrewMemberV1>(new_payload, "binary", *v2);
        assert(downgraded.name == "Bo");

        // A field removed from the middle does not shift the ones after it
        CrewMemberV3 trimmed = adapter.load<CrewMemberV3>(new_payload, "binary", *v2);
        assert(trimmed.name == "Bo");
        assert(trimmed.nickname == "Bosun");

        // A required field the writer never had
        Schema nameless;
        nameless.kind = SchemaKind::Record;
        nameless.name = "CrewMemberV0";
        bool missing = false;
        try {
            (void)adapter.load<CrewMemberV1>(codec.encode(Value(Object{}), &nameless), "binary", nameless);
        } catch (const SchemaMismatchError& e) {
            missing = true;
            std::cout << "  " << e.what() << "\n";
        }
        assert(missing);

        // Codecs without schema-dependent layout ignore the writer's schema
        assert(adapter.load<CrewMemberV1>(adapter.dump(current, "json"), "json", *v2).name == "Bo");

        std::cout << "  PASS: Writer-only fields skipped, reader-only fields defaulted\n\n";
    }

    std::cout << "=== All Binary Codec Tests Passed! ===\n";
    std::cout << "✓ Varint layout\n";
    std::cout << "✓ Range checks\n";
    std::cout << "✓ Malformed input\n";
    std::cout << "✓ Schema evolution\n";
    std::cout << "✓ Writer schema resolution\n";

    return 0;
}
