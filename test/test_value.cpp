/**
 * @file test_value.cpp
 * @brief Intermediate Value model tests
 *
 * Validates:
 * - Construction and kind accessors
 * - Strict structural equality (NaN equals NaN, object order matters)
 * - Range rejection of unsigned 64-bit values beyond int64
 * - Hash consistency and debug rendering
 */

#include "adaptr/value/value.hpp"

#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <unordered_set>

using namespace adaptr;

int main() {
    std::cout << "=== Value Model Tests ===\n\n";

    // Test 1: Kinds and typed accessors
    {
        std::cout << "Test 1: Kinds and typed accessors\n";

        assert(Value{}.is_null());
        assert(Value(nullptr).kind() == ValueKind::Null);
        assert(Value(true).as_bool());
        assert(Value(42).as_int() == 42);
        assert(Value(std::uint8_t{200}).as_int() == 200);
        assert(Value(1.5).as_float() == 1.5);
        assert(Value(1.5f).is_float());
        assert(Value("ship").as_text() == "ship");
        assert(Value(Bytes{std::byte{1}, std::byte{2}}).as_bytes().size() == 2);
        assert(Value::array({1, 2, 3}).as_array().size() == 3);
        assert(Value::object({{"x", 1}}).as_object().find("x")->as_int() == 1);

        std::cout << "  PASS: Every kind constructs and reads back\n\n";
    }

    // Test 2: Accessor on the wrong kind
    {
        std::cout << "Test 2: Accessor on the wrong kind\n";

        bool threw = false;
        try {
            (void)Value("text").as_int();
        } catch (const SchemaMismatchError& e) {
            threw = true;
            assert(e.kind() == ErrorKind::SchemaMismatch);
            assert(std::string(e.what()).find("expected int, got text") != std::string::npos);
        }
        assert(threw);

        std::cout << "  PASS: Wrong kind raises SchemaMismatchError\n\n";
    }

    // Test 3: Unsigned values beyond int64
    {
        std::cout << "Test 3: Unsigned values beyond int64\n";

        const std::uint64_t max_ok = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
        assert(Value(max_ok).as_int() == std::numeric_limits<std::int64_t>::max());

        bool threw = false;
        try {
            Value too_big(max_ok + 1);
            (void)too_big;
        } catch (const RangeError&) {
            threw = true;
        }
        assert(threw);

        std::cout << "  PASS: 2^63 is rejected with RangeError\n\n";
    }

    // Test 4: Equality is strict
    {
        std::cout << "Test 4: Equality is strict\n";

        assert(Value(1) == Value(1));
        assert(!(Value(1) == Value(1.0)));            // int and float are different kinds
        assert(!(Value(true) == Value(1)));
        assert(Value() == Value(nullptr));

        const double nan = std::numeric_limits<double>::quiet_NaN();
        assert(Value(nan) == Value(nan));

        Value a = Value::object({{"x", 1}, {"y", 2}});
        Value b = Value::object({{"y", 2}, {"x", 1}});
        assert(!(a == b));                              // object order is part of the value
        assert(a == Value::object({{"x", 1}, {"y", 2}}));

        std::cout << "  PASS: NaN equals NaN, object order matters\n\n";
    }

    // Test 5: Object insertion order and overwrite
    {
        std::cout << "Test 5: Object insertion order and overwrite\n";

        Object obj;
        obj.insert_or_assign("b", 1);
        obj.insert_or_assign("a", 2);
        obj.insert_or_assign("b", 3);

        assert(obj.size() == 2);
        auto it = obj.begin();
        assert(it->first == "b" && it->second.as_int() == 3);
        ++it;
        assert(it->first == "a");
        assert(!obj.contains("c"));

        std::cout << "  PASS: Overwrite keeps the original position\n\n";
    }

    // Test 6: Hash consistent with equality
    {
        std::cout << "Test 6: Hash consistent with equality\n";

        Value a = Value::array({1, "two", Value::object({{"three", 3.0}})});
        Value b = Value::array({1, "two", Value::object({{"three", 3.0}})});
        assert(a == b);
        assert(hash_value(a) == hash_value(b));

        std::unordered_set<Value> set{a, b, Value(1)};
        assert(set.size() == 2);

        std::cout << "  PASS: Equal values hash alike\n\n";
    }

    // Test 7: Integer width checks
    {
        std::cout << "Test 7: Integer width checks\n";

        assert(int_fits(127, 8, true));
        assert(!int_fits(128, 8, true));
        assert(int_fits(-128, 8, true));
        assert(int_fits(255, 8, false));
        assert(!int_fits(-1, 8, false));
        assert(!int_fits(-1, 64, false));
        assert(int_fits(std::numeric_limits<std::int64_t>::min(), 64, true));

        std::cout << "  PASS: Signed and unsigned widths\n\n";
    }

    // Test 8: Debug rendering
    {
        std::cout << "Test 8: Debug rendering\n";

        Value v = Value::object({{"name", "Elvira"}, {"tags", Value::array({1, Value{}})}});
        std::string text = v.to_debug_string();
        std::cout << "  " << text << "\n";
        assert(text.find("\"name\"") != std::string::npos);
        assert(text.find("Elvira") != std::string::npos);
        assert(text.find("null") != std::string::npos);

        std::cout << "  PASS: Rendering names keys and values\n\n";
    }

    std::cout << "=== All Value Model Tests Passed! ===\n";
    std::cout << "✓ Kinds and accessors\n";
    std::cout << "✓ Range rejection\n";
    std::cout << "✓ Strict equality\n";
    std::cout << "✓ Hashing\n";

    return 0;
}
