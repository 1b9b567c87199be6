/**
 * @file test_hooks.cpp
 * @brief Hook ordering, policies and their effect on conversion
 *
 * Validates:
 * - Ascending order, ties by registration sequence
 * - FirstSuccess stops at the first definite result
 * - Chained threads each result into the next implementation
 * - not_applicable() is skipped, exceptions propagate unchanged
 * - ToIntermediate / FromIntermediate / SelectCodec through the Adapter
 */

#include "adaptr/adapter.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace adaptr;

struct Account {
    std::string user;
    std::string password;
};

using ToHook = HookFn<HookPoint::ToIntermediate>;

ToHook append(std::string suffix, std::vector<std::string>* trace = nullptr) {
    return [suffix, trace](const TypeDescriptor&, const Value* partial) -> HookResult<Value> {
        if (trace) trace->push_back(suffix);
        std::string base = partial && partial->is_text() ? partial->as_text() : std::string();
        return Value(base + suffix);
    };
}

int main() {
    std::cout << "=== Hook Registry Tests ===\n\n";

    // Test 1: Ordering
    {
        std::cout << "Test 1: Ordering\n";

        HookRegistry hooks;
        std::vector<std::string> trace;
        hooks.register_hook<HookPoint::ToIntermediate>("late", append("c", &trace), 10);
        hooks.register_hook<HookPoint::ToIntermediate>("early", append("a", &trace), -5);
        hooks.register_hook<HookPoint::ToIntermediate>("middle-1", append("b1", &trace), 0);
        hooks.register_hook<HookPoint::ToIntermediate>("middle-2", append("b2", &trace), 0);

        auto result = hooks.invoke<HookPoint::ToIntermediate>(*TypeDescriptor::text());
        assert(result.has_value());
        assert(result->as_text() == "ab1b2c");
        assert((trace == std::vector<std::string>{"a", "b1", "b2", "c"}));
        assert(hooks.size<HookPoint::ToIntermediate>() == 4);

        std::cout << "  PASS: Ascending order, ties in registration order\n\n";
    }

    // Test 2: Chained policy with a seed
    {
        std::cout << "Test 2: Chained policy with a seed\n";

        HookRegistry hooks;
        assert(hooks.policy(HookPoint::ToIntermediate) == HookPolicy::Chained);
        hooks.register_hook<HookPoint::ToIntermediate>("x", append("x"));
        hooks.register_hook<HookPoint::ToIntermediate>("skip",
            [](const TypeDescriptor&, const Value*) { return HookResult<Value>::not_applicable(); });
        hooks.register_hook<HookPoint::ToIntermediate>("y", append("y"));

        Value seed("seed-");
        auto result = hooks.invoke<HookPoint::ToIntermediate>(*TypeDescriptor::text(), &seed);
        assert(result->as_text() == "seed-xy");

        std::cout << "  PASS: Each result feeds the next, not_applicable is skipped\n\n";
    }

    // Test 3: FirstSuccess policy
    {
        std::cout << "Test 3: FirstSuccess policy\n";

        HookRegistry hooks;
        std::vector<std::string> trace;
        hooks.set_policy(HookPoint::ToIntermediate, HookPolicy::FirstSuccess);
        hooks.register_hook<HookPoint::ToIntermediate>("skip",
            [&](const TypeDescriptor&, const Value*) {
                trace.push_back("skip");
                return HookResult<Value>::not_applicable();
            });
        hooks.register_hook<HookPoint::ToIntermediate>("first", append("1", &trace));
        hooks.register_hook<HookPoint::ToIntermediate>("second", append("2", &trace));

        auto result = hooks.invoke<HookPoint::ToIntermediate>(*TypeDescriptor::text());
        assert(result->as_text() == "1");
        assert((trace == std::vector<std::string>{"skip", "1"}));

        std::cout << "  PASS: Stops at the first definite result\n\n";
    }

    // Test 4: Nothing applicable
    {
        std::cout << "Test 4: Nothing applicable\n";

        HookRegistry hooks;
        assert(!hooks.invoke<HookPoint::DeriveSchema>(*TypeDescriptor::text()).has_value());

        hooks.register_hook<HookPoint::DeriveSchema>("never",
            [](const TypeDescriptor&, const SchemaPtr*) { return HookResult<SchemaPtr>::not_applicable(); });
        assert(!hooks.invoke<HookPoint::DeriveSchema>(*TypeDescriptor::text()).has_value());

        std::cout << "  PASS: std::nullopt when no implementation answers\n\n";
    }

    // Test 5: Exceptions propagate
    {
        std::cout << "Test 5: Exceptions propagate\n";

        HookRegistry hooks;
        bool later_ran = false;
        hooks.register_hook<HookPoint::ToIntermediate>("boom",
            [](const TypeDescriptor&, const Value*) -> HookResult<Value> {
                throw RangeError("hook refused the value");
            });
        hooks.register_hook<HookPoint::ToIntermediate>("after",
            [&](const TypeDescriptor&, const Value*) -> HookResult<Value> {
                later_ran = true;
                return Value{};
            }, 1);

        bool threw = false;
        try {
            (void)hooks.invoke<HookPoint::ToIntermediate>(*TypeDescriptor::text());
        } catch (const RangeError& e) {
            threw = true;
            assert(std::string(e.what()) == "hook refused the value");
        }
        assert(threw);
        assert(!later_ran);

        std::cout << "  PASS: Error aborts the chain unchanged\n\n";
    }

    // Test 6: Registration bookkeeping
    {
        std::cout << "Test 6: Registration bookkeeping\n";

        HookRegistry hooks;
        auto before = hooks.generation();
        hooks.register_hook<HookPoint::ToIntermediate>("x", append("x"));
        assert(hooks.generation() > before);

        bool duplicate = false;
        try {
            hooks.register_hook<HookPoint::ToIntermediate>("x", append("again"));
        } catch (const std::invalid_argument&) {
            duplicate = true;
        }
        assert(duplicate);

        // Names are per point
        hooks.register_hook<HookPoint::FromIntermediate>("x", append("x"));

        assert(hooks.unregister_hook<HookPoint::ToIntermediate>("x"));
        assert(!hooks.unregister_hook<HookPoint::ToIntermediate>("x"));
        assert(hooks.empty<HookPoint::ToIntermediate>());
        assert(!hooks.empty<HookPoint::FromIntermediate>());

        std::cout << "  PASS: Duplicate names rejected, unregister reports removal\n\n";
    }

    // Test 7: Hook point names
    {
        std::cout << "Test 7: Hook point names\n";

        assert(parse_hook_point("resolve_type") == HookPoint::ResolveType);
        assert(parse_hook_point("to_intermediate") == HookPoint::ToIntermediate);
        assert(parse_hook_point("from_intermediate") == HookPoint::FromIntermediate);
        assert(parse_hook_point("select_codec") == HookPoint::SelectCodec);
        assert(parse_hook_point("derive_schema") == HookPoint::DeriveSchema);
        assert(!parse_hook_point("before_dump").has_value());

        assert(default_policy(HookPoint::ResolveType) == HookPolicy::FirstSuccess);
        assert(default_policy(HookPoint::FromIntermediate) == HookPolicy::Chained);

        std::cout << "  PASS: Round trip through to_string\n\n";
    }

    // Test 8: ToIntermediate / FromIntermediate through the Adapter
    {
        std::cout << "Test 8: ToIntermediate / FromIntermediate through the Adapter\n";

        Adapter adapter;
        adapter.register_hook<HookPoint::ToIntermediate>("redact",
            [](const TypeDescriptor& type, const Value* partial) -> HookResult<Value> {
                if (type.name() != "Account" || !partial) {
                    return HookResult<Value>::not_applicable();
                }
                Object redacted = partial->as_object();
                redacted.insert_or_assign("password", "***");
                return Value(std::move(redacted));
            });
        adapter.register_hook<HookPoint::FromIntermediate>("trim",
            [](const TypeDescriptor& type, const Value* partial) -> HookResult<Value> {
                if (type.kind() != Kind::Text || !partial || !partial->is_text()) {
                    return HookResult<Value>::not_applicable();
                }
                std::string text = partial->as_text();
                while (!text.empty() && text.back() == ' ') text.pop_back();
                return Value(text);
            });

        Value v = adapter.to_intermediate(Account{"ada", "secret"});
        assert(v == Value::object({{"user", "ada"}, {"password", "***"}}));

        Account loaded = adapter.from_intermediate<Account>(Value::object({{"user", "ada  "}, {"password", "pw "}}));
        assert(loaded.user == "ada");
        assert(loaded.password == "pw");

        std::cout << "  PASS: Hooks rewrite values at every level\n\n";
    }

    // Test 9: SelectCodec
    {
        std::cout << "Test 9: SelectCodec\n";

        Adapter adapter;
        assert(adapter.codec("JSON")->name() == "json");
        assert(adapter.codec("Binary")->name() == "binary");

        // An alias answered by a hook in front of the built-in codecs
        adapter.register_hook<HookPoint::SelectCodec>("ndjson-alias",
            [&adapter](const std::string& format, const CodecPtr*) -> HookResult<CodecPtr> {
                if (format != "ndjson") {
                    return HookResult<CodecPtr>::not_applicable();
                }
                return adapter.codec("json");
            }, -1);
        assert(adapter.codec("ndjson")->name() == "json");

        bool threw = false;
        try {
            (void)adapter.codec("xml");
        } catch (const UnknownFormatError& e) {
            threw = true;
            assert(e.kind() == ErrorKind::UnknownFormat);
            assert(std::string(e.what()) == "'xml' serialization format not supported");
        }
        assert(threw);

        std::cout << "  PASS: Case-insensitive names, aliases, unknown formats\n\n";
    }

    std::cout << "=== All Hook Registry Tests Passed! ===\n";
    std::cout << "✓ Ordering\n";
    std::cout << "✓ FirstSuccess and Chained policies\n";
    std::cout << "✓ Error propagation\n";
    std::cout << "✓ Adapter integration\n";

    return 0;
}
