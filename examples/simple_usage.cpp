#include "adaptr/adaptr.hpp"
#include <iostream>

using namespace adaptr;

enum class Rig { Sloop, Ketch, Schooner };

struct CrewMember {
    std::string name;
    rfl::DefaultVal<std::int32_t> rank = 1;
};

struct Ship {
    std::string name;
    std::optional<Date> build_on;
    Rig rig;
    std::vector<CrewMember> crew;
    std::map<std::string, Timestamp> log;
};

int main() {
    std::cout << "adaptr Simple Usage Examples\n";
    std::cout << "============================\n\n";

    Ship elvira;
    elvira.name = "Elvira";
    elvira.build_on = std::chrono::year{1970} / 12 / 31;
    elvira.rig = Rig::Ketch;
    elvira.crew.push_back({"Ada", 3});
    elvira.crew.push_back({"Bo", 1});
    elvira.log["departed"] = *parse_timestamp("2021-03-04T05:06:07.089Z");

    // ========================================================================
    // Example 1: Dump / load with the default adapter
    // ========================================================================

    std::cout << "=== Example 1: JSON ===\n\n";

    Bytes json = dump(elvira, "json");
    std::cout << "  " << as_text(json) << "\n";

    Ship loaded = load<Ship>(json, "json");
    std::cout << "  Loaded " << loaded.name << " with " << loaded.crew.size() << " crew\n\n";

    // ========================================================================
    // Example 2: The same object in every format
    // ========================================================================

    std::cout << "=== Example 2: Formats ===\n\n";

    for (const char* format : {"json", "binary"}) {
        Bytes data = dump(elvira, format);
        std::cout << "  " << format << ": " << data.size() << " bytes\n";
    }

    // CSV holds flat records only
    std::vector<CrewMember> crew = elvira.crew;
    std::cout << "  csv:\n" << as_text(dump_many(crew, "csv")) << "\n";

    // ========================================================================
    // Example 3: Intermediate values
    // ========================================================================

    std::cout << "=== Example 3: Intermediate values ===\n\n";

    Value value = to_intermediate(elvira);
    std::cout << "  " << value.to_debug_string() << "\n\n";

    // Fields with defaults may be omitted
    auto member = from_intermediate<CrewMember>(Value::object({{"name", "Cy"}}));
    std::cout << "  " << member.name << " has rank " << member.rank.value() << "\n\n";

    // ========================================================================
    // Example 4: Schemas
    // ========================================================================

    std::cout << "=== Example 4: Schema ===\n\n";

    auto schema = default_adapter().schema_for<Ship>();
    std::cout << "  " << schema->to_string() << "\n";
    std::cout << "  " << to_json(*schema) << "\n\n";

    // ========================================================================
    // Example 5: Errors
    // ========================================================================

    std::cout << "=== Example 5: Errors ===\n\n";

    try {
        (void)load<Ship>(to_bytes(R"({"name":"Nameless"})"), "json");
    } catch (const SchemaMismatchError& e) {
        std::cout << "  " << to_string(e.kind()) << ": " << e.what() << "\n";
    }

    try {
        (void)dump(elvira, "xml");
    } catch (const UnknownFormatError& e) {
        std::cout << "  " << to_string(e.kind()) << ": " << e.what() << "\n";
    }

    std::cout << "\nDone.\n";
    return 0;
}
