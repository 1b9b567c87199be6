/**
 * @file plugin.hpp
 * @brief Bundles of converters, hooks and codecs installed into an Adapter
 *
 * Plugins are installed explicitly by the host application; there is no
 * discovery. Installing two plugins with the same name into one Adapter is
 * rejected.
 *
 * Example:
 * @code
 * class MoneyPlugin : public adaptr::Plugin {
 * public:
 *     std::string name() const override { return "acme.money"; }
 *     void install(adaptr::Adapter& adapter) const override {
 *         adapter.register_converter<Money>(money_converter());
 *     }
 * };
 *
 * adaptr::default_adapter().install(MoneyPlugin{});
 * @endcode
 */

#pragma once

#include <string>

namespace adaptr {

class Adapter;

class Plugin {
public:
    virtual ~Plugin() = default;

    [[nodiscard]] virtual std::string name() const = 0;
    virtual void install(Adapter& adapter) const = 0;
};

/// Kind-level converters for every supported kind ("adaptr.builtin")
class BuiltinConvertersPlugin : public Plugin {
public:
    [[nodiscard]] std::string name() const override { return "adaptr.builtin"; }
    void install(Adapter& adapter) const override;
};

/// The "binary" codec ("adaptr.binary")
class BinaryPlugin : public Plugin {
public:
    [[nodiscard]] std::string name() const override { return "adaptr.binary"; }
    void install(Adapter& adapter) const override;
};

/// The "json" codec ("adaptr.json")
class JsonPlugin : public Plugin {
public:
    [[nodiscard]] std::string name() const override { return "adaptr.json"; }
    void install(Adapter& adapter) const override;
};

/// The "csv" codec ("adaptr.csv")
class CsvPlugin : public Plugin {
public:
    [[nodiscard]] std::string name() const override { return "adaptr.csv"; }
    void install(Adapter& adapter) const override;
};

} // namespace adaptr
