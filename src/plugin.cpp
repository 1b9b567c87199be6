#include "adaptr/plugin/plugin.hpp"

#include "adaptr/adapter.hpp"
#include "adaptr/codec/binary_codec.hpp"
#include "adaptr/codec/csv_codec.hpp"
#include "adaptr/codec/json_codec.hpp"
#include "adaptr/registry/builtin_converters.hpp"

namespace adaptr {

void BuiltinConvertersPlugin::install(Adapter& adapter) const {
    install_builtin_converters(adapter.converters());
    adapter.invalidate_caches();
}

void BinaryPlugin::install(Adapter& adapter) const {
    adapter.register_codec(std::make_shared<BinaryCodec>());
}

void JsonPlugin::install(Adapter& adapter) const {
    adapter.register_codec(std::make_shared<JsonCodec>());
}

void CsvPlugin::install(Adapter& adapter) const {
    adapter.register_codec(std::make_shared<CsvCodec>());
}

} // namespace adaptr
