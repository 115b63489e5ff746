// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - Chart Store                                                       ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "chart_store.hpp"

namespace chartdb::store {

template class JsonStore<model::ChartRecord, model::ChartPatch>;

} // namespace chartdb::store
