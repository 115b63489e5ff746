// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - Chart Store                                                       ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "internal/model/chart.hpp"
#include "internal/store/json_store.hpp"

namespace chartdb::store {

using ChartStore = JsonStore<model::ChartRecord, model::ChartPatch>;

extern template class JsonStore<model::ChartRecord, model::ChartPatch>;

} // namespace chartdb::store
