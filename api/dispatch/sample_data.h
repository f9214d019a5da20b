#pragma once

#include "tool_dispatcher.h"

namespace dispatch {

// Creates the demo tables (users, products, orders, reviews, inventory), loads
// their rows and runs a few representative reads so the analyzers have
// history. Goes through Invoke like any other caller. Returns the number of
// create/put calls that failed.
int SeedSampleData(ToolDispatcher& dispatcher);

}  // namespace dispatch
