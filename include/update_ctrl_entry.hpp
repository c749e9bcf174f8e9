#pragma once

#include "steps/step_registry.hpp"

namespace updatectrl {

// Every step the tool knows about, in run order.
steps::StepRegistry make_default_registry();

} // namespace updatectrl

int RunUpdateCtrlApplication(int argc, char *argv[]);
