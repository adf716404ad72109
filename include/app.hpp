#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"

// word pool used by the console driver when no content is loaded
std::vector<LabeledCell> DemoWordPool();

// interactive prompt loop, one command or field per line; returns when the user
// quits or input ends
void runApp(std::istream& in, std::ostream& out);
