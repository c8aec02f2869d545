#pragma once

#include "../tool-registry.h"

namespace crew {

class host_session;

// Parent agent's own default capabilities
tool_def make_read_tool();
tool_def make_ls_tool();

// Register every host tool on the session (all active)
void register_host_tools(host_session& host);

} // namespace crew
