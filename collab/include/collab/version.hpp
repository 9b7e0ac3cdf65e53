#pragma once

#define COLLAB_VERSION "0.4.0"
#define COLLAB_MCP_PROTOCOL_VERSION "2024-11-05"
