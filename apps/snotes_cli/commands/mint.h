#pragma once

// cmd_mint: print tokens from a fresh Snowflake generator (--worker-id, --count)
int cmd_mint(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
