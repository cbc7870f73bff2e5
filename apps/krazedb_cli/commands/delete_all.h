#pragma once

// cmd_delete_all: delete every domain in the collection after confirmation (--confirm skips
// the interactive prompt).
int cmd_delete_all(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
