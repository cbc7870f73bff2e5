#pragma once

// cmd_add: add the domains listed in --file to the selected collection.
int cmd_add(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
