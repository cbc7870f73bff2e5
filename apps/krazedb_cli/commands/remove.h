#pragma once

// cmd_remove: remove the domains listed in --file, or the single --domain.
int cmd_remove(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
