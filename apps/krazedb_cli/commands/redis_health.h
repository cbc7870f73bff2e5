#pragma once

// cmd_redis_health: PING the configured Redis server and report reachability.
int cmd_redis_health(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
