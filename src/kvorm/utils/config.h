#pragma once

#include <ArduinoJson.h>

#include <string>

#include "dbTypes.h"

// Rejects an empty namespace, one containing ':' and unknown log levels
DbStatus validateConfig(const OrmConfig &cfg);

// Missing keys keep their defaults
DbResult<OrmConfig> configFromJson(JsonVariantConst json);
JsonDocument configToJson(const OrmConfig &cfg);
DbResult<OrmConfig> loadConfigFile(const std::string &path);
