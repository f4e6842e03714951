#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

#define KVORM_LOG_TAG "kvorm"

// Shared library logger, created on first use with a colour stdout sink
std::shared_ptr<spdlog::logger> ormLogger();

// Returns false when the name is not a spdlog level ("trace" .. "off")
bool parseLogLevel(const std::string &name, spdlog::level::level_enum &out);
