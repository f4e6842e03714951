#pragma once

#include "orm.h"
#include "query/evaluator.h"
#include "repository/fsRepository.h"
#include "repository/memoryRepository.h"
#include "utils/config.h"
#include "utils/objectId.h"
