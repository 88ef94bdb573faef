// Umbrella header: the whole public API.
#pragma once

#include "benchkit/aggregator.h"
#include "benchkit/artifact.h"
#include "benchkit/errors.h"
#include "benchkit/executor.h"
#include "benchkit/instance.h"
#include "benchkit/log.h"
#include "benchkit/metric.h"
#include "benchkit/registry.h"
#include "benchkit/spec.h"
#include "benchkit/stage.h"
#include "benchkit/stats.h"
#include "benchkit/types.h"
