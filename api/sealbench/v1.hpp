#pragma once

#include "sealbench/v1/cache.pb.h"
#include "sealbench/v1/prodbench.pb.h"
#include "sealbench/v1/report.pb.h"
