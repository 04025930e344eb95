#pragma once
#include "error.hpp"
#include "chart_data.hpp"
#include "io/sm_io.hpp"
#include "io/timing_json_io.hpp"
#include "util/timing_utils.hpp"
#include "util/score_utils.hpp"
#include "timing/timing_data.hpp"
#include "score/offset_data.hpp"
