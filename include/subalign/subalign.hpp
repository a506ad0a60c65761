#pragma once

// Umbrella header: includes the whole alignment engine

#include "subalign/config.hpp"
#include "subalign/dtw.hpp"
#include "subalign/embedding.hpp"
#include "subalign/errors.hpp"
#include "subalign/extended_cut.hpp"
#include "subalign/merger.hpp"
#include "subalign/newline.hpp"
#include "subalign/non_overlap.hpp"
#include "subalign/progress.hpp"
#include "subalign/refiner.hpp"
#include "subalign/tokenizer.hpp"
#include "subalign/track.hpp"
#include "subalign/types.hpp"
#include "subalign/workspace.hpp"
