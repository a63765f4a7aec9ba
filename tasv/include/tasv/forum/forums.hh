#pragma once

#include <cstdint>

namespace tasv::forum {

// Forums that the submission workflow moves discussion topics between
constexpr uint64_t WORKBENCH_FORUM_ID = 7;
constexpr uint64_t GRUE_FOOD_FORUM_ID = 24;
constexpr uint64_t PLAYGROUND_FORUM_ID = 96;

} // namespace tasv::forum
