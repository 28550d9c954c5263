/**
 * @file dispatcher.cpp
 * @brief Explicit instantiations of the dispatcher template
 *
 * Dispatcher logic lives in the header template.
 */

#include <cpe/engine/dispatcher.hpp>

namespace cpe {

// 64K capacity (CLI default)
template class Dispatcher<65536>;

// 4K capacity
template class Dispatcher<4096>;

} // namespace cpe
