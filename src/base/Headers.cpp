#include "Headers.hpp"

namespace cm {
volatile sig_atomic_t interruptRequested = 0;
}  // namespace cm
