#include "duolock/gate.hpp"

constinit duo::AtomicGate duo::detail::gGlobalGate;
