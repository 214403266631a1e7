#pragma once

/*
===============================================================================
printlink — Public API Entry Point
===============================================================================

Receipt-printer link over BLE: connection lifecycle, chunked and batched
delivery, prioritised command queue, adaptive flow control, health
monitoring and power management.

The entry point is printlink::core::Manager, parameterized by an adapter
backend (adapter::AdapterConcept) and a clock. adapter::sim::Peripheral is
the in-memory backend shipped with the library.
===============================================================================
*/

#include <printlink/core/manager.hpp>
#include <printlink/core/adapter/sim/peripheral.hpp>
