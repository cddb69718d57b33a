#include "common/errors.hpp"

#include "common/types.hpp"

namespace fleet {

CapacityExceededError::CapacityExceededError(const std::string& unit_id, double amount_kg, double capacity_kg)
    : FleetError("Load of " + FormatFixed(amount_kg, 2) + " kg exceeds capacity of unit " + unit_id +
                 " (" + FormatFixed(capacity_kg, 2) + " kg)"),
      amount_kg_(amount_kg),
      capacity_kg_(capacity_kg) {}

} // namespace fleet
