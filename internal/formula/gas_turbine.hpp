#pragma once

#include "internal/model/period_inputs.hpp"

namespace normbalance::formula {

inline constexpr char kGasTurbineNetFuel[] = "gas_turbine_net_fuel";

constexpr double kKcalToBtu   = 3.96567;
constexpr double kBtuPerMmbtu = 1'000'000.0;

// kcal/kg
constexpr double kShpEnthalpy       = 810.0;
constexpr double kHrsgInletEnthalpy = 110.0;
constexpr double kHrsgEfficiency    = 0.92;

// (kShpEnthalpy - kHrsgInletEnthalpy) / kHrsgEfficiency, rounded as published in the heat balance.
constexpr double kFreeSteamEnergy = 760.87;

struct GasTurbineFuel {
  double gross_mmbtu      = 0.0;
  double free_steam_mmbtu = 0.0;
  double net_mmbtu        = 0.0;

  // MMBTU per kWh
  double norm = 0.0;
};

/*
  Natural gas needed by a gas turbine net of the heat recovered as free steam
  in its HRSG:

    gross = kWh * heat_rate * kKcalToBtu / 1e6
    free  = kWh * free_steam_factor * kFreeSteamEnergy * kKcalToBtu / 1e6
    net   = gross - free

  Zero generation yields an all-zero result.
*/
GasTurbineFuel GasTurbineNetFuel(double kwh, const model::AssetCoefficients& coefficients);

} // namespace normbalance::formula
