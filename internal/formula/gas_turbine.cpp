#include "gas_turbine.hpp"

namespace normbalance::formula {

GasTurbineFuel GasTurbineNetFuel(double kwh, const model::AssetCoefficients& coefficients) {
  GasTurbineFuel fuel;
  if (kwh <= 0.0) {
    return fuel;
  }

  fuel.gross_mmbtu      = kwh * coefficients.heat_rate * kKcalToBtu / kBtuPerMmbtu;
  fuel.free_steam_mmbtu = kwh * coefficients.free_steam_factor * kFreeSteamEnergy * kKcalToBtu / kBtuPerMmbtu;
  fuel.net_mmbtu        = fuel.gross_mmbtu - fuel.free_steam_mmbtu;
  fuel.norm             = fuel.net_mmbtu / kwh;
  return fuel;
}

} // namespace normbalance::formula
