#include "apex/distance.h"

#include <cmath>

#include "apex/ride_config.h"

static double toRadians(double degrees) {
  return degrees * M_PI / 180.0;
}

double haversineKm(const Coordinate& from, const Coordinate& to) {
  const double dLat = toRadians(to.latitude - from.latitude);
  const double dLon = toRadians(to.longitude - from.longitude);

  const double a = std::sin(dLat / 2) * std::sin(dLat / 2) +
                   std::cos(toRadians(from.latitude)) * std::cos(toRadians(to.latitude)) *
                   std::sin(dLon / 2) * std::sin(dLon / 2);
  const double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
  return EARTH_RADIUS_KM * c;
}

double routeDistanceKm(const std::vector<Coordinate>& coords) {
  double total = 0.0;
  for (size_t i = 1; i < coords.size(); ++i) {
    total += haversineKm(coords[i - 1], coords[i]);
  }
  return total;
}

double roundTo(double value, int decimals) {
  const double scale = std::pow(10.0, decimals);
  return std::round(value * scale) / scale;
}
