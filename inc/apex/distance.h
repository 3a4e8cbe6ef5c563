// Copyright 2025 <Apex Telemetry>
#ifndef INC_APEX_DISTANCE_H_
#define INC_APEX_DISTANCE_H_

#include <vector>

#include "apex/structs.h"

/**
 * Great-circle distance between two coordinates in kilometers.
 * Haversine formula on a spherical earth (EARTH_RADIUS_KM).
 *
 * @return finite, non-negative distance for finite inputs
 */
double haversineKm(const Coordinate& from, const Coordinate& to);

/** Sum of consecutive pairwise distances over the whole route. */
double routeDistanceKm(const std::vector<Coordinate>& coords);

/** Round to a fixed number of decimals (persistence formatting). */
double roundTo(double value, int decimals);

#endif  // INC_APEX_DISTANCE_H_
