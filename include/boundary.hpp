#pragma once

#include "lattice.hpp"

#include <utility>

namespace boundary {

// Domain edge the wind enters through. Row 0 is the North edge.
enum class InletEdge {
    North,   // top row, y = 0
    East,    // rightmost column, x = NX-1
    South,   // bottom row, y = NY-1
    West     // leftmost column, x = 0
};

//──────────────────────────────────────────────────────────────────────────────
//  Edge facing the wind, from the meteorological bearing (half-open sectors):
//    [315,360) U [0,45) -> North
//    [45,135)           -> East
//    [135,225)          -> South
//    [225,315)          -> West
//──────────────────────────────────────────────────────────────────────────────
InletEdge SelectInletEdge(const double direction_deg);

//──────────────────────────────────────────────────────────────────────────────
//  Inlet velocity in lattice units:
//    theta = rad(90 - direction_deg),  (u0, v0) = 0.1 * (cos theta, sin theta)
//──────────────────────────────────────────────────────────────────────────────
std::pair<double, double> InletVelocity(const double direction_deg);

//──────────────────────────────────────────────────────────────────────────────
//  Bounce-back on solid cells (no-slip wall):
//    swap f_1<->f_3, f_2<->f_4, f_5<->f_7, f_6<->f_8, f_0 untouched
//──────────────────────────────────────────────────────────────────────────────
void ApplyBounceBack(LatticeGrid& lattice, const ObstacleMask& mask);

//──────────────────────────────────────────────────────────────────────────────
//  Zero-gradient outflow on all four edges (all 9 directions):
//    row 1 -> row 0, row NY-2 -> row NY-1, then
//    column 1 -> column 0, column NX-2 -> column NX-1
//──────────────────────────────────────────────────────────────────────────────
void ApplyOutflow(LatticeGrid& lattice);

// Force the velocity of one full edge to (u0, v0)
void ApplyInflow(LatticeGrid& lattice, const InletEdge edge, const double u0, const double v0);

} // namespace boundary
