#pragma once

#include "lattice.hpp"

namespace streaming {

//──────────────────────────────────────────────────────────────────────────────
//  Streaming with PERIODIC addressing (pull form):
//    f_i(x, y, t+1) = f_i((x - c_ix) mod NX, (y - c_iy) mod NY, t)
//  Reads only the current slot, writes only the staging slot, then swaps.
//  The wrap is a convenience: the domain edges are rewritten right after by
//  the boundary step.
//──────────────────────────────────────────────────────────────────────────────
void StreamPeriodic(LatticeGrid& lattice);

}  // namespace streaming
