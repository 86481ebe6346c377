#pragma once

#include <array>
#include <cassert>

constexpr int Q = 9;
const std::array<int, Q> cx = { 0, 1, 0, -1, 0, 1, -1, -1, 1 };
const std::array<int, Q> cy = { 0, 0, 1, 0, -1, 1, 1, -1, -1 };
const std::array<double, Q> w = {
    4.0/9.0,
    1.0/9.0, 1.0/9.0, 1.0/9.0, 1.0/9.0,
    1.0/36.0, 1.0/36.0, 1.0/36.0, 1.0/36.0
};
// Opposite directions for bounce-back
constexpr std::array<int, Q> opp = { 0, 3, 4, 1, 2, 7, 8, 5, 6 };

// Below this density a cell carries no momentum: u = (0,0)
constexpr double kDensityFloor = 1e-12;

// Inlet speed in lattice units. Keeps the scheme subsonic, the physical
// wind speed is restored only when the field is scaled at the end.
constexpr double kLatticeReferenceSpeed = 0.1;

// Smallest grid for which the edge copies and the periodic wrap are distinct
constexpr int kMinGridSize = 3;

//Overload function to recover the index (cells are validated in debug builds)
inline int INDEX(const int x, const int y, const int i, const int NX, const int NY) {
    assert(x >= 0 && x < NX && y >= 0 && y < NY && i >= 0 && i < Q);
    (void)NY;
    return i + Q * (x + NX * y);
}
inline int INDEX(const int x, const int y, const int NX, const int NY) {
    assert(x >= 0 && x < NX && y >= 0 && y < NY);
    (void)NY;
    return x + NX * y;
}

// Periodic wrap of a coordinate that is at most one lattice step outside [0, N)
inline int wrap(const int a, const int N) {
    return (a + N) % N;
}
