#include "streaming.hpp"

namespace streaming {

void StreamPeriodic(LatticeGrid& lattice) {
    const int NX = lattice.nx();
    const int NY = lattice.ny();
    const std::vector<double>& f = lattice.current();
    std::vector<double>& f_str = lattice.staging();

    #pragma omp parallel for collapse(2) schedule(static)
    for (int y = 0; y < NY; ++y) {
        for (int x = 0; x < NX; ++x) {
            for (int i = 0; i < Q; ++i) {
                const int x_src = wrap(x - cx[i], NX);
                const int y_src = wrap(y - cy[i], NY);

                f_str[INDEX(x, y, i, NX, NY)] = f[INDEX(x_src, y_src, i, NX, NY)];
            }
        }
    }

    lattice.Swap();
}

}  // namespace streaming
