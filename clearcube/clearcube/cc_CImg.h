#ifndef CLEARCUBE_CIMG_H
#define CLEARCUBE_CIMG_H

#define cimg_verbosity 1
#define cimg_display 0

#include <CImg.h>

#include <cmath>
#include <iostream>
#include <string>

namespace clearcube {

    using cimg_library::CImg;

    //! Print min/max/mean/stddev of an image, NaNs included as CImg computes them
    template<typename T> inline void cimg_printstats(const CImg<T>& img, std::string note="") {
        if (note != "") std::cout << note << "  ";
        CImg<double> stats = img.get_stats();
        std::cout << "Min/Max = " << stats(0) << ", " << stats(1)
            << " Mean/StdDev = " << stats(2) << " +/- " << std::sqrt(stats(3))
            << " NumPixels = " << img.size() << std::endl;
    }

} // namespace clearcube

#endif
