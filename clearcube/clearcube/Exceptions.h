#ifndef CLEARCUBE_EXCEPTIONS_H
#define CLEARCUBE_EXCEPTIONS_H

#include <stdexcept>
#include <string>
#include <sstream>

namespace clearcube {

    //! Base class of all clearcube errors
    class Error : public std::runtime_error {
    public:
        explicit Error(const std::string& msg) : std::runtime_error(msg) {}
    };

    //! A requested quality label is not part of the dataset's enumeration
    class UnknownCategoryError : public Error {
    public:
        explicit UnknownCategoryError(const std::string& label, const std::string& scheme)
            : Error("unknown quality category '" + label + "' for scheme " + scheme), _Label(label) {}
        std::string Label() const { return _Label; }
    private:
        std::string _Label;
    };

    //! Polygon selection resolved to no geometry
    class EmptyGeometryError : public Error {
    public:
        explicit EmptyGeometryError(const std::string& source)
            : Error("no polygons selected from " + source) {}
    };

    //! Two arrays expected to share {time, y, x} do not
    class ShapeMismatchError : public Error {
    public:
        explicit ShapeMismatchError(const std::string& msg) : Error("shape mismatch: " + msg) {}
    };

    //! Good-data threshold removed every time step
    class AllTimeStepsDroppedError : public Error {
    public:
        AllTimeStepsDroppedError(unsigned int total, double threshold)
            : Error(AllTimeStepsDroppedError::Message(total, threshold)) {}
    private:
        static std::string Message(unsigned int total, double threshold) {
            std::stringstream msg;
            msg << "all " << total << " time steps dropped with good-data threshold " << threshold;
            return msg.str();
        }
    };

} // namespace clearcube

#endif
