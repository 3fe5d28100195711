#ifndef CLEARCUBE_TIMEFILTER_H
#define CLEARCUBE_TIMEFILTER_H

#include <vector>

#include <clearcube/GeoData.h>
#include <clearcube/GeoMask.h>

namespace clearcube {

	//! Time steps retained by a good-data threshold
	/*!
		The retained indices are the join key used to restrict every array
		sharing the time axis (RasterCube::SelectTimes, GeoArray::SelectTimes,
		GeoMask::SelectTimes), so the same time steps are dropped everywhere.
	*/
	class TimeSelection {
	public:
		TimeSelection() : _Threshold(0) {}
		TimeSelection(const TimeAxis& times, const std::vector<double>& fractions, double threshold);

		//! Retained time indices, in original order
		const std::vector<unsigned int>& Indices() const { return _Indices; }
		//! Keep flag for every time step
		const std::vector<bool>& Keep() const { return _Keep; }
		//! Good fraction of every time step
		const std::vector<double>& Fractions() const { return _Fractions; }
		//! Timestamps of retained time steps
		TimeAxis Times() const;
		//! Threshold applied
		double Threshold() const { return _Threshold; }
		//! Number of retained time steps
		unsigned int NumRetained() const { return _Indices.size(); }
		//! Number of time steps before filtering
		unsigned int NumTotal() const { return _Keep.size(); }

	private:
		TimeAxis _Times;
		std::vector<double> _Fractions;
		std::vector<bool> _Keep;
		std::vector<unsigned int> _Indices;
		double _Threshold;
	};

	//! Keep time steps where the fraction of true pixels (over all pixels) is at least tau
	TimeSelection FilterTimes(const GeoMask& mask, double tau);

	//! Keep time steps where the fraction of true pixels among valid pixels is at least tau
	TimeSelection FilterTimes(const GeoMask& mask, double tau, const GeoMask& valid);

	//! Number of true pixels in every layer of a mask
	std::vector<unsigned long> CountTrue(const GeoMask& mask);

} // namespace clearcube

#endif
