#ifndef CLEARCUBE_TEMPORALSTATS_H
#define CLEARCUBE_TEMPORALSTATS_H

#include <string>
#include <vector>
#include <iostream>

#include <clearcube/cc_CImg.h>
#include <clearcube/GeoData.h>
#include <clearcube/GeoArray.h>
#include <clearcube/GeoMask.h>

namespace clearcube {

	//! One value per time step
	class TimeSeries {
	public:
		TimeSeries() {}
		TimeSeries(const TimeAxis& times, const std::vector<double>& values, std::string name="");

		unsigned int Size() const { return _Values.size(); }
		const TimeAxis& Times() const { return _Times; }
		const std::vector<double>& Values() const { return _Values; }
		double operator[](unsigned int i) const { return _Values[i]; }
		std::string Name() const { return _Name; }
		TimeSeries& SetName(std::string name) { _Name = name; return *this; }

		//! CSV with a time column and a value column
		friend std::ostream& operator<<(std::ostream&, const TimeSeries&);

	private:
		TimeAxis _Times;
		std::vector<double> _Values;
		std::string _Name;
	};

	//! NaN-skipping count and mean of an array over space, per time step
	class SpatialStats {
	public:
		//! Statistics over all pixels
		explicit SpatialStats(const GeoArray& array);
		//! Statistics over pixels where region is true
		SpatialStats(const GeoArray& array, const GeoMask& region);

		const TimeAxis& Times() const { return _Times; }
		//! Number of non-missing pixels at each time step
		const std::vector<unsigned long>& Count() const { return _Count; }
		//! Mean of non-missing pixels at each time step, NaN if there are none
		const std::vector<double>& Mean() const { return _Mean; }
		TimeSeries CountSeries() const;
		TimeSeries MeanSeries() const;

	private:
		TimeAxis _Times;
		std::string _Name;
		std::vector<unsigned long> _Count;
		std::vector<double> _Mean;

		void Compute(const GeoArray& array, const GeoMask* region);
	};

	//! Centered rolling median over window samples (odd), NaN unless at least minperiods samples are present
	std::vector<double> RollingMedian(const std::vector<double>& values, int window, int minperiods);
	//! Centered rolling median of a time series
	TimeSeries RollingMedian(const TimeSeries& series, int window, int minperiods);

	//! NaN-skipping mean over space per time step
	TimeSeries SpatialMean(const GeoArray& array);
	TimeSeries SpatialMean(const GeoArray& array, const GeoMask& region);
	//! Number of true pixels per time step
	TimeSeries SpatialCount(const GeoMask& mask);
	TimeSeries SpatialCount(const GeoMask& mask, const GeoMask& region);
	//! Area of true pixels per time step, in projection units
	TimeSeries AreaSeries(const GeoMask& mask);
	TimeSeries AreaSeries(const GeoMask& mask, const GeoMask& region);

	//! Number of true values across time, per pixel
	CImg<unsigned int> TemporalCount(const GeoMask& mask);
	//! clear count / valid count per pixel, NaN where valid count is 0
	CImg<float> ClearFraction(const CImg<unsigned int>& clear, const CImg<unsigned int>& valid);
	//! Per pixel fraction of clear observations among valid observations
	CImg<float> ClearFraction(const GeoMask& clear, const GeoMask& valid);

	//! Position of the smallest value, ignoring NaN (-1 if all NaN)
	int ArgMin(const TimeSeries& series);
	//! Position of the largest value, ignoring NaN (-1 if all NaN)
	int ArgMax(const TimeSeries& series);

	//! Per time step valid and clear pixel counts and percentages (of all pixels)
	class TimeStepReport {
	public:
		TimeStepReport(const GeoMask& valid, const GeoMask& clear);

		unsigned int NumRows() const { return _Times.size(); }
		const TimeAxis& Times() const { return _Times; }
		unsigned long ValidCount(unsigned int t) const { return _Valid[t]; }
		unsigned long ClearCount(unsigned int t) const { return _Clear[t]; }
		double ValidPercent(unsigned int t) const { return Percent(_Valid[t]); }
		double ClearPercent(unsigned int t) const { return Percent(_Clear[t]); }
		//! Pixels per time step (percentage denominator)
		unsigned long NumPixels() const { return _NumPixels; }

		//! CSV: time,valid_count,valid_percent,clear_count,clear_percent
		friend std::ostream& operator<<(std::ostream&, const TimeStepReport&);

	private:
		TimeAxis _Times;
		std::vector<unsigned long> _Valid;
		std::vector<unsigned long> _Clear;
		unsigned long _NumPixels;

		double Percent(unsigned long count) const { return _NumPixels == 0 ? 0.0 : 100.0 * count / _NumPixels; }
	};

} // namespace clearcube

#endif
