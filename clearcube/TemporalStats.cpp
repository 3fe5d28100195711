#include <clearcube/TemporalStats.h>
#include <clearcube/TimeFilter.h>
#include <clearcube/Exceptions.h>
#include <clearcube/Options.h>
#include <clearcube/Utils.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace clearcube {
    using std::string;
    using std::vector;

    namespace {
        const double NaN = std::numeric_limits<double>::quiet_NaN();

        bool IsNaN(double v) { return std::isnan(v); }

        //! Median of the non-NaN values (NaN if fewer than minperiods)
        double Median(vector<double> values, int minperiods) {
            values.erase(std::remove_if(values.begin(), values.end(), IsNaN), values.end());
            if ((int)values.size() < minperiods || values.empty()) return NaN;
            std::sort(values.begin(), values.end());
            unsigned int n = values.size();
            if (n % 2 == 1) return values[n/2];
            return (values[n/2 - 1] + values[n/2]) / 2.0;
        }

        void CheckTemporal(const GeoMask& mask, string what) {
            if (mask.Spatial()) throw std::invalid_argument(what + ": mask '" + mask.Description() + "' has no time axis");
        }

        TimeSeries MaskCountSeries(const GeoMask& mask, double scale, string name) {
            CheckTemporal(mask, name);
            vector<unsigned long> counts = CountTrue(mask);
            vector<double> values;
            for (unsigned int t=0; t<mask.NumTimes(); t++) values.push_back(counts[t] * scale);
            return TimeSeries(mask.Times(), values, name);
        }

        int ArgExtreme(const TimeSeries& series, bool largest) {
            int index = -1;
            for (unsigned int i=0; i<series.Size(); i++) {
                double v = series[i];
                if (std::isnan(v)) continue;
                if (index < 0 || (largest ? v > series[index] : v < series[index])) index = i;
            }
            return index;
        }
    }

	TimeSeries::TimeSeries(const TimeAxis& times, const vector<double>& values, string name)
		: _Times(times), _Values(values), _Name(name) {
		if (times.size() != values.size())
			throw ShapeMismatchError(name + ": " + to_string(values.size()) + " values for " + to_string(times.size()) + " time steps");
	}

	std::ostream& operator<<(std::ostream& stream, const TimeSeries& series) {
		stream << "time," << (series._Name == "" ? "value" : series._Name) << std::endl;
		for (unsigned int i=0; i<series.Size(); i++)
			stream << TimeString(series._Times[i]) << "," << series._Values[i] << std::endl;
		return stream;
	}

	SpatialStats::SpatialStats(const GeoArray& array) {
		Compute(array, NULL);
	}

	SpatialStats::SpatialStats(const GeoArray& array, const GeoMask& region) {
		region.CheckShape(array, array.Times(), "region");
		Compute(array, &region);
	}

	void SpatialStats::Compute(const GeoArray& array, const GeoMask* region) {
		_Times = array.Times();
		_Name = array.Description();
		_Count.assign(array.NumTimes(), 0);
		vector<double> sums(array.NumTimes(), 0.0);
		if (array.NumTimes() > 0) {
			vector<bbox> chunks = array.Chunk();
			for (vector<bbox>::const_iterator iChunk=chunks.begin(); iChunk!=chunks.end(); iChunk++) {
				CImg<float> img = array.Read(*iChunk);
				CImg<unsigned char> cmask;
				if (region) cmask = region->Read(*iChunk);
				cimg_forXYZ(img,x,y,z) {
					if (std::isnan(img(x,y,z))) continue;
					if (region && !cmask(x, y, cmask.depth() == 1 ? 0 : z)) continue;
					_Count[z]++;
					sums[z] += img(x,y,z);
				}
			}
		}
		_Mean.clear();
		for (unsigned int t=0; t<_Count.size(); t++)
			_Mean.push_back(_Count[t] == 0 ? NaN : sums[t] / _Count[t]);
		if (Options::Verbose() > 1)
			std::cout << _Name << ": spatial statistics over " << _Times.size() << " time steps" << std::endl;
	}

	TimeSeries SpatialStats::CountSeries() const {
		return TimeSeries(_Times, vector<double>(_Count.begin(), _Count.end()), _Name + "_count");
	}

	TimeSeries SpatialStats::MeanSeries() const {
		return TimeSeries(_Times, _Mean, _Name + "_mean");
	}

	/*!
	 * Position i uses samples i-(window-1)/2 to i+(window-1)/2 that exist.
	 * Windows cut by either end of the series use the samples available.
	 */
	vector<double> RollingMedian(const vector<double>& values, int window, int minperiods) {
		if (window <= 0 || window % 2 == 0)
			throw std::invalid_argument("rolling window must be a positive odd number, got " + to_string(window));
		if (minperiods < 1 || minperiods > window)
			throw std::invalid_argument("minperiods must be in [1," + to_string(window) + "], got " + to_string(minperiods));
		int half = (window - 1) / 2;
		int n = values.size();
		vector<double> out;
		for (int i=0; i<n; i++) {
			int lo = std::max(0, i - half);
			int hi = std::min(n - 1, i + half);
			out.push_back(Median(vector<double>(values.begin() + lo, values.begin() + hi + 1), minperiods));
		}
		return out;
	}

	TimeSeries RollingMedian(const TimeSeries& series, int window, int minperiods) {
		return TimeSeries(series.Times(), RollingMedian(series.Values(), window, minperiods), series.Name());
	}

	TimeSeries SpatialMean(const GeoArray& array) {
		return SpatialStats(array).MeanSeries();
	}

	TimeSeries SpatialMean(const GeoArray& array, const GeoMask& region) {
		return SpatialStats(array, region).MeanSeries();
	}

	TimeSeries SpatialCount(const GeoMask& mask) {
		return MaskCountSeries(mask, 1.0, mask.Description() + "_count");
	}

	TimeSeries SpatialCount(const GeoMask& mask, const GeoMask& region) {
		CheckTemporal(mask, "count");
		return MaskCountSeries(mask & region, 1.0, mask.Description() + "_count");
	}

	TimeSeries AreaSeries(const GeoMask& mask) {
		return MaskCountSeries(mask, mask.PixelArea(), mask.Description() + "_area");
	}

	TimeSeries AreaSeries(const GeoMask& mask, const GeoMask& region) {
		CheckTemporal(mask, "area");
		return MaskCountSeries(mask & region, mask.PixelArea(), mask.Description() + "_area");
	}

	CImg<unsigned int> TemporalCount(const GeoMask& mask) {
		CImg<unsigned int> counts(mask.XSize(), mask.YSize(), 1, 1, 0);
		if (mask.Depth() == 0) return counts;
		vector<bbox> chunks = mask.Chunk();
		for (vector<bbox>::const_iterator iChunk=chunks.begin(); iChunk!=chunks.end(); iChunk++) {
			CImg<unsigned char> cmask = mask.Read(*iChunk);
			int x0 = iChunk->min_corner().x();
			int y0 = iChunk->min_corner().y();
			cimg_forXYZ(cmask,x,y,z) if (cmask(x,y,z)) counts(x0+x, y0+y)++;
		}
		return counts;
	}

	CImg<float> ClearFraction(const CImg<unsigned int>& clear, const CImg<unsigned int>& valid) {
		if (clear.width() != valid.width() || clear.height() != valid.height()) {
			throw ShapeMismatchError("clear counts " + to_string(clear.width()) + "x" + to_string(clear.height())
				+ ", valid counts " + to_string(valid.width()) + "x" + to_string(valid.height()));
		}
		CImg<float> fraction(valid.width(), valid.height(), 1, 1, 0.0f);
		cimg_forXY(fraction,x,y) {
			if (valid(x,y) == 0) fraction(x,y) = std::numeric_limits<float>::quiet_NaN();
			else fraction(x,y) = (float)clear(x,y) / valid(x,y);
		}
		return fraction;
	}

	CImg<float> ClearFraction(const GeoMask& clear, const GeoMask& valid) {
		clear.CheckShape(valid, valid.Times(), "clear fraction");
		return ClearFraction(TemporalCount(clear), TemporalCount(valid));
	}

	int ArgMin(const TimeSeries& series) {
		return ArgExtreme(series, false);
	}

	int ArgMax(const TimeSeries& series) {
		return ArgExtreme(series, true);
	}

	TimeStepReport::TimeStepReport(const GeoMask& valid, const GeoMask& clear)
		: _Times(valid.Times()), _NumPixels(valid.Size()) {
		CheckTemporal(valid, "report");
		CheckTemporal(clear, "report");
		clear.CheckShape(valid, valid.Times(), "report");
		_Valid = CountTrue(valid);
		_Clear = CountTrue(clear);
	}

	std::ostream& operator<<(std::ostream& stream, const TimeStepReport& report) {
		stream << "time,valid_count,valid_percent,clear_count,clear_percent" << std::endl;
		for (unsigned int t=0; t<report.NumRows(); t++) {
			stream << TimeString(report._Times[t]) << "," << report.ValidCount(t) << "," << report.ValidPercent(t)
			       << "," << report.ClearCount(t) << "," << report.ClearPercent(t) << std::endl;
		}
		return stream;
	}

} // namespace clearcube
