#include <clearcube/TimeFilter.h>
#include <clearcube/Exceptions.h>
#include <clearcube/Options.h>
#include <clearcube/Utils.h>

#include <cmath>
#include <stdexcept>

namespace clearcube {
    using std::string;
    using std::vector;

    namespace {
        void CheckThreshold(const GeoMask& mask, double tau) {
            if (std::isnan(tau) || tau < 0 || tau > 1)
                throw std::invalid_argument("good-data threshold must be in [0,1], got " + to_string(tau));
            if (mask.Spatial() && mask.Size() > 0)
                throw std::invalid_argument(mask.Description() + ": time filter needs a mask with a time axis");
        }

        TimeSelection Select(const GeoMask& mask, const vector<double>& fractions, double tau) {
            TimeSelection selection(mask.Times(), fractions, tau);
            if (Options::Verbose() > 0) {
                std::cout << "Retained " << selection.NumRetained() << " of " << selection.NumTotal()
                          << " time steps (threshold " << tau << ")" << std::endl;
            }
            if (Options::Verbose() > 1) {
                for (unsigned int t=0; t<fractions.size(); t++) {
                    std::cout << "   " << TimeString(mask.Times()[t]) << ": " << fractions[t]
                              << (selection.Keep()[t] ? "" : " dropped") << std::endl;
                }
            }
            if (selection.NumTotal() > 0 && selection.NumRetained() == 0)
                throw AllTimeStepsDroppedError(selection.NumTotal(), tau);
            return selection;
        }
    }

	TimeSelection::TimeSelection(const TimeAxis& times, const vector<double>& fractions, double threshold)
		: _Times(times), _Fractions(fractions), _Threshold(threshold) {
		if (times.size() != fractions.size())
			throw ShapeMismatchError(to_string(fractions.size()) + " fractions for " + to_string(times.size()) + " time steps");
		for (unsigned int t=0; t<fractions.size(); t++) {
			bool keep = fractions[t] >= threshold;
			_Keep.push_back(keep);
			if (keep) _Indices.push_back(t);
		}
	}

	TimeAxis TimeSelection::Times() const {
		TimeAxis times;
		for (unsigned int i=0; i<_Indices.size(); i++) times.push_back(_Times[_Indices[i]]);
		return times;
	}

	vector<unsigned long> CountTrue(const GeoMask& mask) {
		vector<unsigned long> counts(mask.Depth(), 0);
		vector<bbox> chunks = mask.Chunk();
		for (vector<bbox>::const_iterator iChunk=chunks.begin(); iChunk!=chunks.end(); iChunk++) {
			CImg<unsigned char> cmask = mask.Read(*iChunk);
			cimg_forXYZ(cmask,x,y,z) if (cmask(x,y,z)) counts[z]++;
		}
		return counts;
	}

	/*!
	 * good_fraction(t) = count_true(mask[t]) / (height x width). Returns an
	 * empty selection for a mask with no time steps.
	 */
	TimeSelection FilterTimes(const GeoMask& mask, double tau) {
		CheckThreshold(mask, tau);
		vector<double> fractions;
		if (mask.NumTimes() > 0) {
			vector<unsigned long> counts = CountTrue(mask);
			for (unsigned int t=0; t<counts.size(); t++)
				fractions.push_back(mask.Size() == 0 ? 0.0 : counts[t] / (double)mask.Size());
		}
		return Select(mask, fractions, tau);
	}

	/*!
	 * good_fraction(t) = count_true(mask[t] & valid[t]) / count_true(valid[t]).
	 * A time step with no valid pixels has a fraction of 0.
	 */
	TimeSelection FilterTimes(const GeoMask& mask, double tau, const GeoMask& valid) {
		CheckThreshold(mask, tau);
		valid.CheckShape(mask, mask.Times(), "valid mask");
		vector<double> fractions;
		if (mask.NumTimes() > 0) {
			vector<unsigned long> good = CountTrue(mask & valid);
			vector<unsigned long> total = CountTrue(valid);
			for (unsigned int t=0; t<good.size(); t++) {
				unsigned long n = total[total.size() == 1 ? 0 : t];
				fractions.push_back(n == 0 ? 0.0 : good[t] / (double)n);
			}
		}
		return Select(mask, fractions, tau);
	}

} // namespace clearcube
