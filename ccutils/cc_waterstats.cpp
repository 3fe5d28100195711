/*!
 * \ingroup cc_utilities
 * \brief
 * Water extent and chlorophyll (NDCI) time series from a stack of scenes
*/

#include <iostream>
#include <fstream>
#include <clearcube/clearcube.h>

using namespace std;
using namespace clearcube;
namespace bpo = boost::program_options;

template<typename T> void WriteCSV(const T& table, string filename) {
	ofstream out(filename.c_str());
	if (!out.is_open()) throw runtime_error("unable to write " + filename);
	out << table;
	if (Options::Verbose() > 0) cout << "Wrote " << filename << endl;
}

int main (int ac, char* av[]) {
	try {
		// Begin boilerplate code ************************
		bpo::options_description localopts("Water statistics Options");
		localopts.add_options()
			("green", bpo::value<string>()->default_value("green"), "Name of green band")
			("swir", bpo::value<string>()->default_value("swir1"), "Name of shortwave infrared band")
			("red", bpo::value<string>()->default_value("red"), "Name of red band")
			("rededge", bpo::value<string>()->default_value("rededge1"), "Name of red edge band")
			("validonly", bpo::value<bool>()->default_value(false)->implicit_value(true),
				"Threshold relative to valid pixels instead of all pixels")
			("images", bpo::value<bool>()->default_value(false)->implicit_value(true), "Write MNDWI and NDCI images")
			;
		Options Opts(ac,av,localopts);
		if (Opts.Exit()) return 0;
		GDALAllRegister();
		// End boilerplate code **************************

		if (Options::Verbose() > 1) cout << Opts;

		RasterCube cube = RasterCube::Open(Opts.InputFiles(), Opts.QualityBand(), Opts.TimeKey());
		for (unsigned int b=0; b<cube.NumBands(); b++) {
			string name = cube[b].Description();
			if (Opts.NoData()) cube[b].SetNoData(Opts.NoDataValue());
			if (Opts.Scale(name) != 1.0 || Opts.Offset(name) != 0.0)
				cube[b].SetGain(Opts.Scale(name)).SetOffset(Opts.Offset(name));
		}
		if (Options::Verbose() > 0) cout << cube.Info();

		QualityScheme scheme = QualityScheme::ByName(Opts.Scheme());
		vector<string> categories = Opts.Categories();
		if (categories.empty()) {
			// bright water is often labelled snow
			if (scheme.Name() == "fmask") categories = Split("valid,water,snow", ",");
			else categories = Split("vegetation,bare soils,water,snow or ice", ",");
		}
		GeoMask quality = CategoryMask(cube.Quality(), scheme, categories);

		GeoMask region;
		bool useregion = (Opts.VectorFile() != "");
		if (useregion) region = Rasterize(GeoVector(Opts.VectorFile(), Opts.Where()), cube);

		TimeSelection selection = Opts.varmap["validonly"].as<bool>()
			? FilterTimes(quality, Opts.Threshold(), ValidityMask(cube.Quality(), 0))
			: FilterTimes(quality, Opts.Threshold());
		RasterCube clean = Clean(cube.SelectTimes(selection), quality.SelectTimes(selection.Indices()));

		GeoArray mndwi = MNDWI(clean, Opts.varmap["green"].as<string>(), Opts.varmap["swir"].as<string>());
		GeoMask water = (mndwi > 0).SetDescription("water");
		GeoArray ndci = NDCI(clean, Opts.varmap["rededge"].as<string>(), Opts.varmap["red"].as<string>()).Where(water);

		TimeSeries area = useregion ? AreaSeries(water, region) : AreaSeries(water);
		TimeSeries meanndci = useregion ? SpatialMean(ndci, region) : SpatialMean(ndci);
		TimeSeries smootharea = RollingMedian(area, Opts.Window(), Opts.MinPeriods()).SetName("water_area_smoothed");
		TimeSeries smoothndci = RollingMedian(meanndci, Opts.Window(), Opts.MinPeriods()).SetName("ndci_smoothed");

		string prefix = Opts.Prefix();
		WriteCSV(area, prefix + "water_area.csv");
		WriteCSV(smootharea, prefix + "water_area_smoothed.csv");
		WriteCSV(meanndci, prefix + "ndci.csv");
		WriteCSV(smoothndci, prefix + "ndci_smoothed.csv");

		int imin = ArgMin(meanndci);
		int imax = ArgMax(meanndci);
		if (imin >= 0) {
			cout << "Lowest average NDCI: " << meanndci[imin] << " on " << TimeString(meanndci.Times()[imin]) << endl;
			cout << "Highest average NDCI: " << meanndci[imax] << " on " << TimeString(meanndci.Times()[imax]) << endl;
		} else {
			cout << "No water pixels with valid NDCI" << endl;
		}

		if (Opts.varmap["images"].as<bool>()) {
			CImg<float> img = mndwi.Read();
			if (Options::Verbose() > 2) cimg_printstats(img, "MNDWI");
			WriteImage(img, clean, clean.Times(), prefix + "mndwi");
			img = ndci.Read();
			if (Options::Verbose() > 2) cimg_printstats(img, "NDCI");
			WriteImage(img, clean, clean.Times(), prefix + "ndci");
		}
	} catch (std::exception& e) {
		cerr << "cc_waterstats: " << e.what() << endl;
		return 1;
	}
	return 0;
}
