/*!
 * \ingroup cc_utilities
 * \brief
 * Valid and clear observation statistics of a stack of scenes
*/

#include <iostream>
#include <fstream>
#include <clearcube/clearcube.h>

using namespace std;
using namespace clearcube;
namespace bpo = boost::program_options;

int main (int ac, char* av[]) {
	try {
		// Begin boilerplate code ************************
		bpo::options_description localopts("Cloud statistics Options");
		localopts.add_options()
			("bands", bpo::value<string>(), "Bands that must be valid (default all)")
			;
		Options Opts(ac,av,localopts);
		if (Opts.Exit()) return 0;
		GDALAllRegister();
		// End boilerplate code **************************

		if (Options::Verbose() > 1) cout << Opts;

		RasterCube cube = RasterCube::Open(Opts.InputFiles(), Opts.QualityBand(), Opts.TimeKey());
		if (Opts.NoData()) {
			for (unsigned int b=0; b<cube.NumBands(); b++) cube[b].SetNoData(Opts.NoDataValue());
		}
		if (Options::Verbose() > 0) cout << cube.Info();

		vector<string> bands = Opts.varmap.count("bands") ? Split(Opts.varmap["bands"].as<string>(), ",") : cube.BandNames();
		if (bands.empty()) throw runtime_error("no bands to assess");

		// A pixel is valid when every band holds an observation
		map<string,GeoMask> validity = ValidityMasks(cube);
		GeoMask valid = validity[cube[bands[0]].Description()];
		for (unsigned int b=1; b<bands.size(); b++) valid = valid & validity[cube[bands[b]].Description()];

		QualityScheme scheme = QualityScheme::ByName(Opts.Scheme());
		vector<string> categories = Opts.Categories();
		if (categories.empty()) {
			if (scheme.Name() == "fmask") categories = Split("valid,water,snow", ",");
			else categories = Split("vegetation,bare soils,water,snow or ice,dark area pixels,unclassified", ",");
		}
		GeoMask clear = valid & CategoryMask(cube.Quality(), scheme, categories);

		if (Opts.VectorFile() != "") {
			GeoMask region = Rasterize(GeoVector(Opts.VectorFile(), Opts.Where()), cube);
			valid = valid & region;
			clear = clear & region;
		}

		TimeStepReport report(valid, clear);
		string prefix = Opts.Prefix();
		string filename = prefix + "timesteps.csv";
		ofstream out(filename.c_str());
		if (!out.is_open()) throw runtime_error("unable to write " + filename);
		out << report;
		if (Options::Verbose() > 1) cout << report;

		// Per pixel counts and clear fraction
		CImg<unsigned int> validcount = TemporalCount(valid);
		CImg<unsigned int> clearcount = TemporalCount(clear);
		CImg<float> fraction = ClearFraction(clearcount, validcount);
		if (Options::Verbose() > 2) cimg_printstats(fraction, "Clear fraction");
		CImg<float> stack(cube.XSize(), cube.YSize(), 3, 1, 0.0f);
		cimg_forXY(stack,x,y) {
			stack(x,y,0) = validcount(x,y);
			stack(x,y,1) = clearcount(x,y);
			stack(x,y,2) = fraction(x,y);
		}
		vector<string> descriptions = Split("valid_count,clear_count,clear_fraction", ",");
		WriteImage(stack, cube, descriptions, prefix + "clearstats");
	} catch (std::exception& e) {
		cerr << "cc_cloudstats: " << e.what() << endl;
		return 1;
	}
	return 0;
}
