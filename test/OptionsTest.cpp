#include <gtest/gtest.h>

#include <clearcube/Options.h>

#include <boost/filesystem.hpp>

#include <fstream>

using namespace clearcube;
namespace bpo = boost::program_options;

namespace {
	//! Parse an argument list the way a utility would
	Options Parse(std::vector<std::string> args) {
		std::vector<char*> argv;
		args.insert(args.begin(), "cc_test");
		for (unsigned int i=0; i<args.size(); i++) argv.push_back(const_cast<char*>(args[i].c_str()));
		bpo::options_description localopts("Test Options");
		int verbose = Options::Verbose();
		Options opts(argv.size(), &argv[0], localopts);
		Options::SetVerbose(verbose);
		return opts;
	}
}

TEST(OptionsTest, Defaults) {
	Options opts = Parse(std::vector<std::string>(1, "scene.tif"));
	EXPECT_FALSE(opts.Exit());
	EXPECT_EQ("scene.tif", opts.InputFile(0));
	EXPECT_EQ("scl", opts.QualityBand());
	EXPECT_EQ("scl", opts.Scheme());
	EXPECT_EQ("ACQUISITION_DATETIME", opts.TimeKey());
	EXPECT_DOUBLE_EQ(1.0, opts.Scale("red"));
	EXPECT_DOUBLE_EQ(0.0, opts.Offset("red"));
	EXPECT_FALSE(opts.NoData());
	EXPECT_EQ(3, opts.Window());
	EXPECT_EQ(1, opts.MinPeriods());
	EXPECT_TRUE(opts.Categories().empty());
}

TEST(OptionsTest, BandOverrides) {
	std::vector<std::string> args;
	args.push_back("a.tif");
	args.push_back("b.tif");
	args.push_back("--scale=0.0001");
	args.push_back("--bandscale=B11=0.001,Red=0.5");
	args.push_back("--bandoffset=red=-0.1");
	args.push_back("--categories=vegetation, water ,snow or ice");
	args.push_back("--nodata=-9999");
	Options opts = Parse(args);
	EXPECT_EQ(2u, opts.InputFiles().size());
	EXPECT_DOUBLE_EQ(0.0001, opts.Scale("green"));
	EXPECT_DOUBLE_EQ(0.001, opts.Scale("b11"));
	EXPECT_DOUBLE_EQ(0.5, opts.Scale("RED"));
	EXPECT_DOUBLE_EQ(-0.1, opts.Offset("red"));
	ASSERT_EQ(3u, opts.Categories().size());
	EXPECT_EQ("water", opts.Categories()[1]);
	EXPECT_EQ("snow or ice", opts.Categories()[2]);
	EXPECT_TRUE(opts.NoData());
	EXPECT_DOUBLE_EQ(-9999, opts.NoDataValue());
	std::vector<std::string> bad;
	bad.push_back("a.tif");
	bad.push_back("--bandscale=red");
	EXPECT_THROW(Parse(bad), std::invalid_argument);
}

TEST(OptionsTest, CommandLineOverridesConfigFile) {
	boost::filesystem::path config = boost::filesystem::temp_directory_path()
		/ boost::filesystem::unique_path("clearcube-%%%%-%%%%.cfg");
	{
		std::ofstream out(config.string().c_str());
		out << "threshold = 0.6" << std::endl;
		out << "window = 5" << std::endl;
		out << "scheme = fmask" << std::endl;
	}
	std::vector<std::string> args;
	args.push_back("scene.tif");
	args.push_back("--config=" + config.string());
	args.push_back("--window=7");
	Options opts = Parse(args);
	boost::filesystem::remove(config);
	EXPECT_DOUBLE_EQ(0.6, opts.Threshold());
	EXPECT_EQ(7, opts.Window());
	EXPECT_EQ("fmask", opts.Scheme());
}

TEST(OptionsTest, HelpExits) {
	std::vector<std::string> args(1, "--help");
	std::streambuf* buf = std::cout.rdbuf(0);
	Options opts = Parse(args);
	std::cout.rdbuf(buf);
	std::cout.clear();
	EXPECT_TRUE(opts.Exit());
}
