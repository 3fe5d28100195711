#ifndef CLEARCUBE_QUALITYSCHEME_H
#define CLEARCUBE_QUALITYSCHEME_H

#include <string>
#include <vector>
#include <map>
#include <set>

namespace clearcube {

	//! Closed enumeration of pixel quality categories
	/*!
		Maps integer quality codes, as stored in a scene classification band,
		to labels. Labels are matched case-insensitively and an unknown label
		is an UnknownCategoryError rather than an empty selection.
	*/
	class QualityScheme {
	public:
		//! Default constructor (no categories)
		QualityScheme() {}
		//! Scheme from code to label mapping
		QualityScheme(std::string name, const std::map<int,std::string>& labels);

		//! Sentinel-2 L2A scene classification (SCL)
		static QualityScheme SceneClassification();
		//! Fmask classification
		static QualityScheme Fmask();
		//! Built-in scheme by name ("scl" or "fmask")
		static QualityScheme ByName(std::string name);

		//! Name of the scheme
		std::string Name() const { return _Name; }
		//! Number of categories
		unsigned int NumCategories() const { return _Labels.size(); }
		//! Is label part of this scheme
		bool Has(std::string label) const;
		//! Code of label
		int Code(std::string label) const;
		//! Label of code
		std::string Label(int code) const;
		//! All labels, in code order
		std::vector<std::string> Labels() const;
		//! Codes of a set of labels
		std::set<int> Codes(const std::vector<std::string>& labels) const;

		//! Add an alternate label for an existing code
		QualityScheme& AddAlias(std::string alias, int code);

	private:
		std::string _Name;
		//! code -> label
		std::map<int,std::string> _Labels;
		//! label (and aliases) -> code
		std::map<std::string,int> _Codes;
	};

} // namespace clearcube

#endif
