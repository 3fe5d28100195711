#include <clearcube/QualityScheme.h>
#include <clearcube/Exceptions.h>
#include <clearcube/Utils.h>

#include <boost/algorithm/string.hpp>

#include <stdexcept>

namespace clearcube {
    using std::string;
    using std::vector;
    using std::map;

    namespace {
        string Normalize(string label) {
            boost::algorithm::trim(label);
            boost::algorithm::to_lower(label);
            boost::algorithm::replace_all(label, "_", " ");
            return label;
        }
    }

	QualityScheme::QualityScheme(string name, const map<int,string>& labels)
		: _Name(name) {
		for (map<int,string>::const_iterator it=labels.begin(); it!=labels.end(); it++) {
			string label = Normalize(it->second);
			if (_Codes.count(label))
				throw std::invalid_argument(name + ": duplicate quality label '" + label + "'");
			_Labels[it->first] = label;
			_Codes[label] = it->first;
		}
	}

	QualityScheme QualityScheme::SceneClassification() {
		map<int,string> labels;
		labels[0] = "no data";
		labels[1] = "saturated or defective";
		labels[2] = "dark area pixels";
		labels[3] = "cloud shadows";
		labels[4] = "vegetation";
		labels[5] = "bare soils";
		labels[6] = "water";
		labels[7] = "unclassified";
		labels[8] = "cloud medium probability";
		labels[9] = "cloud high probability";
		labels[10] = "thin cirrus";
		labels[11] = "snow or ice";
		QualityScheme scheme("scl", labels);
		// older processing baselines label code 7 as low probability cloud
		scheme.AddAlias("cloud low probability", 7);
		return scheme;
	}

	QualityScheme QualityScheme::Fmask() {
		map<int,string> labels;
		labels[0] = "nodata";
		labels[1] = "valid";
		labels[2] = "cloud";
		labels[3] = "shadow";
		labels[4] = "snow";
		labels[5] = "water";
		return QualityScheme("fmask", labels);
	}

	QualityScheme QualityScheme::ByName(string name) {
		boost::algorithm::to_lower(name);
		if (name == "scl") return SceneClassification();
		if (name == "fmask") return Fmask();
		throw std::invalid_argument("unknown quality scheme '" + name + "' (expected scl or fmask)");
	}

	bool QualityScheme::Has(string label) const {
		return _Codes.count(Normalize(label)) > 0;
	}

	int QualityScheme::Code(string label) const {
		map<string,int>::const_iterator it = _Codes.find(Normalize(label));
		if (it == _Codes.end()) throw UnknownCategoryError(label, _Name);
		return it->second;
	}

	string QualityScheme::Label(int code) const {
		map<int,string>::const_iterator it = _Labels.find(code);
		if (it == _Labels.end()) throw std::out_of_range(_Name + ": no category with code " + to_string(code));
		return it->second;
	}

	vector<string> QualityScheme::Labels() const {
		vector<string> labels;
		for (map<int,string>::const_iterator it=_Labels.begin(); it!=_Labels.end(); it++) labels.push_back(it->second);
		return labels;
	}

	std::set<int> QualityScheme::Codes(const vector<string>& labels) const {
		std::set<int> codes;
		for (vector<string>::const_iterator it=labels.begin(); it!=labels.end(); it++) codes.insert(Code(*it));
		return codes;
	}

	QualityScheme& QualityScheme::AddAlias(string alias, int code) {
		if (!_Labels.count(code)) throw std::out_of_range(_Name + ": no category with code " + to_string(code));
		alias = Normalize(alias);
		if (_Codes.count(alias) && _Codes[alias] != code)
			throw std::invalid_argument(_Name + ": label '" + alias + "' already used");
		_Codes[alias] = code;
		return *this;
	}

} // namespace clearcube
