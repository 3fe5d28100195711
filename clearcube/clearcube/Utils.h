#ifndef CLEARCUBE_UTILS_H
#define CLEARCUBE_UTILS_H

#include <string>
#include <vector>
#include <sstream>

#include <boost/algorithm/string.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace clearcube {

    //! Convert anything streamable to a string
    template<typename T> inline std::string to_string(const T& t) {
        std::stringstream ss;
        ss << t;
        return ss.str();
    }

    //! Split string on any of the delimiter characters, dropping empty tokens
    inline std::vector<std::string> Split(std::string str, std::string delim=" ,") {
        std::vector<std::string> tokens;
        boost::algorithm::split(tokens, str, boost::algorithm::is_any_of(delim), boost::algorithm::token_compress_on);
        std::vector<std::string> out;
        for (std::vector<std::string>::const_iterator it=tokens.begin(); it!=tokens.end(); it++) {
            std::string tok = boost::algorithm::trim_copy(*it);
            if (!tok.empty()) out.push_back(tok);
        }
        return out;
    }

    //! Parse "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS[Z]" or TIFF style "YYYY:MM:DD HH:MM:SS"
    inline boost::posix_time::ptime ParseTime(std::string str) {
        boost::algorithm::trim(str);
        if (!str.empty() && (str[str.size()-1] == 'Z')) str.erase(str.size()-1);
        if (str.size() >= 10 && str[4] == ':' && str[7] == ':') {
            str[4] = '-';
            str[7] = '-';
        }
        if (str.size() > 10 && str[10] == 'T') str[10] = ' ';
        if (str.size() == 10) str += " 00:00:00";
        return boost::posix_time::time_from_string(str);
    }

    //! ISO 8601 representation of a timestamp
    inline std::string TimeString(const boost::posix_time::ptime& t) {
        return boost::posix_time::to_iso_extended_string(t);
    }

} // namespace clearcube

#endif
