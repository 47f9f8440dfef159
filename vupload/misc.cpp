#include <algorithm>
#include <cctype>

#include "misc.hpp"

using namespace std;

namespace vupload
{

string trim(const string& str)
{
	size_t first = 0;
	size_t last  = str.size();
	while (first < last && isspace(static_cast<unsigned char>(str[first])))
		++first;
	while (last > first && isspace(static_cast<unsigned char>(str[last - 1])))
		--last;
	return str.substr(first, last - first);
}

string to_lower(string str)
{
	transform(str.begin(), str.end(), str.begin(),
		[](unsigned char c) { return static_cast<char>(tolower(c)); });
	return str;
}

} // namespace vupload
