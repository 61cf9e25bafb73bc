#include <cctype>

#include "str.hpp"

namespace RpgArchive
{

bool StartsWith( const std::string& str, const std::string& prefix )
{
	return str.size() >= prefix.size() && str.compare( 0u, prefix.size(), prefix ) == 0;
}

bool EndsWith( const std::string& str, const std::string& suffix )
{
	return str.size() >= suffix.size() && str.compare( str.size() - suffix.size(), suffix.size(), suffix ) == 0;
}

std::string ToUpper( const std::string& s )
{
	std::string r= s;
	for( char& c : r )
		c= static_cast<char>( std::toupper( static_cast<unsigned char>(c) ) );
	return r;
}

std::string ToLower( const std::string& s )
{
	std::string r= s;
	for( char& c : r )
		c= static_cast<char>( std::tolower( static_cast<unsigned char>(c) ) );
	return r;
}

std::string CutAtNull( const char* const data, const unsigned int max_length )
{
	unsigned int length= 0u;
	while( length < max_length && data[length] != '\0' )
		length++;

	return std::string( data, length );
}

} // namespace RpgArchive
