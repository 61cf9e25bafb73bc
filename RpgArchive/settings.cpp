#include <cctype>
#include <cstring>

#include "common/files.hpp"
#include "log.hpp"

#include "settings.hpp"

namespace RpgArchive
{

static bool StrToInt( const char* str, int* i )
{
	int sign = 1;
	if( str[0] == '-' )
	{
		sign = -1;
		str++;
	}

	if( *str == '\0' )
		return false;

	int v = 0;
	while( *str != 0 )
	{
		if( str[0] < '0' || str[0] > '9' )
			return false;
		v*= 10;
		v+= str[0] - '0';
		str++;
	}
	*i= v * sign;
	return true;
}

static std::string MakeQuotedString( const std::string& str )
{
	std::string result;
	result.reserve( str.size() + 3u );
	result+= "\"";

	for( const char c : str )
	{
		if( c == '"' || c == '\\' )
			result+= '\\';
		result+= c;
	}

	result += "\"";
	return result;
}

Settings::Settings( const char* const file_name )
	: file_name_(file_name)
{
	std::vector<unsigned char> file_data;
	if( !ReadWholeFile( file_name_, file_data ) )
	{
		Log::Info( "Can not read settings file \"", file_name_, "\", using defaults" );
		return;
	}

	Parse( std::string( file_data.begin(), file_data.end() ) );
}

Settings::~Settings()
{
	if( modified_ )
		Save();
}

void Settings::Parse( const std::string& text )
{
	const char* s= text.c_str();
	while( *s != '\0' )
	{
		std::string str[2]; // key-value pair

		for( unsigned int i= 0u; i < 2u; i++ )
		{
			while( std::isspace( static_cast<unsigned char>(*s) ) && *s != '\0' ) s++;
			if( *s == '\0' ) break;

			if( *s == '"' ) // string in quotes
			{
				s++;
				while( *s != '\0' && *s != '"' )
				{
					if( *s == '\\' && ( s[1] == '"' || s[1] == '\\' ) ) s++; // Escaped symbol
					str[i].push_back( *s );
					s++;
				}
				if( *s == '"' )
					s++;
				else
					break;
			}
			else
			{
				while( *s != '\0' && !std::isspace( static_cast<unsigned char>(*s) ) )
				{
					str[i].push_back( *s );
					s++;
				}
			}
		}

		if( ! str[0].empty() )
			map_[ str[0] ]= str[1];
	}
}

bool Settings::Save()
{
	std::string text;
	for( const MapType::value_type& map_value : map_ )
	{
		text+= MakeQuotedString( map_value.first );
		text+= " ";
		text+= MakeQuotedString( map_value.second );
		text+= "\n";
	}

	if( !WriteWholeFile( file_name_, std::vector<unsigned char>( text.begin(), text.end() ) ) )
	{
		Log::Warning( "Can not write settings file \"", file_name_, "\"" );
		return false;
	}

	modified_= false;
	return true;
}

void Settings::SetSetting( const char* const name, const char* const value )
{
	const auto it= map_.find( name );
	if( it != map_.end() && it->second == value )
		return;

	map_[ name ]= value;
	modified_= true;
}

void Settings::SetSetting( const char* const name, const int value )
{
	SetSetting( name, std::to_string(value).c_str() );
}

void Settings::SetSetting( const char* const name, const bool value )
{
	SetSetting( name, value ? 1 : 0 );
}

bool Settings::IsValue( const char* const name ) const
{
	return map_.find( name ) != map_.cend();
}

const char* Settings::GetString( const char* const name, const char* const default_value ) const
{
	const auto it= map_.find( name );
	if ( it == map_.cend() )
		return default_value;

	return it->second.c_str();
}

int Settings::GetInt( const char* const name, const int default_value ) const
{
	const auto it= map_.find( name );
	if( it == map_.cend() )
		return default_value;

	int val;
	if( StrToInt( it->second.c_str(), &val ) )
		return val;
	return default_value;
}

bool Settings::GetBool( const char* const name, const bool default_value ) const
{
	return GetInt( name, default_value ? 1 : 0 ) != 0;
}

const char* Settings::GetOrSetString( const char* const name, const char* const default_value )
{
	const auto it = map_.find( name );
	if ( it == map_.cend() )
	{
		SetSetting( name, default_value );
		return default_value;
	}

	return it->second.c_str();
}

int Settings::GetOrSetInt( const char* const name, const int default_value )
{
	const auto it= map_.find( name );
	if ( it != map_.cend() )
	{
		int val;
		if( StrToInt( it->second.c_str(), &val ) )
			return val;
	}

	SetSetting( name, default_value );
	return default_value;
}

bool Settings::GetOrSetBool( const char* const name, const bool default_value )
{
	return GetOrSetInt( name, default_value ? 1 : 0 ) != 0;
}

} // namespace RpgArchive
