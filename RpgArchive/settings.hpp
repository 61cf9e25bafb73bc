#pragma once
#include <functional>
#include <map>
#include <string>

namespace RpgArchive
{

// Key-value settings, stored in text file as pairs of (optionally quoted) strings.
// File is read in constructor and written back in destructor, if something was changed.
class Settings final
{
public:
	explicit Settings( const char* file_name );
	~Settings();

	void SetSetting( const char* name, const char* value );
	void SetSetting( const char* name, int value );
	void SetSetting( const char* name, bool value );

	bool IsValue( const char* name ) const;

	// Simple getters. Get setting value, or default value, if settings does not exist.
	const char* GetString( const char* name, const char* default_value= "" ) const;
	int GetInt( const char* name, int default_value= 0 ) const;
	bool GetBool( const char* name, bool default_value= false ) const;

	// Get value, if it exist, or set settings value to default and return default.
	// If settings value can not be converted to number( for number methods ) it sets to default value.
	const char* GetOrSetString( const char* name, const char* default_value= "" );
	int GetOrSetInt( const char* name, int default_value= 0 );
	bool GetOrSetBool( const char* name, bool default_value= false );

	// Writes settings file immediately. Returns false on write error.
	bool Save();

private:
	Settings( const Settings& )= delete;
	Settings& operator=( const Settings& )= delete;

	void Parse( const std::string& text );

private:
	// Transparent comparator allows search by "const char*" without temporary strings.
	typedef std::map< std::string, std::string, std::less<> > MapType;

private:
	MapType map_;
	const std::string file_name_;
	bool modified_= false;
};

} // namespace RpgArchive
