#pragma once
#include <cstring>

namespace RpgArchive
{

// Simple helper class for retireving command line arguments.
// Warning! argv must live longer, than "ProgramArguments" class.
class ProgramArguments final
{
public:
	ProgramArguments( int argc, const char* const* argv );
	~ProgramArguments();

	// Params names should start with "--" in command line, but here, "--" not needed.
	bool HasParam( const char* param_name ) const;

	// Returns nullptr, if there is no such param, or param has no value.
	const char* GetParamValue( const char* param_name ) const;
	const char* GetParamValue( const char* param_name, const char* default_value ) const;

	template<typename Func>
	void EnumerateAllParamValues( const char* param_name, const Func& func ) const
	{
		for( unsigned int i= 0u; i + 1u < argc_; i++ )
		{
			if( IsParam( argv_[i], param_name ) )
				func( argv_[ i + 1u ] );
		}
	}

private:
	static bool IsParam( const char* arg, const char* param_name );

private:
	const unsigned int argc_;
	const char* const* const argv_;
};

} // namespace RpgArchive
